#include "MessageBuilder.hpp"

#include <spdlog/fmt/chrono.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <ctime>
#include <utility>

namespace courier::models {

namespace {

constexpr std::uint64_t GIGABYTE = 1024ULL * 1024ULL * 1024ULL;

std::string format_time(std::chrono::system_clock::time_point tp) {
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(tp)));
}

std::string name_of(const core::PendingDownload& entry) {
    return EscapeHtml(entry.destination.filename().string());
}

}  // namespace

std::string EscapeHtml(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

std::string FormatSize(std::uint64_t bytes) {
    static constexpr std::array<std::string_view, 5> UNITS{"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < UNITS.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", value, UNITS[unit]);
}

std::string FormatDuration(std::chrono::seconds duration) {
    auto total = duration.count();
    if (total < 0) total = 0;
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;

    if (hours > 0) {
        return fmt::format("{}h {:02}m {:02}s", hours, minutes, seconds);
    }
    if (minutes > 0) {
        return fmt::format("{}m {:02}s", minutes, seconds);
    }
    return fmt::format("{}s", seconds);
}

core::InlineKeyboard MessageBuilder::ConfirmationKeyboard(const core::Token& token) {
    return {{
        core::InlineButton{"Yes", std::string(YES_PREFIX) + token},
        core::InlineButton{"No", std::string(NO_PREFIX) + token},
    }};
}

std::string MessageBuilder::file_details(const core::PendingDownload& entry) {
    return fmt::format(
        "📄 <b>File name:</b>   <code>{}</code>\n"
        "💾 <b>File size:</b>   <code>{}</code>",
        name_of(entry), FormatSize(entry.announcement.size));
}

std::string MessageBuilder::ConfirmationPrompt(const core::PendingDownload& entry) {
    return "Are you sure you want to download the file?\n\n" + file_details(entry);
}

std::string MessageBuilder::Downloading(const core::PendingDownload& entry, std::uint64_t transferred,
                                        std::uint64_t total) {
    if (total == 0) {
        return fmt::format("⬇️ Downloading…\n\n{}\n📥 <b>Received:</b>   <code>{}</code>",
                           file_details(entry), FormatSize(transferred));
    }
    const auto percent = static_cast<unsigned>(std::min<std::uint64_t>(100, transferred * 100 / total));
    return fmt::format("⬇️ Downloading… {}%\n\n{}\n📥 <b>Received:</b>   <code>{}</code>", percent,
                       file_details(entry), FormatSize(transferred));
}

std::string MessageBuilder::Queued(const core::PendingDownload& entry) {
    return "⏳ Queued. The download starts as soon as a slot is free.\n\n" + file_details(entry);
}

std::string MessageBuilder::Declined(const core::PendingDownload& entry) {
    return "🚫 Declined\n\n" + file_details(entry);
}

std::string MessageBuilder::Expired(const core::PendingDownload& entry) {
    return "⌛ Expired. No confirmation was given in time.\n\n" + file_details(entry);
}

std::string MessageBuilder::Completed(const core::PendingDownload& entry,
                                      const std::filesystem::path& final_path,
                                      std::chrono::system_clock::time_point finished_at) {
    const auto started = entry.started_at.value_or(entry.created_at);
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(finished_at - started);

    return fmt::format(
        "✅ File downloaded successfully.\n\n"
        "📄 <b>File name:</b>   <code>{}</code>\n"
        "📂 <b>File path:</b>   <code>{}</code>\n"
        "💾 <b>File size:</b>   <code>{}</code>\n"
        "⏱ <b>Duration:</b>   <code>{}</code>",
        EscapeHtml(final_path.filename().string()), EscapeHtml(final_path.string()),
        FormatSize(entry.announcement.size), FormatDuration(elapsed));
}

std::string MessageBuilder::Failed(const core::PendingDownload& entry, std::string_view reason) {
    return fmt::format("⛔ Error downloading file.\n\n{}\n\nError: <pre>{}</pre>", file_details(entry),
                       EscapeHtml(reason));
}

std::string MessageBuilder::Cancelled(const core::PendingDownload& entry) {
    return "✖️ Download cancelled.\n\n" + file_details(entry);
}

std::string MessageBuilder::PromptClosed(const core::PendingDownload& entry, core::OutcomeKind outcome) {
    switch (outcome) {
        case core::OutcomeKind::Success:
            return "✅ Downloaded\n\n" + file_details(entry);
        case core::OutcomeKind::Failed:
            return "⛔ Failed\n\n" + file_details(entry);
        case core::OutcomeKind::Cancelled:
            return "✖️ Cancelled\n\n" + file_details(entry);
    }
    return file_details(entry);
}

std::string MessageBuilder::StatusList(const std::vector<core::PendingDownload>& entries,
                                       std::chrono::system_clock::time_point now) {
    if (entries.empty()) {
        return "No files are being downloaded at the moment.";
    }

    std::string out = "<b>Downloading files status:</b>\n";
    for (const auto& entry : entries) {
        out += "\n" + file_details(entry) + "\n";
        out += fmt::format("🔖 <b>State:</b>   <code>{}</code>\n", core::ToString(entry.status));

        if (entry.started_at) {
            const auto elapsed =
                std::chrono::duration_cast<std::chrono::seconds>(now - *entry.started_at);
            out += fmt::format("⏰ <b>Start time:</b>   <code>{}</code>\n", format_time(*entry.started_at));
            out += fmt::format("⏱ <b>Duration:</b>   <code>{}</code>\n", FormatDuration(elapsed));
            out += fmt::format("📥 <b>Received:</b>   <code>{}</code>\n",
                               FormatSize(entry.bytes_transferred));
        } else {
            out += fmt::format("⏰ <b>Announced:</b>   <code>{}</code>\n", format_time(entry.created_at));
        }
    }
    return out;
}

std::string MessageBuilder::Start(std::string_view user_name, std::int64_t user_id) {
    return fmt::format(
        "Hi <a href=\"tg://user?id={}\">{}</a>! I'm a bot that can download files for you. "
        "Send me a file and I'll download it for you.\n\n"
        "Use /help to see available commands.",
        user_id, EscapeHtml(user_name));
}

std::string MessageBuilder::Help(const std::filesystem::path& download_dir) {
    std::string out = "The following commands are available:\n";
    for (const auto& [command, description] : BOT_COMMANDS) {
        out += fmt::format("{} - {}\n", command, description);
    }
    out += fmt::format("\nSend me a file and I'll download it to <code>{}</code>.",
                       EscapeHtml(download_dir.string()));
    return out;
}

std::string MessageBuilder::Info(std::int64_t user_id, std::int64_t chat_id) {
    return fmt::format("<b>User ID</b>: <code>{}</code>\n<b>Chat ID</b>: <code>{}</code>", user_id,
                       chat_id);
}

std::string MessageBuilder::Storage(const std::filesystem::path& dir, std::uint64_t capacity,
                                    std::uint64_t available) {
    const std::uint64_t used = capacity - std::min(capacity, available);
    return fmt::format(
        "📂 <b>Folder</b>:   <code>{}</code>\n"
        "🟣 <b>Total Space</b>:   <code>{} GB</code>\n"
        "🟠 <b>Used Space</b>:   <code>{} GB</code>\n"
        "🟢 <b>Free Space</b>:   <code>{} GB</code>",
        EscapeHtml(dir.string()), capacity / GIGABYTE, used / GIGABYTE, available / GIGABYTE);
}

std::string MessageBuilder::DefaultReply() { return "Send me a file and I'll download it for you. /help"; }

}  // namespace courier::models
