#include <string>

#include "MessageBuilder.hpp"
#include "TestSupport.hpp"

using namespace courier::core;
using namespace courier::models;

static bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

int main() {
    // Helpers
    COURIER_CHECK(EscapeHtml("<b>a & \"b\"</b>") == "&lt;b&gt;a &amp; &quot;b&quot;&lt;/b&gt;");
    COURIER_CHECK(FormatSize(0) == "0 B");
    COURIER_CHECK(FormatSize(512) == "512 B");
    COURIER_CHECK(FormatSize(1536) == "1.50 KB");
    COURIER_CHECK(FormatSize(5'000'000'000ULL) == "4.66 GB");
    COURIER_CHECK(FormatDuration(std::chrono::seconds(4)) == "4s");
    COURIER_CHECK(FormatDuration(std::chrono::seconds(125)) == "2m 05s");
    COURIER_CHECK(FormatDuration(std::chrono::seconds(3723)) == "1h 02m 03s");

    PendingDownload entry;
    entry.announcement.token = "7:9";
    entry.announcement.size = 2048;
    entry.destination = "/data/<odd>.bin";
    entry.created_at = std::chrono::system_clock::now();

    // Keyboard carries the token in both buttons.
    auto keyboard = MessageBuilder::ConfirmationKeyboard("7:9");
    COURIER_CHECK(keyboard.size() == 1 && keyboard[0].size() == 2);
    COURIER_CHECK(keyboard[0][0].text == "Yes" && keyboard[0][0].callback_data == "yes:7:9");
    COURIER_CHECK(keyboard[0][1].text == "No" && keyboard[0][1].callback_data == "no:7:9");

    auto prompt = MessageBuilder::ConfirmationPrompt(entry);
    COURIER_CHECK(Contains(prompt, "Are you sure you want to download the file?"));
    COURIER_CHECK(Contains(prompt, "&lt;odd&gt;.bin"));
    COURIER_CHECK(Contains(prompt, "2.00 KB"));

    COURIER_CHECK(Contains(MessageBuilder::Downloading(entry, 0, 2048), "Downloading… 0%"));
    COURIER_CHECK(Contains(MessageBuilder::Downloading(entry, 1024, 2048), "Downloading… 50%"));
    COURIER_CHECK(Contains(MessageBuilder::Downloading(entry, 4096, 2048), "Downloading… 100%"));
    COURIER_CHECK(!Contains(MessageBuilder::Downloading(entry, 10, 0), "%"));

    COURIER_CHECK(Contains(MessageBuilder::Declined(entry), "Declined"));
    COURIER_CHECK(Contains(MessageBuilder::Expired(entry), "Expired"));
    COURIER_CHECK(Contains(MessageBuilder::Queued(entry), "Queued"));
    COURIER_CHECK(Contains(MessageBuilder::Cancelled(entry), "Download cancelled."));

    auto failed = MessageBuilder::Failed(entry, "network <reset>");
    COURIER_CHECK(Contains(failed, "Error downloading file."));
    COURIER_CHECK(Contains(failed, "network &lt;reset&gt;"));

    entry.started_at = entry.created_at;
    auto done = MessageBuilder::Completed(entry, "/data/out.bin", entry.created_at + std::chrono::seconds(65));
    COURIER_CHECK(Contains(done, "File downloaded successfully."));
    COURIER_CHECK(Contains(done, "/data/out.bin"));
    COURIER_CHECK(Contains(done, "1m 05s"));

    COURIER_CHECK(Contains(MessageBuilder::PromptClosed(entry, OutcomeKind::Success), "Downloaded"));
    COURIER_CHECK(Contains(MessageBuilder::PromptClosed(entry, OutcomeKind::Failed), "Failed"));
    COURIER_CHECK(Contains(MessageBuilder::PromptClosed(entry, OutcomeKind::Cancelled), "Cancelled"));

    // Status list
    const auto now = std::chrono::system_clock::now();
    COURIER_CHECK(MessageBuilder::StatusList({}, now) == "No files are being downloaded at the moment.");
    entry.status = Status::InProgress;
    entry.bytes_transferred = 1024;
    auto status = MessageBuilder::StatusList({entry}, now);
    COURIER_CHECK(Contains(status, "downloading"));
    COURIER_CHECK(Contains(status, "1.00 KB"));

    // Commands
    COURIER_CHECK(Contains(MessageBuilder::Start("Ann <3", 5), "tg://user?id=5"));
    COURIER_CHECK(Contains(MessageBuilder::Start("Ann <3", 5), "Ann &lt;3"));
    auto help = MessageBuilder::Help("/srv/downloads");
    for (const auto& [command, description] : BOT_COMMANDS) {
        COURIER_CHECK(Contains(help, std::string(command)));
    }
    COURIER_CHECK(Contains(help, "/srv/downloads"));
    auto info = MessageBuilder::Info(11, -22);
    COURIER_CHECK(Contains(info, "11") && Contains(info, "-22"));
    const std::uint64_t gb = 1024ULL * 1024 * 1024;
    auto storage = MessageBuilder::Storage("/srv", 100 * gb, 40 * gb);
    COURIER_CHECK(Contains(storage, "100 GB") && Contains(storage, "60 GB") && Contains(storage, "40 GB"));
    COURIER_CHECK(MessageBuilder::DefaultReply() == "Send me a file and I'll download it for you. /help");
    return 0;
}
