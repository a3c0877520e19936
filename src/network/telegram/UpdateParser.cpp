#include "UpdateParser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>

#include "MessageBuilder.hpp"

namespace courier::network {

namespace {

// --- Helpers ---

const json::object* object_at(const json::object& o, std::string_view key) {
    const auto* v = o.if_contains(key);
    return (v != nullptr && v->is_object()) ? &v->as_object() : nullptr;
}

std::optional<std::int64_t> int_at(const json::object& o, std::string_view key) {
    const auto* v = o.if_contains(key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (v->is_int64()) {
        return v->as_int64();
    }
    if (v->is_uint64()) {
        return static_cast<std::int64_t>(v->as_uint64());
    }
    return std::nullopt;
}

std::string string_at(const json::object& o, std::string_view key) {
    const auto* v = o.if_contains(key);
    return (v != nullptr && v->is_string()) ? std::string(v->as_string()) : std::string{};
}

std::string display_name(const json::object& from) {
    std::string name = string_at(from, "first_name");
    const std::string last = string_at(from, "last_name");
    if (!last.empty()) {
        name += name.empty() ? last : " " + last;
    }
    if (name.empty()) {
        name = string_at(from, "username");
    }
    return name;
}

std::optional<core::InboundEvent> parse_file(const json::object& file, std::string_view kind,
                                             std::int64_t sender, std::int64_t chat, std::int64_t mid) {
    core::FileAnnouncement a;
    a.token = core::MakeToken(chat, mid);
    a.sender_id = sender;
    a.chat_id = chat;
    a.message_id = mid;
    a.filename = string_at(file, "file_name");
    a.size = static_cast<std::uint64_t>(std::max<std::int64_t>(0, int_at(file, "file_size").value_or(0)));
    a.handle.file_id = string_at(file, "file_id");
    a.handle.file_unique_id = string_at(file, "file_unique_id");

    if (a.handle.file_id.empty()) {
        return std::nullopt;
    }

    // Videos and audio sent as media often carry no name.
    if (a.filename.empty() && kind == "video") {
        a.filename = "video_" + std::to_string(mid) + ".mp4";
    } else if (a.filename.empty() && kind == "audio") {
        a.filename = "audio_" + std::to_string(mid);
    }
    return a;
}

core::CommandMessage parse_command(std::string_view text, const json::object& from, std::int64_t sender,
                                   std::int64_t chat, std::int64_t mid) {
    core::CommandMessage cmd;
    cmd.sender_id = sender;
    cmd.chat_id = chat;
    cmd.message_id = mid;
    cmd.sender_name = display_name(from);

    auto end = text.find_first_of(" \t\n");
    std::string_view head = text.substr(1, end == std::string_view::npos ? std::string_view::npos : end - 1);
    if (auto at = head.find('@'); at != std::string_view::npos) {
        head = head.substr(0, at);
    }
    cmd.command.assign(head);
    std::transform(cmd.command.begin(), cmd.command.end(), cmd.command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (end != std::string_view::npos) {
        auto rest = text.substr(end);
        auto first = rest.find_first_not_of(" \t\n");
        if (first != std::string_view::npos) {
            cmd.args.assign(rest.substr(first));
        }
    }
    return cmd;
}

std::optional<core::InboundEvent> parse_message(const json::object& msg) {
    const auto* from = object_at(msg, "from");
    const auto* chat = object_at(msg, "chat");
    auto mid = int_at(msg, "message_id");
    if (from == nullptr || chat == nullptr || !mid) {
        return std::nullopt;
    }
    auto sender = int_at(*from, "id");
    auto chat_id = int_at(*chat, "id");
    if (!sender || !chat_id) {
        return std::nullopt;
    }

    static constexpr std::array<std::string_view, 3> FILE_KINDS{"document", "video", "audio"};
    for (auto kind : FILE_KINDS) {
        if (const auto* file = object_at(msg, kind)) {
            return parse_file(*file, kind, *sender, *chat_id, *mid);
        }
    }

    const std::string text = string_at(msg, "text");
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.front() == '/' && text.size() > 1) {
        return parse_command(text, *from, *sender, *chat_id, *mid);
    }
    return core::TextMessage{*sender, *chat_id, *mid};
}

std::optional<core::InboundEvent> parse_callback(const json::object& cq) {
    const auto* from = object_at(cq, "from");
    const auto* msg = object_at(cq, "message");
    if (from == nullptr || msg == nullptr) {
        return std::nullopt;
    }
    const auto* chat = object_at(*msg, "chat");
    auto sender = int_at(*from, "id");
    auto mid = int_at(*msg, "message_id");
    if (chat == nullptr || !sender || !mid) {
        return std::nullopt;
    }
    auto chat_id = int_at(*chat, "id");
    if (!chat_id) {
        return std::nullopt;
    }

    core::ButtonPress press;
    press.sender_id = *sender;
    press.chat_id = *chat_id;
    press.message_id = *mid;
    press.callback_id = string_at(cq, "id");

    const std::string data = string_at(cq, "data");
    std::string_view view = data;
    if (view.starts_with(models::YES_PREFIX)) {
        press.choice = core::Choice::Yes;
        view.remove_prefix(models::YES_PREFIX.size());
    } else if (view.starts_with(models::NO_PREFIX)) {
        press.choice = core::Choice::No;
        view.remove_prefix(models::NO_PREFIX.size());
    } else {
        return std::nullopt;
    }

    if (view.empty() || press.callback_id.empty()) {
        return std::nullopt;
    }
    press.token.assign(view);
    return press;
}

}  // namespace

std::optional<std::int64_t> UpdateId(const json::object& update) { return int_at(update, "update_id"); }

std::optional<core::InboundEvent> ParseUpdate(const json::object& update) {
    if (const auto* msg = object_at(update, "message")) {
        return parse_message(*msg);
    }
    if (const auto* cq = object_at(update, "callback_query")) {
        return parse_callback(*cq);
    }
    return std::nullopt;
}

}  // namespace courier::network
