#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "DownloadTypes.hpp"

namespace courier::core {

enum class Choice { Yes, No };

struct ButtonPress {
    std::int64_t sender_id = 0;
    std::int64_t chat_id = 0;
    std::int64_t message_id = 0;  // the prompt the button sits on
    std::string callback_id;
    Token token;
    Choice choice = Choice::No;
};

struct CommandMessage {
    std::int64_t sender_id = 0;
    std::int64_t chat_id = 0;
    std::int64_t message_id = 0;
    std::string sender_name;
    std::string command;  // lowercase, without '/' and '@bot' suffix
    std::string args;
};

struct TextMessage {
    std::int64_t sender_id = 0;
    std::int64_t chat_id = 0;
    std::int64_t message_id = 0;
};

using InboundEvent = std::variant<FileAnnouncement, ButtonPress, CommandMessage, TextMessage>;

}  // namespace courier::core
