#pragma once

#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace courier::core {

struct InlineButton {
    std::string text;
    std::string callback_data;
};

// Rows of inline buttons attached under a message.
using InlineKeyboard = std::vector<std::vector<InlineButton>>;

/**
 * @brief Outbound side of the chat transport.
 *
 * @details
 * Text is HTML-formatted. Implementations throw on delivery failure; callers
 * in the core catch and log, a failed notification never stops the bot.
 */
struct IChatTransport {
    virtual ~IChatTransport() = default;

    // Returns the id of the sent message, used for later edits.
    virtual boost::asio::awaitable<std::int64_t> SendMessage(
        std::int64_t chat_id, std::string text, std::optional<InlineKeyboard> keyboard = std::nullopt,
        std::optional<std::int64_t> reply_to = std::nullopt) = 0;

    // Replaces text and removes any keyboard.
    virtual boost::asio::awaitable<void> EditMessage(std::int64_t chat_id, std::int64_t message_id,
                                                     std::string text) = 0;

    // Stops the client-side spinner on a pressed button.
    virtual boost::asio::awaitable<void> AnswerCallback(std::string callback_id) = 0;
};

}  // namespace courier::core
