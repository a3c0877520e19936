#pragma once

#include <memory>

#include "BotApiClient.hpp"
#include "IChatTransport.hpp"

namespace courier::network {

/**
 * @brief IChatTransport over the Bot API (sendMessage / editMessageText /
 * answerCallbackQuery), HTML parse mode.
 */
class BotApiTransport : public core::IChatTransport {
   public:
    explicit BotApiTransport(std::shared_ptr<BotApiClient> client);

    asio::awaitable<std::int64_t> SendMessage(std::int64_t chat_id, std::string text,
                                              std::optional<core::InlineKeyboard> keyboard,
                                              std::optional<std::int64_t> reply_to) override;

    asio::awaitable<void> EditMessage(std::int64_t chat_id, std::int64_t message_id,
                                      std::string text) override;

    asio::awaitable<void> AnswerCallback(std::string callback_id) override;

   private:
    std::shared_ptr<BotApiClient> client_;
};

}  // namespace courier::network
