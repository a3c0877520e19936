#include "BotApiTransport.hpp"

#include <spdlog/spdlog.h>

namespace courier::network {

namespace {

json::object keyboard_markup(const core::InlineKeyboard& keyboard) {
    json::array rows;
    for (const auto& row : keyboard) {
        json::array buttons;
        for (const auto& button : row) {
            buttons.push_back(json::object{{"text", button.text}, {"callback_data", button.callback_data}});
        }
        rows.push_back(std::move(buttons));
    }
    return json::object{{"inline_keyboard", std::move(rows)}};
}

bool is_not_modified(const BotApiError& e) {
    return e.error_code() == 400 && e.description().find("message is not modified") != std::string::npos;
}

}  // namespace

BotApiTransport::BotApiTransport(std::shared_ptr<BotApiClient> client) : client_(std::move(client)) {}

asio::awaitable<std::int64_t> BotApiTransport::SendMessage(std::int64_t chat_id, std::string text,
                                                           std::optional<core::InlineKeyboard> keyboard,
                                                           std::optional<std::int64_t> reply_to) {
    json::object params{
        {"chat_id", chat_id},
        {"text", std::move(text)},
        {"parse_mode", "HTML"},
        {"disable_web_page_preview", true},
    };
    if (keyboard) {
        params["reply_markup"] = keyboard_markup(*keyboard);
    }
    if (reply_to) {
        params["reply_to_message_id"] = *reply_to;
        params["allow_sending_without_reply"] = true;
    }

    auto result = co_await client_->Call("sendMessage", std::move(params));

    const auto* id = result.is_object() ? result.as_object().if_contains("message_id") : nullptr;
    if (id == nullptr || !id->is_int64()) {
        throw BotApiError(0, "sendMessage reply carries no message_id");
    }
    co_return id->as_int64();
}

asio::awaitable<void> BotApiTransport::EditMessage(std::int64_t chat_id, std::int64_t message_id,
                                                   std::string text) {
    json::object params{
        {"chat_id", chat_id},
        {"message_id", message_id},
        {"text", std::move(text)},
        {"parse_mode", "HTML"},
        {"disable_web_page_preview", true},
    };

    try {
        co_await client_->Call("editMessageText", std::move(params));
    } catch (const BotApiError& e) {
        // Same text twice (e.g. two progress ticks at one percentage) is not a failure.
        if (!is_not_modified(e)) {
            throw;
        }
        spdlog::trace("[BotApi] edit of {} skipped: not modified", message_id);
    }
}

asio::awaitable<void> BotApiTransport::AnswerCallback(std::string callback_id) {
    co_await client_->Call("answerCallbackQuery", json::object{{"callback_query_id", std::move(callback_id)}});
}

}  // namespace courier::network
