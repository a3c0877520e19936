#pragma once

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>

#include "Config.hpp"
#include "Types.hpp"

namespace courier::network {

/**
 * @brief A Bot API call that came back with `"ok": false` or a non-JSON reply.
 */
class BotApiError : public std::runtime_error {
   public:
    BotApiError(int error_code, const std::string& description)
        : std::runtime_error("Bot API error " + std::to_string(error_code) + ": " + description),
          error_code_(error_code),
          description_(description) {}

    int error_code() const noexcept { return error_code_; }
    const std::string& description() const noexcept { return description_; }

    // Rate limiting and server-side failures are worth retrying.
    bool transient() const noexcept { return error_code_ == 429 || error_code_ >= 500; }

   private:
    int error_code_;
    std::string description_;
};

/**
 * @brief Minimal JSON-over-HTTP client for the Telegram Bot API.
 *
 * @details
 * **Role:** Holds the immutable endpoint and token. Every call opens a
 * short-lived connection on the calling coroutine's executor, so a single
 * client is shared by the poller (main thread) and all transfers (pool threads).
 *
 * **Target server:** a self-hosted `telegram-bot-api` in `--local` mode,
 * reached over plain HTTP.
 */
class BotApiClient {
   public:
    explicit BotApiClient(core::BotConfig cfg);

    /**
     * @brief POST /bot<token>/<method> with a JSON body.
     * @return The `result` member of the reply.
     * @throws BotApiError if the API reports failure.
     * @throws boost::system::system_error on network errors or timeout.
     */
    asio::awaitable<json::value> Call(std::string method, json::object params,
                                      std::chrono::seconds timeout);

    asio::awaitable<json::value> Call(std::string method, json::object params);

    // Request target for downloading a remote (non-local-mode) file.
    std::string FileTarget(std::string_view file_path) const;

    const core::BotConfig& config() const noexcept { return cfg_; }

   private:
    std::string method_target(std::string_view method) const;

    core::BotConfig cfg_;
};

}  // namespace courier::network
