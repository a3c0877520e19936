#include "UpdatePoller.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "MessageBuilder.hpp"
#include "UpdateParser.hpp"

namespace courier::network {

namespace {

// Extra time on top of the long-poll timeout before the socket gives up.
constexpr std::chrono::seconds POLL_MARGIN{10};

}  // namespace

UpdatePoller::UpdatePoller(asio::io_context& ioc, std::shared_ptr<BotApiClient> client,
                           std::shared_ptr<core::EventRouter> router)
    : ioc_(ioc), client_(std::move(client)), router_(std::move(router)), retry_timer_(ioc) {}

void UpdatePoller::run() {
    spdlog::debug("Starting update poller..");
    asio::co_spawn(ioc_, [self = shared_from_this()]() { return self->do_poll(); }, asio::detached);
}

void UpdatePoller::Stop() {
    stopped_ = true;
    retry_timer_.cancel();
}

asio::awaitable<void> UpdatePoller::announce() {
    try {
        auto me = co_await client_->Call("getMe", {});
        const auto& obj = me.as_object();
        std::string username;
        if (const auto* u = obj.if_contains("username"); u && u->is_string()) {
            username = std::string(u->as_string());
        }
        spdlog::info("Bot @{} connected (id {})", username, json::value_to<std::int64_t>(obj.at("id")));
    } catch (const std::exception& e) {
        spdlog::error("getMe failed: {}", e.what());
        throw;
    }

    json::array commands;
    for (const auto& [command, description] : models::BOT_COMMANDS) {
        commands.push_back(json::object{{"command", command.substr(1)}, {"description", description}});
    }
    try {
        co_await client_->Call("setMyCommands", {{"commands", std::move(commands)}});
    } catch (const std::exception& e) {
        spdlog::warn("setMyCommands failed: {}", e.what());
    }
}

asio::awaitable<void> UpdatePoller::wait_retry() {
    const auto delay = std::chrono::milliseconds(client_->config().poll_retry_delay_ms);
    retry_timer_.expires_after(delay);
    co_await retry_timer_.async_wait(asio::as_tuple(asio::use_awaitable));
}

asio::awaitable<void> UpdatePoller::do_poll() {
    const auto& cfg = client_->config();

    // 1. Identify ourselves; keep trying until the API server is reachable.
    while (!stopped_) {
        bool ready = false;
        try {
            co_await announce();
            ready = true;
        } catch (const std::exception&) {
            // logged in announce()
        }
        if (ready) {
            break;
        }
        co_await wait_retry();
    }

    // 2. Long-poll
    while (!stopped_) {
        json::array batch;
        bool failed = false;
        try {
            json::array allowed{"message", "callback_query"};
            auto result = co_await client_->Call(
                "getUpdates",
                {{"offset", offset_}, {"timeout", cfg.long_poll_seconds}, {"allowed_updates", allowed}},
                std::chrono::seconds(cfg.long_poll_seconds) + POLL_MARGIN);
            if (result.is_array()) {
                batch = std::move(result.as_array());
            }
        } catch (const std::exception& e) {
            spdlog::error("getUpdates failed: {}", e.what());
            failed = true;
        }

        if (failed) {
            co_await wait_retry();
            continue;
        }

        for (const auto& raw : batch) {
            if (!raw.is_object()) {
                continue;
            }
            const auto& update = raw.as_object();
            if (auto id = UpdateId(update)) {
                offset_ = std::max(offset_, *id + 1);
            }
            auto event = ParseUpdate(update);
            if (!event) {
                spdlog::trace("Skipping unsupported update");
                continue;
            }
            co_await router_->Route(std::move(*event));
        }
    }

    spdlog::debug("Update poller stopped.");
}

}  // namespace courier::network
