#pragma once

#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <memory>

#include "BotApiClient.hpp"
#include "EventRouter.hpp"
#include "Types.hpp"

namespace courier::network {

/**
 * @brief The getUpdates long-poll loop.
 *
 * @details
 * Runs on the main io_context. Each batch is parsed into InboundEvents which
 * are routed one after another, so the orchestrator never sees two events of
 * the same chat concurrently. Transfers themselves run on the pool.
 */
class UpdatePoller : public std::enable_shared_from_this<UpdatePoller> {
   public:
    UpdatePoller(asio::io_context& ioc, std::shared_ptr<BotApiClient> client,
                 std::shared_ptr<core::EventRouter> router);

    // Spawn the loop on the main io_context.
    void run();

    void Stop();

   private:
    asio::awaitable<void> do_poll();
    asio::awaitable<void> announce();
    asio::awaitable<void> wait_retry();

    asio::io_context& ioc_;
    std::shared_ptr<BotApiClient> client_;
    std::shared_ptr<core::EventRouter> router_;
    asio::steady_timer retry_timer_;
    std::int64_t offset_ = 0;
    bool stopped_ = false;
};

}  // namespace courier::network
