#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "Types.hpp"

namespace courier::infra {

/**
 * @brief The threads transfers run on.
 *
 * @details
 * One `io_context` per thread, handed out round-robin, so a slow disk or socket
 * only stalls the transfers that share its thread. The bot's event loop runs
 * elsewhere (the main io_context) and is never blocked by file I/O.
 */
class TransferPool {
   public:
    explicit TransferPool(std::size_t threads, std::string name = "transfer");

    // Stops all contexts and joins the threads.
    ~TransferPool();

    TransferPool(const TransferPool&) = delete;
    TransferPool& operator=(const TransferPool&) = delete;

    void Start();

    // Idempotent. Pending transfer coroutines are dropped with their contexts.
    void Stop();

    asio::io_context& NextContext();

   private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    std::string name_;
    std::vector<std::shared_ptr<asio::io_context>> contexts_;
    std::vector<WorkGuard> guards_;
    std::vector<std::jthread> threads_;
    std::atomic<std::size_t> next_{0};
    std::atomic<bool> stopped_{false};
};

}  // namespace courier::infra
