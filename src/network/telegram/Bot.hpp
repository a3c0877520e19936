#pragma once

#include <boost/asio/io_context.hpp>
#include <memory>

#include "Config.hpp"

namespace courier::network {

/**
 * @brief High-level Bot Facade.
 * Wires the transfer pool, Bot API client, orchestrator and poller together.
 */
class Bot : public std::enable_shared_from_this<Bot> {
   public:
    Bot(boost::asio::io_context& io, core::AppConfig config);
    ~Bot();

    // Blocks in the main io_context until Stop().
    void Start();
    void Stop();

   private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace courier::network
