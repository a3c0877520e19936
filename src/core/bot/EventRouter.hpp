#pragma once

#include <boost/asio/awaitable.hpp>
#include <memory>

#include "CommandHandler.hpp"
#include "DownloadOrchestrator.hpp"
#include "InboundEvent.hpp"

namespace courier::core {

/**
 * @brief Dispatches inbound events: files and buttons to the orchestrator,
 * commands and text to the CommandHandler. Handler errors are logged here.
 */
class EventRouter {
   public:
    EventRouter(std::shared_ptr<DownloadOrchestrator> orchestrator,
                std::shared_ptr<CommandHandler> commands);

    asio::awaitable<void> Route(InboundEvent event);

   private:
    std::shared_ptr<DownloadOrchestrator> orchestrator_;
    std::shared_ptr<CommandHandler> commands_;
};

}  // namespace courier::core
