#pragma once

#include <boost/asio/awaitable.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>

#include "AccessGuard.hpp"
#include "DownloadOrchestrator.hpp"
#include "IChatTransport.hpp"
#include "InboundEvent.hpp"
#include "PendingRegistry.hpp"

namespace courier::core {

/**
 * @brief Operator slash-commands (/start, /help, /info, /status, /storage, /ip, /cancel).
 *
 * @details
 * /start, /help and /info answer anyone: /info is how an operator discovers the
 * ids to configure. Everything else, including plain text, only answers the
 * authorized operator and is silent otherwise.
 */
class CommandHandler {
   public:
    CommandHandler(AccessGuard guard, std::shared_ptr<PendingRegistry> registry,
                   std::shared_ptr<DownloadOrchestrator> orchestrator,
                   std::shared_ptr<IChatTransport> transport, std::filesystem::path download_dir);

    asio::awaitable<void> Handle(CommandMessage cmd);
    asio::awaitable<void> HandleText(TextMessage msg);

   private:
    using Action = std::string (CommandHandler::*)(const CommandMessage&);

    struct Command {
        bool requires_auth;
        Action action;
    };

    std::string start(const CommandMessage& cmd);
    std::string help(const CommandMessage& cmd);
    std::string info(const CommandMessage& cmd);
    std::string status(const CommandMessage& cmd);
    std::string storage(const CommandMessage& cmd);
    std::string ip(const CommandMessage& cmd);
    std::string cancel(const CommandMessage& cmd);

    asio::awaitable<void> reply(std::int64_t chat_id, std::int64_t message_id, std::string text);

    AccessGuard guard_;
    std::shared_ptr<PendingRegistry> registry_;
    std::shared_ptr<DownloadOrchestrator> orchestrator_;
    std::shared_ptr<IChatTransport> transport_;
    std::filesystem::path download_dir_;
    std::unordered_map<std::string, Command> commands_;
};

}  // namespace courier::core
