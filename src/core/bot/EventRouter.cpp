#include "EventRouter.hpp"

#include <spdlog/spdlog.h>

#include <variant>

namespace courier::core {

EventRouter::EventRouter(std::shared_ptr<DownloadOrchestrator> orchestrator,
                         std::shared_ptr<CommandHandler> commands)
    : orchestrator_(std::move(orchestrator)), commands_(std::move(commands)) {}

asio::awaitable<void> EventRouter::Route(InboundEvent event) {
    try {
        if (auto* file = std::get_if<FileAnnouncement>(&event)) {
            co_await orchestrator_->OnAnnouncement(std::move(*file));
        } else if (auto* press = std::get_if<ButtonPress>(&event)) {
            co_await orchestrator_->OnButtonPress(std::move(*press));
        } else if (auto* cmd = std::get_if<CommandMessage>(&event)) {
            co_await commands_->Handle(std::move(*cmd));
        } else if (auto* text = std::get_if<TextMessage>(&event)) {
            co_await commands_->HandleText(*text);
        }
    } catch (const std::exception& e) {
        spdlog::error("Routing Error: {}", e.what());
    }
}

}  // namespace courier::core
