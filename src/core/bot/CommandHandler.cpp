#include "CommandHandler.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <chrono>
#include <system_error>

#include "MessageBuilder.hpp"

namespace courier::core {

using models::MessageBuilder;

CommandHandler::CommandHandler(AccessGuard guard, std::shared_ptr<PendingRegistry> registry,
                               std::shared_ptr<DownloadOrchestrator> orchestrator,
                               std::shared_ptr<IChatTransport> transport,
                               std::filesystem::path download_dir)
    : guard_(guard),
      registry_(std::move(registry)),
      orchestrator_(std::move(orchestrator)),
      transport_(std::move(transport)),
      download_dir_(std::move(download_dir)) {
    commands_ = {
        {"start", {false, &CommandHandler::start}},
        {"help", {false, &CommandHandler::help}},
        {"info", {false, &CommandHandler::info}},
        {"status", {true, &CommandHandler::status}},
        {"storage", {true, &CommandHandler::storage}},
        {"ip", {true, &CommandHandler::ip}},
        {"cancel", {true, &CommandHandler::cancel}},
    };
}

asio::awaitable<void> CommandHandler::Handle(CommandMessage cmd) {
    const bool authorized = guard_.Authorize(cmd.sender_id, cmd.chat_id);

    auto it = commands_.find(cmd.command);
    if (it == commands_.end()) {
        // Unknown commands get the same nudge as plain text.
        co_await HandleText(TextMessage{cmd.sender_id, cmd.chat_id, cmd.message_id});
        co_return;
    }
    if (it->second.requires_auth && !authorized) {
        spdlog::debug("Ignoring /{} from unauthorized sender {}", cmd.command, cmd.sender_id);
        co_return;
    }

    spdlog::info("/{} command received", cmd.command);
    co_await reply(cmd.chat_id, cmd.message_id, (this->*(it->second.action))(cmd));
}

asio::awaitable<void> CommandHandler::HandleText(TextMessage msg) {
    if (!guard_.Authorize(msg.sender_id, msg.chat_id)) {
        co_return;
    }
    co_await reply(msg.chat_id, msg.message_id, MessageBuilder::DefaultReply());
}

std::string CommandHandler::start(const CommandMessage& cmd) {
    return MessageBuilder::Start(cmd.sender_name, cmd.sender_id);
}

std::string CommandHandler::help(const CommandMessage&) { return MessageBuilder::Help(download_dir_); }

std::string CommandHandler::info(const CommandMessage& cmd) {
    return MessageBuilder::Info(cmd.sender_id, cmd.chat_id);
}

std::string CommandHandler::status(const CommandMessage&) {
    return MessageBuilder::StatusList(registry_->List(), std::chrono::system_clock::now());
}

std::string CommandHandler::storage(const CommandMessage&) {
    std::error_code ec;
    if (!std::filesystem::exists(download_dir_, ec)) {
        return "The specified folder does not exist.";
    }
    auto info = std::filesystem::space(download_dir_, ec);
    if (ec) {
        spdlog::warn("space({}) failed: {}", download_dir_.string(), ec.message());
        return "Failed to read storage information.";
    }
    return MessageBuilder::Storage(download_dir_, info.capacity, info.available);
}

std::string CommandHandler::ip(const CommandMessage&) {
    // Connecting a UDP socket sends nothing; it only selects the outbound interface.
    asio::io_context ioc;
    asio::ip::udp::socket socket(ioc);
    boost::system::error_code ec;
    socket.connect({asio::ip::make_address_v4("8.8.8.8"), 80}, ec);
    if (ec) {
        spdlog::warn("IP lookup failed: {}", ec.message());
        return "Failed to get IP address.";
    }
    auto local = socket.local_endpoint(ec);
    if (ec) {
        return "Failed to get IP address.";
    }
    return "Your IP address is: " + local.address().to_string();
}

std::string CommandHandler::cancel(const CommandMessage&) {
    auto count = orchestrator_->CancelAll();
    if (count == 0) {
        return "No downloads in progress.";
    }
    return "Cancelling " + std::to_string(count) + " download(s).";
}

asio::awaitable<void> CommandHandler::reply(std::int64_t chat_id, std::int64_t message_id, std::string text) {
    try {
        co_await transport_->SendMessage(chat_id, std::move(text), std::nullopt, message_id);
    } catch (const std::exception& e) {
        spdlog::warn("Could not reply in chat {}: {}", chat_id, e.what());
    }
}

}  // namespace courier::core
