#include "Bot.hpp"

#include <spdlog/spdlog.h>

#include "AccessGuard.hpp"
#include "BotApiClient.hpp"
#include "BotApiTransport.hpp"
#include "BotFileFetcher.hpp"
#include "CommandHandler.hpp"
#include "DownloadOrchestrator.hpp"
#include "EventRouter.hpp"
#include "PendingRegistry.hpp"
#include "TransferPool.hpp"
#include "TransferRunner.hpp"
#include "UpdatePoller.hpp"

namespace courier::network {

struct Bot::Impl {
    asio::io_context& main_io_;
    core::AppConfig config_;

    // Components
    std::shared_ptr<infra::TransferPool> pool_;
    std::shared_ptr<BotApiClient> client_;
    std::shared_ptr<core::PendingRegistry> registry_;
    std::shared_ptr<core::TransferRunner> runner_;
    std::shared_ptr<core::DownloadOrchestrator> orchestrator_;
    std::shared_ptr<core::EventRouter> router_;
    std::shared_ptr<UpdatePoller> poller_;

    Impl(asio::io_context& io, core::AppConfig config) : main_io_(io), config_(std::move(config)) {
        const auto& dl = config_.download;
        core::AccessGuard guard(*config_.access.operator_id, *config_.access.chat_id);

        // 1. Transfer threads
        pool_ = std::make_shared<infra::TransferPool>(config_.runtime.transfer_threads);

        // 2. Bot API
        client_ = std::make_shared<BotApiClient>(config_.bot);
        auto transport = std::make_shared<BotApiTransport>(client_);
        auto fetcher = std::make_shared<BotFileFetcher>(client_, dl);

        // 3. Download pipeline
        registry_ = std::make_shared<core::PendingRegistry>(dl.directory);

        core::RunnerOptions runner_options;
        runner_options.max_attempts = static_cast<int>(dl.max_attempts);
        runner_options.retry_backoff = std::chrono::milliseconds(dl.retry_backoff_ms);
        runner_options.progress_interval = std::chrono::milliseconds(dl.progress_interval_ms);
        runner_ = std::make_shared<core::TransferRunner>(*pool_, fetcher, runner_options);

        core::OrchestratorOptions orchestrator_options;
        orchestrator_options.max_concurrent = dl.max_concurrent;
        orchestrator_options.confirmation_timeout = std::chrono::seconds(dl.confirmation_timeout_seconds);
        orchestrator_ = std::make_shared<core::DownloadOrchestrator>(
            main_io_.get_executor(), guard, registry_, runner_, transport, orchestrator_options);

        // 4. Event routing
        auto commands = std::make_shared<core::CommandHandler>(guard, registry_, orchestrator_, transport,
                                                               dl.directory);
        router_ = std::make_shared<core::EventRouter>(orchestrator_, commands);
        poller_ = std::make_shared<UpdatePoller>(main_io_, client_, router_);

        spdlog::info("Bot initialized (downloads to {}, {} at a time, threads: {})", dl.directory,
                     dl.max_concurrent, config_.runtime.transfer_threads);
    }

    void Start() {
        pool_->Start();                 // Start transfer threads
        poller_->run();                 // Start long-polling
        orchestrator_->StartSweeper();  // Expire stale prompts
        main_io_.run();                 // Start main thread loop
    }

    void Stop() {
        spdlog::info("Stopping bot components...");
        orchestrator_->CancelAll();
        poller_->Stop();
        orchestrator_->Stop();
        pool_->Stop();
        main_io_.stop();
    }
};

Bot::Bot(asio::io_context& io, core::AppConfig config)
    : pImpl_(std::make_unique<Impl>(io, std::move(config))) {}

Bot::~Bot() = default;

void Bot::Start() { pImpl_->Start(); }
void Bot::Stop() { pImpl_->Stop(); }

}  // namespace courier::network
