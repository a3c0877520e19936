#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "AccessGuard.hpp"
#include "DownloadTypes.hpp"
#include "IChatTransport.hpp"
#include "InboundEvent.hpp"
#include "PendingRegistry.hpp"
#include "TransferRunner.hpp"

namespace courier::core {

struct OrchestratorOptions {
    std::size_t max_concurrent = 2;
    // Zero disables the confirmation timeout sweep.
    std::chrono::seconds confirmation_timeout{0};
    std::chrono::seconds sweep_interval{60};
};

/**
 * @brief The confirmation-gated download state machine.
 *
 * @details
 * **Threading:** every public coroutine and every runner callback executes on
 * `executor_` (the bot's main io_context), so the orchestrator's own fields
 * (active count, deferred queue) need no locking. Per-token state lives in
 * PendingRegistry.
 *
 * **Prompt edits:** at most one editMessageText per prompt is in flight.
 * Texts submitted meanwhile coalesce to the latest one, and once a closing
 * text is queued nothing but it can follow.
 *
 * **Absorbed races:** unauthorized events, redelivered announcements, duplicate
 * or stale button presses all end here as silent no-ops.
 */
class DownloadOrchestrator : public std::enable_shared_from_this<DownloadOrchestrator> {
   public:
    DownloadOrchestrator(asio::any_io_executor executor, AccessGuard guard,
                         std::shared_ptr<PendingRegistry> registry,
                         std::shared_ptr<TransferRunner> runner,
                         std::shared_ptr<IChatTransport> transport, OrchestratorOptions options = {});

    asio::awaitable<void> OnAnnouncement(FileAnnouncement announcement);
    asio::awaitable<void> OnButtonPress(ButtonPress press);

    // Declines every prompt that has waited longer than the confirmation timeout.
    asio::awaitable<std::size_t> SweepExpired(std::chrono::system_clock::time_point now);

    // Periodic SweepExpired; no-op when the timeout is disabled.
    void StartSweeper();
    void Stop();

    // Raises the cancel flag of every running transfer. Thread-safe.
    std::size_t CancelAll();

    std::size_t active_transfers() const noexcept { return active_; }
    std::size_t queued_transfers() const noexcept { return deferred_.size(); }

   private:
    asio::awaitable<void> on_yes(const ButtonPress& press);
    asio::awaitable<void> on_no(const ButtonPress& press);

    asio::awaitable<void> activate(const Token& token);
    void launch(const PendingDownload& entry);
    asio::awaitable<void> drain_deferred();

    asio::awaitable<void> on_progress(Token token, std::uint64_t transferred, std::uint64_t total);
    asio::awaitable<void> on_done(Token token, TransferOutcome outcome);

    asio::awaitable<void> sweep_loop();

    bool is_deferred(const Token& token) const;
    void forget_deferred(const Token& token);

    // Outbound helpers: delivery failures are logged, never propagated.
    asio::awaitable<void> edit_prompt(const PendingDownload& entry, std::string text, bool closing = false);
    asio::awaitable<void> notify(const PendingDownload& entry, std::string text);

    asio::any_io_executor executor_;
    AccessGuard guard_;
    std::shared_ptr<PendingRegistry> registry_;
    std::shared_ptr<TransferRunner> runner_;
    std::shared_ptr<IChatTransport> transport_;
    OrchestratorOptions options_;

    std::size_t active_ = 0;
    std::deque<Token> deferred_;

    struct PromptEdits {
        std::optional<std::string> next;
        bool closed = false;
    };
    std::unordered_map<Token, PromptEdits> prompt_edits_;

    asio::steady_timer sweep_timer_;
    bool stopped_ = false;
};

}  // namespace courier::core
