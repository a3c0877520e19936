#include "DownloadOrchestrator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <utility>

#include "MessageBuilder.hpp"

namespace courier::core {

using models::MessageBuilder;

DownloadOrchestrator::DownloadOrchestrator(asio::any_io_executor executor, AccessGuard guard,
                                           std::shared_ptr<PendingRegistry> registry,
                                           std::shared_ptr<TransferRunner> runner,
                                           std::shared_ptr<IChatTransport> transport,
                                           OrchestratorOptions options)
    : executor_(executor),
      guard_(guard),
      registry_(std::move(registry)),
      runner_(std::move(runner)),
      transport_(std::move(transport)),
      options_(options),
      sweep_timer_(executor) {
    if (options_.max_concurrent == 0) {
        options_.max_concurrent = 1;
    }
}

// =========================================================
//  Inbound events
// =========================================================

asio::awaitable<void> DownloadOrchestrator::OnAnnouncement(FileAnnouncement announcement) {
    if (!guard_.Authorize(announcement.sender_id, announcement.chat_id)) {
        spdlog::debug("Ignoring file from unauthorized sender {} in chat {}", announcement.sender_id,
                      announcement.chat_id);
        co_return;
    }

    auto created = registry_->Create(announcement);
    if (!created) {
        spdlog::debug("[{}] Duplicate announcement ignored.", announcement.token);
        co_return;
    }

    spdlog::info("[{}] File announced: '{}' ({} bytes)", announcement.token, announcement.filename,
                 announcement.size);

    bool prompted = false;
    try {
        auto prompt_id = co_await transport_->SendMessage(
            announcement.chat_id, MessageBuilder::ConfirmationPrompt(*created),
            MessageBuilder::ConfirmationKeyboard(announcement.token), announcement.message_id);
        registry_->AttachPrompt(announcement.token, prompt_id);
        prompted = true;
    } catch (const std::exception& e) {
        spdlog::error("[{}] Could not send confirmation prompt: {}", announcement.token, e.what());
    }

    // Nobody can ever confirm an entry without a prompt.
    if (!prompted) {
        registry_->Resolve(announcement.token, OutcomeKind::Failed);
    }
}

asio::awaitable<void> DownloadOrchestrator::OnButtonPress(ButtonPress press) {
    if (!guard_.Authorize(press.sender_id, press.chat_id)) {
        spdlog::debug("Ignoring button press from unauthorized sender {} in chat {}", press.sender_id,
                      press.chat_id);
        co_return;
    }

    try {
        co_await transport_->AnswerCallback(press.callback_id);
    } catch (const std::exception& e) {
        spdlog::debug("[{}] answerCallbackQuery failed: {}", press.token, e.what());
    }

    if (press.choice == Choice::Yes) {
        co_await on_yes(press);
    } else {
        co_await on_no(press);
    }
}

asio::awaitable<void> DownloadOrchestrator::on_yes(const ButtonPress& press) {
    if (is_deferred(press.token)) {
        spdlog::debug("[{}] Already queued.", press.token);
        co_return;
    }

    if (active_ >= options_.max_concurrent) {
        auto entry = registry_->Get(press.token);
        if (!entry || entry->status != Status::AwaitingConfirmation) {
            spdlog::debug("[{}] Ignoring confirmation for stale or active token.", press.token);
            co_return;
        }
        deferred_.push_back(press.token);
        spdlog::info("[{}] Queued behind {} running transfer(s).", press.token, active_);
        co_await edit_prompt(*entry, MessageBuilder::Queued(*entry));
        co_return;
    }

    co_await activate(press.token);
}

asio::awaitable<void> DownloadOrchestrator::on_no(const ButtonPress& press) {
    auto declined = registry_->Decline(press.token);
    if (!declined) {
        spdlog::debug("[{}] Ignoring decline: {}", press.token, ToString(declined.error()));
        co_return;
    }

    forget_deferred(press.token);
    spdlog::info("[{}] Declined by operator.", press.token);
    co_await edit_prompt(*declined, MessageBuilder::Declined(*declined), true);
}

// =========================================================
//  Transfer lifecycle
// =========================================================

asio::awaitable<void> DownloadOrchestrator::activate(const Token& token) {
    auto activated = registry_->TryActivate(token);
    if (!activated) {
        spdlog::debug("[{}] Ignoring confirmation: {}", token, ToString(activated.error()));
        co_return;
    }

    // Claim the slot before the first suspension point.
    ++active_;
    co_await edit_prompt(*activated, MessageBuilder::Downloading(*activated, 0, activated->announcement.size));
    launch(*activated);
}

void DownloadOrchestrator::launch(const PendingDownload& entry) {
    auto self = shared_from_this();
    const Token token = entry.token();

    // Runner callbacks arrive on a pool thread; hop back onto our executor.
    runner_->Start(
        entry,
        [self, token](std::uint64_t transferred, std::uint64_t total) {
            asio::co_spawn(
                self->executor_,
                [self, token, transferred, total]() { return self->on_progress(token, transferred, total); },
                asio::detached);
        },
        [self, token](TransferOutcome outcome) {
            asio::co_spawn(
                self->executor_,
                [self, token, outcome = std::move(outcome)]() mutable {
                    return self->on_done(token, std::move(outcome));
                },
                asio::detached);
        });
}

asio::awaitable<void> DownloadOrchestrator::drain_deferred() {
    while (active_ < options_.max_concurrent && !deferred_.empty()) {
        Token next = deferred_.front();
        deferred_.pop_front();
        co_await activate(next);
    }
}

asio::awaitable<void> DownloadOrchestrator::on_progress(Token token, std::uint64_t transferred,
                                                        std::uint64_t total) {
    auto entry = registry_->Get(token);
    if (!entry || entry->status != Status::InProgress) {
        co_return;
    }
    registry_->RecordProgress(token, transferred);
    co_await edit_prompt(*entry, MessageBuilder::Downloading(*entry, transferred, total));
}

asio::awaitable<void> DownloadOrchestrator::on_done(Token token, TransferOutcome outcome) {
    if (active_ > 0) {
        --active_;
    }

    auto removed = registry_->Resolve(token, outcome.kind);
    if (!removed) {
        spdlog::debug("[{}] Outcome for an entry that is already gone.", token);
    } else {
        std::string text;
        switch (outcome.kind) {
            case OutcomeKind::Success:
                spdlog::info("[{}] Completed: {}", token, outcome.path.string());
                text = MessageBuilder::Completed(*removed, outcome.path, std::chrono::system_clock::now());
                break;
            case OutcomeKind::Failed:
                spdlog::error("[{}] Failed: {}", token, outcome.reason);
                text = MessageBuilder::Failed(*removed, outcome.reason);
                break;
            case OutcomeKind::Cancelled:
                spdlog::info("[{}] Cancelled.", token);
                text = MessageBuilder::Cancelled(*removed);
                break;
        }
        co_await edit_prompt(*removed, MessageBuilder::PromptClosed(*removed, outcome.kind), true);
        co_await notify(*removed, std::move(text));
    }

    co_await drain_deferred();
}

// =========================================================
//  Timeouts & cancellation
// =========================================================

asio::awaitable<std::size_t> DownloadOrchestrator::SweepExpired(std::chrono::system_clock::time_point now) {
    if (options_.confirmation_timeout.count() <= 0) {
        co_return 0;
    }

    std::size_t expired = 0;
    for (const auto& entry : registry_->List()) {
        // Queued entries were confirmed already; they only wait for a slot.
        if (entry.status != Status::AwaitingConfirmation || is_deferred(entry.token())) {
            continue;
        }
        auto since = registry_->PendingSince(entry.token());
        if (!since || now - *since < options_.confirmation_timeout) {
            continue;
        }
        auto declined = registry_->Decline(entry.token());
        if (!declined) {
            continue;
        }
        ++expired;
        spdlog::info("[{}] Confirmation timed out.", entry.token());
        co_await edit_prompt(*declined, MessageBuilder::Expired(*declined), true);
    }
    co_return expired;
}

void DownloadOrchestrator::StartSweeper() {
    if (options_.confirmation_timeout.count() <= 0) {
        return;
    }
    spdlog::info("Confirmation timeout: {}s", options_.confirmation_timeout.count());
    asio::co_spawn(
        executor_, [self = shared_from_this()]() { return self->sweep_loop(); }, asio::detached);
}

asio::awaitable<void> DownloadOrchestrator::sweep_loop() {
    const auto interval = std::min<std::chrono::seconds>(options_.sweep_interval, options_.confirmation_timeout);

    while (!stopped_) {
        sweep_timer_.expires_after(interval);
        auto [ec] = co_await sweep_timer_.async_wait(asio::as_tuple(asio::use_awaitable));
        if (ec || stopped_) {
            break;
        }
        try {
            co_await SweepExpired(std::chrono::system_clock::now());
        } catch (const std::exception& e) {
            spdlog::error("Sweep failed: {}", e.what());
        }
    }
}

void DownloadOrchestrator::Stop() {
    stopped_ = true;
    sweep_timer_.cancel();
}

std::size_t DownloadOrchestrator::CancelAll() {
    auto count = registry_->CancelAll();
    if (count > 0) {
        spdlog::info("Cancellation requested for {} transfer(s).", count);
    }
    return count;
}

// =========================================================
//  Helpers
// =========================================================

bool DownloadOrchestrator::is_deferred(const Token& token) const {
    return std::find(deferred_.begin(), deferred_.end(), token) != deferred_.end();
}

void DownloadOrchestrator::forget_deferred(const Token& token) {
    deferred_.erase(std::remove(deferred_.begin(), deferred_.end(), token), deferred_.end());
}

asio::awaitable<void> DownloadOrchestrator::edit_prompt(const PendingDownload& entry, std::string text,
                                                        bool closing) {
    if (!entry.prompt_message_id) {
        co_return;
    }

    const Token token = entry.token();
    if (auto it = prompt_edits_.find(token); it != prompt_edits_.end()) {
        // Another coroutine owns this prompt; it sends whatever is left in `next`.
        if (!it->second.closed) {
            it->second.next = std::move(text);
            it->second.closed = closing;
        }
        co_return;
    }
    prompt_edits_.emplace(token, PromptEdits{std::nullopt, closing});

    const auto chat_id = entry.announcement.chat_id;
    const auto message_id = *entry.prompt_message_id;
    std::optional<std::string> current = std::move(text);
    while (current) {
        try {
            co_await transport_->EditMessage(chat_id, message_id, std::move(*current));
        } catch (const std::exception& e) {
            spdlog::warn("[{}] Could not update prompt: {}", token, e.what());
        }
        current = std::exchange(prompt_edits_[token].next, std::nullopt);
    }
    prompt_edits_.erase(token);
}

asio::awaitable<void> DownloadOrchestrator::notify(const PendingDownload& entry, std::string text) {
    try {
        co_await transport_->SendMessage(entry.announcement.chat_id, std::move(text), std::nullopt,
                                         entry.announcement.message_id);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] Could not send notification: {}", entry.token(), e.what());
    }
}

}  // namespace courier::core
