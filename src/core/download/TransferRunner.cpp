#include "TransferRunner.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <algorithm>
#include <exception>
#include <system_error>

#include "Destination.hpp"
#include "PartialFileGuard.hpp"

namespace courier::core {

namespace {

constexpr int MAX_COMMIT_ATTEMPTS = 16;

// Retry waits are sliced so a cancel request is seen promptly.
constexpr std::chrono::milliseconds CANCEL_POLL{50};

}  // namespace

TransferRunner::TransferRunner(infra::TransferPool& pool, std::shared_ptr<IFetcher> fetcher,
                               RunnerOptions options)
    : pool_(pool), fetcher_(std::move(fetcher)), options_(options) {
    if (options_.max_attempts < 1) {
        options_.max_attempts = 1;
    }
}

void TransferRunner::Start(const PendingDownload& pending, ProgressCallback on_progress,
                           DoneCallback on_done) {
    Job job{pending.token(), pending.announcement.handle, pending.announcement.size,
            pending.destination, pending.cancel};

    spdlog::info("[{}] Starting transfer to {}", job.token, job.destination.string());

    asio::co_spawn(
        pool_.NextContext(),
        [self = shared_from_this(), job = std::move(job),
         on_progress = std::move(on_progress)]() mutable {
            return self->run(std::move(job), std::move(on_progress));
        },
        [token = pending.token(), on_done = std::move(on_done)](std::exception_ptr ep,
                                                                 TransferOutcome outcome) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    spdlog::error("[{}] Transfer coroutine failed: {}", token, e.what());
                    outcome = TransferOutcome::Failed(e.what());
                }
            }
            on_done(std::move(outcome));
        });
}

asio::awaitable<TransferOutcome> TransferRunner::run(Job job, ProgressCallback on_progress) {
    std::error_code ec;
    std::filesystem::create_directories(job.destination.parent_path(), ec);
    if (ec) {
        co_return TransferOutcome::Failed("Cannot create download directory: " + ec.message());
    }

    // 1. Reserve a private temporary name; the guard removes it on every exit but commit.
    const auto temp = infra::TempPathFor(job.destination);
    infra::PartialFileGuard guard(temp);

    // 2. Rate-limit progress: one report per interval, plus one on completion.
    auto last_report = std::chrono::steady_clock::now();
    ChunkCallback on_chunk = [&](std::uint64_t written) {
        auto now = std::chrono::steady_clock::now();
        bool finished = job.total > 0 && written >= job.total;
        if (!finished && now - last_report < options_.progress_interval) {
            return;
        }
        last_report = now;
        if (on_progress) {
            on_progress(written, job.total);
        }
    };

    // 3. Fetch
    FetchStatus status = FetchStatus::Complete;
    try {
        status = co_await fetch_with_retry(job, temp, on_chunk);
    } catch (const std::exception& e) {
        spdlog::error("[{}] Transfer failed: {}", job.token, e.what());
        co_return TransferOutcome::Failed(e.what());
    }

    if (status == FetchStatus::Cancelled) {
        spdlog::info("[{}] Transfer cancelled.", job.token);
        co_return TransferOutcome::Cancelled();
    }

    // 4. Commit
    auto outcome = commit(job, temp);
    if (outcome.kind == OutcomeKind::Success) {
        guard.disarm();
        spdlog::info("[{}] Transfer complete: {}", job.token, outcome.path.string());
    }
    co_return outcome;
}

asio::awaitable<FetchStatus> TransferRunner::fetch_with_retry(const Job& job,
                                                              const std::filesystem::path& temp,
                                                              const ChunkCallback& on_chunk) {
    auto backoff = options_.retry_backoff;

    for (int attempt = 1;; ++attempt) {
        if (job.cancel && job.cancel->load()) {
            co_return FetchStatus::Cancelled;
        }

        std::string error;
        bool transient = false;
        try {
            co_return co_await fetcher_->Fetch(job.handle, temp, on_chunk, job.cancel);
        } catch (const FetchError& e) {
            error = e.what();
            transient = e.transient();
        } catch (const boost::system::system_error& e) {
            // Socket and file errors from Asio: the connection is worth another try.
            error = e.what();
            transient = true;
        }

        if (!transient) {
            throw FetchError(error, false);
        }
        if (attempt >= options_.max_attempts) {
            throw FetchError(error + " (gave up after " + std::to_string(attempt) + " attempts)",
                             true);
        }

        spdlog::warn("[{}] Attempt {}/{} failed: {}. Retrying in {} ms.", job.token, attempt,
                     options_.max_attempts, error, backoff.count());

        asio::steady_timer timer(co_await asio::this_coro::executor);
        const auto wake = std::chrono::steady_clock::now() + backoff;
        while (std::chrono::steady_clock::now() < wake) {
            if (job.cancel && job.cancel->load()) {
                co_return FetchStatus::Cancelled;
            }
            timer.expires_after(std::min<std::chrono::steady_clock::duration>(
                CANCEL_POLL, wake - std::chrono::steady_clock::now()));
            co_await timer.async_wait(asio::use_awaitable);
        }
        backoff *= 2;
    }
}

TransferOutcome TransferRunner::commit(const Job& job, const std::filesystem::path& temp) {
    std::error_code ec;
    std::filesystem::path final_path = job.destination;

    // Somebody may have put a file there while we were downloading.
    for (int attempt = 0;; ++attempt) {
        try {
            if (infra::MoveNoReplace(temp, final_path)) {
                break;
            }
            if (attempt >= MAX_COMMIT_ATTEMPTS) {
                return TransferOutcome::Failed("No free file name for " + job.destination.filename().string());
            }
            final_path = infra::UniqueDestination(final_path.parent_path(),
                                                  job.destination.filename().string());
        } catch (const std::exception& e) {
            return TransferOutcome::Failed("Failed to move file into place: " + std::string(e.what()));
        }
        spdlog::info("[{}] Destination taken, using {}", job.token, final_path.string());
    }

#if defined(__linux__)
    using std::filesystem::perms;
    std::filesystem::permissions(final_path,
                                 perms::owner_read | perms::owner_write | perms::group_read |
                                     perms::group_write | perms::others_read,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("[{}] Could not set permissions on {}: {}", job.token, final_path.string(),
                     ec.message());
    }
#endif

    return TransferOutcome::Success(std::move(final_path));
}

}  // namespace courier::core
