#pragma once

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "DownloadTypes.hpp"
#include "IFetcher.hpp"
#include "TransferPool.hpp"

namespace courier::core {

struct RunnerOptions {
    int max_attempts = 3;
    std::chrono::milliseconds retry_backoff{1000};
    std::chrono::milliseconds progress_interval{3000};
};

using ProgressCallback = std::function<void(std::uint64_t transferred, std::uint64_t total)>;
using DoneCallback = std::function<void(TransferOutcome)>;

/**
 * @brief Drives one transfer from remote handle to its destination path.
 *
 * @details
 * Each Start() launches an independent coroutine on a pool io_context:
 * bytes go into a private temporary file next to the destination, which is
 * renamed into place only on success. Transient fetch errors are retried with
 * exponential backoff, and a cancel request also ends the wait. Callbacks run on the pool thread; `on_done` fires
 * exactly once and nothing is thrown past this boundary.
 */
class TransferRunner : public std::enable_shared_from_this<TransferRunner> {
   public:
    TransferRunner(infra::TransferPool& pool, std::shared_ptr<IFetcher> fetcher,
                   RunnerOptions options = {});

    void Start(const PendingDownload& pending, ProgressCallback on_progress, DoneCallback on_done);

   private:
    struct Job {
        Token token;
        FetchHandle handle;
        std::uint64_t total = 0;
        std::filesystem::path destination;
        CancelFlag cancel;
    };

    asio::awaitable<TransferOutcome> run(Job job, ProgressCallback on_progress);
    asio::awaitable<FetchStatus> fetch_with_retry(const Job& job, const std::filesystem::path& temp,
                                                  const ChunkCallback& on_chunk);
    TransferOutcome commit(const Job& job, const std::filesystem::path& temp);

    infra::TransferPool& pool_;
    std::shared_ptr<IFetcher> fetcher_;
    RunnerOptions options_;
};

}  // namespace courier::core
