#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/stream_file.hpp>
#include <filesystem>
#include <memory>
#include <string>

#include "BotApiClient.hpp"
#include "Config.hpp"
#include "IFetcher.hpp"
#include "Types.hpp"

namespace courier::network {

/**
 * @brief Maps a local-mode `file_path` reported by the Bot API server onto
 * this host's view of the server's storage.
 *
 * The server reports paths such as `/var/lib/telegram-bot-api/<token>/documents/file_3.pdf`.
 * When the storage is mounted elsewhere (@p bot_api_dir), everything after the
 * token directory is re-rooted under `<bot_api_dir>/<token>/`. Without a
 * @p bot_api_dir the path is used as is.
 */
std::filesystem::path ResolveLocalPath(const std::filesystem::path& file_path,
                                       const std::filesystem::path& bot_api_dir,
                                       const std::string& token);

/**
 * @brief Moves one Telegram file onto local disk.
 *
 * @details
 * **Lifecycle:** `getFile` first. An absolute path means the server runs in
 * `--local` mode and the bytes are already on this machine, so they are copied
 * from its storage. A relative path is streamed over HTTP from
 * `/file/bot<token>/<file_path>`.
 *
 * **Memory:** Both paths move data through a pooled chunk buffer; the body is
 * never held in RAM.
 */
class BotFileFetcher : public core::IFetcher {
   public:
    BotFileFetcher(std::shared_ptr<BotApiClient> client, core::DownloadConfig cfg);

    asio::awaitable<core::FetchStatus> Fetch(const core::FetchHandle& handle,
                                             const std::filesystem::path& temp_path,
                                             core::ChunkCallback on_chunk,
                                             core::CancelFlag cancel) override;

   protected:
    // getFile: the server's path for @p handle. Throws FetchError.
    virtual asio::awaitable<std::string> resolve_file_path(const core::FetchHandle& handle);

   private:

    asio::awaitable<core::FetchStatus> copy_local(const std::filesystem::path& source,
                                                  const std::filesystem::path& temp_path,
                                                  const core::ChunkCallback& on_chunk,
                                                  const core::CancelFlag& cancel);

    asio::awaitable<core::FetchStatus> download_remote(const std::string& file_path,
                                                       const std::filesystem::path& temp_path,
                                                       const core::ChunkCallback& on_chunk,
                                                       const core::CancelFlag& cancel);

    asio::stream_file open_temp(const asio::any_io_executor& executor,
                                const std::filesystem::path& temp_path) const;

    std::size_t chunk_size() const noexcept { return cfg_.chunk_size_kb * 1024; }

    std::shared_ptr<BotApiClient> client_;
    core::DownloadConfig cfg_;
};

}  // namespace courier::network
