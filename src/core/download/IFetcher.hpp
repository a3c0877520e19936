#pragma once

#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>

#include "DownloadTypes.hpp"

namespace courier::core {

/**
 * @brief Raised by a fetcher. Transient errors are worth another attempt.
 */
class FetchError : public std::runtime_error {
   public:
    FetchError(const std::string& what, bool transient)
        : std::runtime_error(what), transient_(transient) {}

    bool transient() const noexcept { return transient_; }

   private:
    bool transient_;
};

enum class FetchStatus { Complete, Cancelled };

// Cumulative number of bytes written to the temporary file so far.
using ChunkCallback = std::function<void(std::uint64_t bytes_written)>;

/**
 * @brief Contract for the primitive that moves one remote file to local disk.
 *
 * @details
 * Implementations write to @p temp_path (truncating it), invoke @p on_chunk
 * after each chunk and check @p cancel between chunks. They throw FetchError
 * on failure and return Cancelled when the flag was observed.
 */
struct IFetcher {
    virtual ~IFetcher() = default;

    virtual boost::asio::awaitable<FetchStatus> Fetch(const FetchHandle& handle,
                                                      const std::filesystem::path& temp_path,
                                                      ChunkCallback on_chunk,
                                                      CancelFlag cancel) = 0;
};

}  // namespace courier::core
