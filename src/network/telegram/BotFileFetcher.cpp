#include "BotFileFetcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <system_error>

#include "BufferPool.hpp"

namespace courier::network {

namespace {

constexpr std::size_t MEGABYTE = 1024 * 1024;

// Headers only; the body is read raw from the socket.
constexpr std::uint64_t MAX_BODY_LIMIT = 4ULL * 1024 * 1024 * 1024;

// Frequency of progress logging
constexpr std::size_t PROGRESS_LOG_MB = 100;

bool cancelled(const core::CancelFlag& cancel) { return cancel && cancel->load(); }

bool transient_status(unsigned status) { return status == 429 || status >= 500; }

}  // namespace

std::filesystem::path ResolveLocalPath(const std::filesystem::path& file_path,
                                       const std::filesystem::path& bot_api_dir,
                                       const std::string& token) {
    if (bot_api_dir.empty()) {
        return file_path;
    }

    std::filesystem::path rest;
    bool found = false;
    for (const auto& part : file_path) {
        if (found) {
            rest /= part;
        } else if (part == token) {
            found = true;
        }
    }

    if (!found || rest.empty()) {
        // Unexpected layout: keep the "<type>/<file>" tail.
        rest = file_path.parent_path().filename() / file_path.filename();
    }
    return bot_api_dir / token / rest;
}

BotFileFetcher::BotFileFetcher(std::shared_ptr<BotApiClient> client, core::DownloadConfig cfg)
    : client_(std::move(client)), cfg_(std::move(cfg)) {}

asio::awaitable<core::FetchStatus> BotFileFetcher::Fetch(const core::FetchHandle& handle,
                                                         const std::filesystem::path& temp_path,
                                                         core::ChunkCallback on_chunk,
                                                         core::CancelFlag cancel) {
    auto file_path = co_await resolve_file_path(handle);

    if (cancelled(cancel)) {
        co_return core::FetchStatus::Cancelled;
    }

    if (std::filesystem::path(file_path).is_absolute()) {
        auto source = ResolveLocalPath(file_path, cfg_.bot_api_dir, client_->config().token);
        co_return co_await copy_local(source, temp_path, on_chunk, cancel);
    }
    co_return co_await download_remote(file_path, temp_path, on_chunk, cancel);
}

asio::awaitable<std::string> BotFileFetcher::resolve_file_path(const core::FetchHandle& handle) {
    json::value result;
    try {
        // A local server fetches the whole file from Telegram before it answers.
        result = co_await client_->Call("getFile", {{"file_id", handle.file_id}},
                                        std::chrono::seconds(client_->config().file_timeout_seconds));
    } catch (const BotApiError& e) {
        throw core::FetchError("getFile failed: " + e.description(), e.transient());
    }

    const auto* path = result.is_object() ? result.as_object().if_contains("file_path") : nullptr;
    if (path == nullptr || !path->is_string() || path->as_string().empty()) {
        throw core::FetchError("getFile returned no file_path (file too big for this server?)", false);
    }
    spdlog::debug("getFile {} -> {}", handle.file_unique_id, path->as_string().c_str());
    co_return std::string(path->as_string());
}

asio::stream_file BotFileFetcher::open_temp(const asio::any_io_executor& executor,
                                            const std::filesystem::path& temp_path) const {
    asio::stream_file file(executor);
    boost::system::error_code ec;
    file.open(temp_path.string(),
              asio::stream_file::write_only | asio::stream_file::create | asio::stream_file::truncate, ec);
    if (ec) {
        throw core::FetchError("Failed to open " + temp_path.string() + ": " + ec.message(), false);
    }
    return file;
}

// ============================================================================
// Local Bot API storage
// ============================================================================

asio::awaitable<core::FetchStatus> BotFileFetcher::copy_local(const std::filesystem::path& source,
                                                              const std::filesystem::path& temp_path,
                                                              const core::ChunkCallback& on_chunk,
                                                              const core::CancelFlag& cancel) {
    auto executor = co_await asio::this_coro::executor;

    std::error_code fs_ec;
    if (!std::filesystem::is_regular_file(source, fs_ec)) {
        throw core::FetchError("Source file not found: " + source.string(), false);
    }

    asio::stream_file in(executor);
    boost::system::error_code ec;
    in.open(source.string(), asio::stream_file::read_only, ec);
    if (ec) {
        throw core::FetchError("Failed to open " + source.string() + ": " + ec.message(), false);
    }
    auto out = open_temp(executor, temp_path);

    spdlog::info("Copying {} from Bot API storage", source.string());

    auto shared_buf = infra::BufferPool::Instance().Acquire(chunk_size());
    std::vector<std::uint8_t>& buf = *shared_buf;
    std::uint64_t total_written = 0;

    for (;;) {
        if (cancelled(cancel)) {
            co_return core::FetchStatus::Cancelled;
        }

        auto [read_ec, bytes_read] =
            co_await in.async_read_some(asio::buffer(buf), asio::as_tuple(asio::use_awaitable));
        if (read_ec == asio::error::eof || (!read_ec && bytes_read == 0)) {
            break;
        }
        if (read_ec) {
            throw boost::system::system_error(read_ec, "Read from " + source.string());
        }

        total_written += co_await asio::async_write(out, asio::buffer(buf.data(), bytes_read),
                                                    asio::use_awaitable);
        if (on_chunk) {
            on_chunk(total_written);
        }
    }

    in.close(ec);
    out.close(ec);

    if (cfg_.remove_source) {
        std::filesystem::remove(source, fs_ec);
        if (fs_ec) {
            spdlog::warn("Could not remove {} from Bot API storage: {}", source.string(), fs_ec.message());
        }
    }

    co_return core::FetchStatus::Complete;
}

// ============================================================================
// Remote download over HTTP
// ============================================================================

asio::awaitable<core::FetchStatus> BotFileFetcher::download_remote(const std::string& file_path,
                                                                   const std::filesystem::path& temp_path,
                                                                   const core::ChunkCallback& on_chunk,
                                                                   const core::CancelFlag& cancel) {
    const auto& bot = client_->config();
    const auto idle_timeout = std::chrono::seconds(bot.request_timeout_seconds);

    auto executor = co_await asio::this_coro::executor;
    tcp::resolver resolver(executor);
    beast::tcp_stream stream(executor);

    // 1. Connect & request
    stream.expires_after(idle_timeout);
    auto endpoints = co_await resolver.async_resolve(bot.api_host, bot.api_port, asio::use_awaitable);
    co_await stream.async_connect(endpoints, asio::use_awaitable);

    http::request<http::empty_body> req{http::verb::get, client_->FileTarget(file_path), 11};
    req.set(http::field::host, bot.api_port == "80" ? bot.api_host : bot.api_host + ":" + bot.api_port);
    req.set(http::field::user_agent, "courier-bot");
    co_await http::async_write(stream, req, asio::use_awaitable);

    // 2. Headers (empty_body keeps the file out of RAM)
    beast::flat_buffer header_buffer;
    http::response_parser<http::empty_body> parser;
    parser.body_limit(MAX_BODY_LIMIT);
    co_await http::async_read_header(stream, header_buffer, parser, asio::use_awaitable);

    const auto& response = parser.get();
    if (response.result() != http::status::ok) {
        const auto status = response.result_int();
        spdlog::error("File download failed [{}] for {}", status, file_path);
        throw core::FetchError("HTTP " + std::to_string(status) + " while downloading file",
                               transient_status(status));
    }

    std::uint64_t expected_size = 0;
    if (auto len = parser.content_length()) {
        expected_size = *len;
        spdlog::info("Downloading {} ({:.2f} MB)", file_path, expected_size / static_cast<double>(MEGABYTE));
    } else {
        spdlog::warn("File response missing Content-Length. Progress unknown.");
    }

    // 3. Body
    auto file = open_temp(executor, temp_path);
    std::uint64_t total_written = 0;
    std::size_t last_logged_mb = 0;

    // async_read_header may already have pulled body bytes into the header buffer.
    if (header_buffer.size() > 0) {
        total_written += co_await asio::async_write(file, header_buffer.data(), asio::use_awaitable);
        header_buffer.consume(header_buffer.size());
        if (on_chunk) {
            on_chunk(total_written);
        }
    }

    auto shared_buf = infra::BufferPool::Instance().Acquire(chunk_size());
    std::vector<std::uint8_t>& buf = *shared_buf;

    while (expected_size == 0 || total_written < expected_size) {
        if (cancelled(cancel)) {
            co_return core::FetchStatus::Cancelled;
        }

        std::size_t want = buf.size();
        if (expected_size > 0) {
            want = static_cast<std::size_t>(std::min<std::uint64_t>(want, expected_size - total_written));
        }

        stream.expires_after(idle_timeout);
        auto [ec, bytes_read] = co_await stream.async_read_some(asio::buffer(buf.data(), want),
                                                                asio::as_tuple(asio::use_awaitable));
        if (ec == asio::error::eof || (!ec && bytes_read == 0)) {
            break;
        }
        if (ec) {
            throw boost::system::system_error(ec, "Reading file body");
        }

        total_written += co_await asio::async_write(file, asio::buffer(buf.data(), bytes_read),
                                                    asio::use_awaitable);
        if (on_chunk) {
            on_chunk(total_written);
        }

        std::size_t current_mb = total_written / MEGABYTE;
        if (current_mb >= last_logged_mb + PROGRESS_LOG_MB) {
            spdlog::debug("... {} MB downloaded", current_mb);
            last_logged_mb = current_mb;
        }
    }

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    if (expected_size > 0 && total_written != expected_size) {
        throw core::FetchError("Connection closed after " + std::to_string(total_written) + " of " +
                                   std::to_string(expected_size) + " bytes",
                               true);
    }

    co_return core::FetchStatus::Complete;
}

}  // namespace courier::network
