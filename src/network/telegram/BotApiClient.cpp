#include "BotApiClient.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/url.hpp>

namespace courier::network {

namespace {

// Replies are small JSON documents; getUpdates batches stay well below this.
constexpr std::uint64_t MAX_RESPONSE_BODY = 16ULL * 1024 * 1024;

constexpr const char* USER_AGENT = "courier-bot";

}  // namespace

BotApiClient::BotApiClient(core::BotConfig cfg) : cfg_(std::move(cfg)) {
    spdlog::debug("BotApiClient targeting {}:{}", cfg_.api_host, cfg_.api_port);
}

std::string BotApiClient::method_target(std::string_view method) const {
    return "/bot" + cfg_.token + "/" + std::string(method);
}

std::string BotApiClient::FileTarget(std::string_view file_path) const {
    boost::urls::url target;
    target.set_path_absolute(true);
    auto segments = target.segments();
    segments.push_back("file");
    segments.push_back("bot" + cfg_.token);

    std::string_view rest = file_path;
    while (!rest.empty()) {
        auto slash = rest.find('/');
        auto part = rest.substr(0, slash);
        if (!part.empty()) {
            segments.push_back(part);
        }
        if (slash == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(slash + 1);
    }
    return std::string(target.encoded_path());
}

asio::awaitable<json::value> BotApiClient::Call(std::string method, json::object params) {
    return Call(std::move(method), std::move(params),
                std::chrono::seconds(cfg_.request_timeout_seconds));
}

asio::awaitable<json::value> BotApiClient::Call(std::string method, json::object params,
                                                std::chrono::seconds timeout) {
    auto executor = co_await asio::this_coro::executor;
    tcp::resolver resolver(executor);
    beast::tcp_stream stream(executor);

    // 1. Connect (one-shot connection per call)
    stream.expires_after(timeout);
    auto endpoints = co_await resolver.async_resolve(cfg_.api_host, cfg_.api_port, asio::use_awaitable);
    co_await stream.async_connect(endpoints, asio::use_awaitable);

    // 2. Request
    http::request<http::string_body> req{http::verb::post, method_target(method), 11};
    req.set(http::field::host, cfg_.api_port == "80" ? cfg_.api_host : cfg_.api_host + ":" + cfg_.api_port);
    req.set(http::field::user_agent, USER_AGENT);
    req.set(http::field::content_type, "application/json");
    req.body() = json::serialize(params);
    req.prepare_payload();

    co_await http::async_write(stream, req, asio::use_awaitable);

    // 3. Response
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_RESPONSE_BODY);
    co_await http::async_read(stream, buffer, parser, asio::use_awaitable);
    auto res = parser.release();

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    // 4. Unwrap {"ok": ..., "result": ...}
    boost::system::error_code jec;
    json::value reply = json::parse(res.body(), jec);
    if (jec || !reply.is_object()) {
        spdlog::error("[BotApi] {} returned HTTP {} with a non-JSON body", method, res.result_int());
        throw BotApiError(static_cast<int>(res.result_int()), "Unexpected reply to " + method);
    }

    const auto& obj = reply.as_object();
    if (const auto* ok = obj.if_contains("ok"); ok && ok->is_bool() && ok->as_bool()) {
        if (const auto* result = obj.if_contains("result")) {
            co_return *result;
        }
        co_return json::value{};
    }

    int code = static_cast<int>(res.result_int());
    if (const auto* c = obj.if_contains("error_code"); c && c->is_int64()) {
        code = static_cast<int>(c->as_int64());
    }
    std::string description = "unknown error";
    if (const auto* d = obj.if_contains("description"); d && d->is_string()) {
        description = std::string(d->as_string());
    }
    spdlog::debug("[BotApi] {} failed: {} {}", method, code, description);
    throw BotApiError(code, description);
}

}  // namespace courier::network
