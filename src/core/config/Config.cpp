#include "Config.hpp"

#include <spdlog/spdlog.h>

#include <boost/url/parse.hpp>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <toml++/toml.hpp>

namespace courier::core {

namespace {

template <class T>
T parse_number(const std::string& text, const char* name) {
    T value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        throw ConfigurationError(std::string(name) + " must be a number, got '" + text + "'");
    }
    return value;
}

}  // namespace

AppConfig LoadConfig(const std::string& path) {
    AppConfig config;

    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults and environment.", path);
        return config;
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw ConfigurationError("Config parse error: " + std::string(err.description()));
    }

    // 1. Bot API
    if (auto bot = tbl["bot"]) {
        config.bot.token = bot["token"].value_or("");
        config.bot.api_url = bot["api_url"].value_or("http://127.0.0.1:8081");
        config.bot.long_poll_seconds = bot["long_poll_seconds"].value_or(config.bot.long_poll_seconds);
        config.bot.request_timeout_seconds =
            bot["request_timeout_seconds"].value_or(config.bot.request_timeout_seconds);
        config.bot.file_timeout_seconds = bot["file_timeout_seconds"].value_or(config.bot.file_timeout_seconds);
        config.bot.poll_retry_delay_ms = bot["poll_retry_delay_ms"].value_or(config.bot.poll_retry_delay_ms);
    }

    // 2. Access
    if (auto access = tbl["access"]) {
        config.access.operator_id = access["operator_id"].value<std::int64_t>();
        config.access.chat_id = access["chat_id"].value<std::int64_t>();
    }

    // 3. Downloads
    if (auto dl = tbl["download"]) {
        config.download.directory = dl["directory"].value_or("");
        config.download.bot_api_dir = dl["bot_api_dir"].value_or("");
        config.download.remove_source = dl["remove_source"].value_or(config.download.remove_source);
        config.download.max_concurrent = dl["max_concurrent"].value_or(config.download.max_concurrent);
        config.download.max_attempts = dl["max_attempts"].value_or(config.download.max_attempts);
        config.download.retry_backoff_ms = dl["retry_backoff_ms"].value_or(config.download.retry_backoff_ms);
        config.download.progress_interval_ms =
            dl["progress_interval_ms"].value_or(config.download.progress_interval_ms);
        config.download.confirmation_timeout_seconds =
            dl["confirmation_timeout_seconds"].value_or(config.download.confirmation_timeout_seconds);
        config.download.chunk_size_kb = dl["chunk_size_kb"].value_or(config.download.chunk_size_kb);
    }

    // 4. Runtime & logging
    if (auto runtime = tbl["runtime"]) {
        config.runtime.transfer_threads = runtime["transfer_threads"].value_or(config.runtime.transfer_threads);
    }
    if (auto log = tbl["log"]) {
        config.log.level = log["level"].value_or("info");
    }

    spdlog::info("Loaded configuration from {}", path);
    return config;
}

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

void ApplyEnvironment(AppConfig& config, const EnvLookup& lookup) {
    if (auto v = lookup("BOT_TOKEN")) config.bot.token = *v;
    if (auto v = lookup("BOT_API_URL")) config.bot.api_url = *v;
    if (auto v = lookup("BOT_API_DIR")) config.download.bot_api_dir = *v;
    if (auto v = lookup("DOWNLOAD_TO_DIR")) config.download.directory = *v;
    if (auto v = lookup("OPERATOR_ID")) {
        config.access.operator_id = parse_number<std::int64_t>(*v, "OPERATOR_ID");
    }
    if (auto v = lookup("OPERATOR_CHAT_ID")) {
        config.access.chat_id = parse_number<std::int64_t>(*v, "OPERATOR_CHAT_ID");
    }
    if (auto v = lookup("MAX_CONCURRENT_DOWNLOADS")) {
        config.download.max_concurrent = parse_number<unsigned int>(*v, "MAX_CONCURRENT_DOWNLOADS");
    }
    if (auto v = lookup("LOG_LEVEL")) config.log.level = *v;
}

void ValidateConfig(AppConfig& config) {
    if (config.bot.token.empty()) {
        throw ConfigurationError("Bot token is missing (bot.token or BOT_TOKEN)");
    }
    if (!config.access.operator_id) {
        throw ConfigurationError("Operator id is missing (access.operator_id or OPERATOR_ID)");
    }
    if (!config.access.chat_id) {
        throw ConfigurationError("Chat id is missing (access.chat_id or OPERATOR_CHAT_ID)");
    }
    if (config.download.directory.empty()) {
        throw ConfigurationError("Download directory is missing (download.directory or DOWNLOAD_TO_DIR)");
    }
    if (config.download.max_concurrent < 1) {
        throw ConfigurationError("download.max_concurrent must be at least 1");
    }
    if (config.download.max_attempts < 1) {
        throw ConfigurationError("download.max_attempts must be at least 1");
    }
    if (config.download.chunk_size_kb < 1) {
        throw ConfigurationError("download.chunk_size_kb must be at least 1");
    }
    if (config.runtime.transfer_threads < 1) {
        throw ConfigurationError("runtime.transfer_threads must be at least 1");
    }

    auto url = boost::urls::parse_uri(config.bot.api_url);
    if (!url) {
        throw ConfigurationError("Invalid bot.api_url '" + config.bot.api_url + "'");
    }
    if (url->scheme() != "http") {
        throw ConfigurationError("bot.api_url must use http://, got '" + config.bot.api_url + "'");
    }
    if (url->host().empty()) {
        throw ConfigurationError("bot.api_url has no host: '" + config.bot.api_url + "'");
    }
    config.bot.api_host = std::string(url->host());
    config.bot.api_port = url->has_port() ? std::string(url->port()) : std::string("80");
}

}  // namespace courier::core
