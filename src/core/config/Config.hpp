#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace courier::core {

/**
 * @brief Raised for missing or malformed configuration. Fatal at startup.
 */
class ConfigurationError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

struct BotConfig {
    std::string token;
    std::string api_url = "http://127.0.0.1:8081";
    // Derived from api_url by ValidateConfig()
    std::string api_host;
    std::string api_port;
    unsigned int long_poll_seconds = 25;
    unsigned int request_timeout_seconds = 60;
    unsigned int file_timeout_seconds = 1000;
    unsigned int poll_retry_delay_ms = 5000;
};

struct AccessConfig {
    std::optional<std::int64_t> operator_id;
    std::optional<std::int64_t> chat_id;
};

struct DownloadConfig {
    std::string directory;
    // Host path of the local Bot API server's working directory (optional).
    std::string bot_api_dir;
    bool remove_source = true;
    unsigned int max_concurrent = 2;
    unsigned int max_attempts = 3;
    unsigned int retry_backoff_ms = 1000;
    unsigned int progress_interval_ms = 3000;
    unsigned int confirmation_timeout_seconds = 0;
    unsigned int chunk_size_kb = 512;
};

struct RuntimeConfig {
    unsigned int transfer_threads = 2;
};

struct LogConfig {
    std::string level = "info";
};

struct AppConfig {
    BotConfig bot;
    AccessConfig access;
    DownloadConfig download;
    RuntimeConfig runtime;
    LogConfig log;
};

/**
 * @brief Loads configuration from a TOML file.
 * A missing file is not an error: defaults are returned and the environment
 * is expected to supply the rest.
 * @param path Path to the .toml file (default: "config.toml")
 * @throws ConfigurationError if the file cannot be parsed.
 */
AppConfig LoadConfig(const std::string& path = "config.toml");

using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

// Reads the process environment.
std::optional<std::string> GetEnv(const char* name);

/**
 * @brief Overlays environment variables on top of @p config.
 * BOT_TOKEN, BOT_API_URL, BOT_API_DIR, DOWNLOAD_TO_DIR, OPERATOR_ID,
 * OPERATOR_CHAT_ID, MAX_CONCURRENT_DOWNLOADS, LOG_LEVEL.
 * @throws ConfigurationError on non-numeric ids or counts.
 */
void ApplyEnvironment(AppConfig& config, const EnvLookup& lookup = GetEnv);

/**
 * @brief Checks required fields and fills derived ones (api_host/api_port).
 * @throws ConfigurationError describing the first problem found.
 */
void ValidateConfig(AppConfig& config);

}  // namespace courier::core
