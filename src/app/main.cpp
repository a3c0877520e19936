// 1. Standard Library
#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <vector>

// 2. Third Party
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "Bot.hpp"
#include "Config.hpp"

namespace {

constexpr const char* DEFAULT_CONFIG = "config.toml";
constexpr const char* LOG_FILE = "logs/courier.log";

// Console and rotating file (5MB x 3). Level is refined once the config is loaded.
void setup_logging() {
    constexpr std::size_t MAX_SIZE = 1024 * 1024 * 5;
    constexpr std::size_t MAX_FILES = 3;

    std::vector<spdlog::sink_ptr> sinks{
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(LOG_FILE, MAX_SIZE, MAX_FILES),
    };

    auto logger = std::make_shared<spdlog::logger>("courier", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::set_level(spdlog::level::info);
    spdlog::flush_on(spdlog::level::info);
}

void apply_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}', keeping info", name);
        return;
    }
    spdlog::set_level(level);
    spdlog::flush_on(level);
}

// File, then environment, then validation. Throws ConfigurationError.
courier::core::AppConfig load_configuration(int argc, char* argv[]) {
    const std::string path = argc > 1 ? argv[1] : DEFAULT_CONFIG;
    auto config = courier::core::LoadConfig(path);
    courier::core::ApplyEnvironment(config);
    courier::core::ValidateConfig(config);
    return config;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        setup_logging();

        auto config = load_configuration(argc, argv);
        apply_log_level(config.log.level);

        boost::asio::io_context main_ioc;
        auto bot = std::make_shared<courier::network::Bot>(main_ioc, config);

        // SIGINT / SIGTERM: cancel transfers and leave the event loop.
        boost::asio::signal_set signals(main_ioc, SIGINT, SIGTERM);
        signals.async_wait([&bot](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            spdlog::info("Stop signal ({}) received. Shutting down...", signal_number);
            bot->Stop();
        });

        spdlog::info("Courier starting: Bot API {}, downloads to {}", config.bot.api_url,
                     config.download.directory);

        bot->Start();

        spdlog::info("Courier stopped.");

    } catch (const courier::core::ConfigurationError& e) {
        spdlog::critical("Configuration Error: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
