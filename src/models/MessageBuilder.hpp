#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "DownloadTypes.hpp"
#include "IChatTransport.hpp"

namespace courier::models {

// Callback data prefixes carried by the confirmation buttons.
inline constexpr std::string_view YES_PREFIX = "yes:";
inline constexpr std::string_view NO_PREFIX = "no:";

// Command menu, also registered with setMyCommands.
inline constexpr std::array<std::pair<std::string_view, std::string_view>, 7> BOT_COMMANDS{{
    {"/start", "Start the bot"},
    {"/help", "Get help"},
    {"/info", "Get user and chat info"},
    {"/storage", "Get available storage information"},
    {"/status", "Get downloading files status"},
    {"/cancel", "Cancel all running downloads"},
    {"/ip", "Get ip address"},
}};

std::string EscapeHtml(std::string_view text);

// "512 B", "1.50 KB", "4.66 GB"
std::string FormatSize(std::uint64_t bytes);

// "4s", "2m 05s", "1h 02m 03s"
std::string FormatDuration(std::chrono::seconds duration);

/**
 * @brief Builds every user-visible text the bot sends (HTML parse mode).
 */
class MessageBuilder {
   public:
    static core::InlineKeyboard ConfirmationKeyboard(const core::Token& token);

    static std::string ConfirmationPrompt(const core::PendingDownload& entry);
    static std::string Downloading(const core::PendingDownload& entry, std::uint64_t transferred,
                                   std::uint64_t total);
    static std::string Queued(const core::PendingDownload& entry);
    static std::string Declined(const core::PendingDownload& entry);
    static std::string Expired(const core::PendingDownload& entry);

    static std::string Completed(const core::PendingDownload& entry,
                                 const std::filesystem::path& final_path,
                                 std::chrono::system_clock::time_point finished_at);
    static std::string Failed(const core::PendingDownload& entry, std::string_view reason);
    static std::string Cancelled(const core::PendingDownload& entry);

    // Final text of the prompt message once its transfer ended.
    static std::string PromptClosed(const core::PendingDownload& entry, core::OutcomeKind outcome);

    static std::string StatusList(const std::vector<core::PendingDownload>& entries,
                                  std::chrono::system_clock::time_point now);

    static std::string Start(std::string_view user_name, std::int64_t user_id);
    static std::string Help(const std::filesystem::path& download_dir);
    static std::string Info(std::int64_t user_id, std::int64_t chat_id);
    static std::string Storage(const std::filesystem::path& dir, std::uint64_t capacity,
                               std::uint64_t available);
    static std::string DefaultReply();

   private:
    static std::string file_details(const core::PendingDownload& entry);
};

}  // namespace courier::models
