#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "DownloadTypes.hpp"

namespace courier::core {

/**
 * @brief Single source of truth for every announced file, keyed by token.
 *
 * @details
 * All mutations run under one mutex, so operations on the same token are
 * linearized: a double "Yes" activates once, and a decline racing a completion
 * sees a consistent entry. Entries never leave the registry by reference;
 * every accessor hands out a snapshot.
 */
class PendingRegistry {
   public:
    using Result = std::expected<PendingDownload, RegistryError>;

    explicit PendingRegistry(std::filesystem::path download_dir);

    PendingRegistry(const PendingRegistry&) = delete;
    PendingRegistry& operator=(const PendingRegistry&) = delete;

    /**
     * @brief Registers a new announcement in AwaitingConfirmation.
     * Computes a collision-free destination, also avoiding paths reserved by
     * other live entries.
     * @return The new entry, or AlreadyExists on redelivery of the same token.
     */
    Result Create(const FileAnnouncement& announcement);

    /**
     * @brief AwaitingConfirmation -> InProgress.
     * @return NotFound if the token is gone, AlreadyActive if it was already activated.
     */
    Result TryActivate(const Token& token);

    /**
     * @brief AwaitingConfirmation -> Declined, removing the entry.
     * An entry that is already in progress is left alone and reported as NotFound.
     */
    Result Decline(const Token& token);

    /**
     * @brief Removes the entry with its terminal outcome.
     * @return The removed entry, or nullopt if it was already gone.
     */
    std::optional<PendingDownload> Resolve(const Token& token, OutcomeKind outcome);

    bool AttachPrompt(const Token& token, std::int64_t message_id);
    void RecordProgress(const Token& token, std::uint64_t bytes);

    // Raises the cancel flag of an in-progress entry.
    bool Cancel(const Token& token);
    std::size_t CancelAll();

    std::optional<PendingDownload> Get(const Token& token) const;
    std::optional<std::chrono::system_clock::time_point> PendingSince(const Token& token) const;
    std::vector<PendingDownload> List() const;
    std::size_t Size() const;

   private:
    bool is_reserved_locked(const std::filesystem::path& p) const;

    mutable std::mutex mutex_;
    std::filesystem::path download_dir_;
    std::unordered_map<Token, PendingDownload> entries_;
};

}  // namespace courier::core
