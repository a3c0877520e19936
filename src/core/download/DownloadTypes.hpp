#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace courier::core {

using Token = std::string;

// Shared between the registry entry and the runner. Checked between chunks.
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

inline CancelFlag MakeCancelFlag() { return std::make_shared<std::atomic<bool>>(false); }

/**
 * @brief Builds the correlation token for a file message ("<chat_id>:<message_id>").
 */
inline Token MakeToken(std::int64_t chat_id, std::int64_t message_id) {
    return std::to_string(chat_id) + ":" + std::to_string(message_id);
}

struct FetchHandle {
    std::string file_id;
    std::string file_unique_id;
};

/**
 * @brief Immutable description of an inbound file-bearing message.
 */
struct FileAnnouncement {
    Token token;
    std::int64_t sender_id = 0;
    std::int64_t chat_id = 0;
    std::int64_t message_id = 0;
    std::string filename;
    std::uint64_t size = 0;
    FetchHandle handle;
};

enum class Status { AwaitingConfirmation, InProgress, Completed, Declined, Failed };

constexpr std::string_view ToString(Status s) {
    switch (s) {
        case Status::AwaitingConfirmation:
            return "awaiting confirmation";
        case Status::InProgress:
            return "downloading";
        case Status::Completed:
            return "completed";
        case Status::Declined:
            return "declined";
        case Status::Failed:
            return "failed";
    }
    return "unknown";
}

/**
 * @brief One awaiting-confirmation or in-progress transfer.
 * Owned by PendingRegistry; everybody else only ever sees copies.
 */
struct PendingDownload {
    FileAnnouncement announcement;
    Status status = Status::AwaitingConfirmation;
    std::chrono::system_clock::time_point created_at;
    std::filesystem::path destination;
    CancelFlag cancel;

    std::optional<std::int64_t> prompt_message_id;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::uint64_t bytes_transferred = 0;

    const Token& token() const { return announcement.token; }
};

enum class RegistryError { AlreadyExists, NotFound, AlreadyActive };

constexpr std::string_view ToString(RegistryError e) {
    switch (e) {
        case RegistryError::AlreadyExists:
            return "already exists";
        case RegistryError::NotFound:
            return "not found";
        case RegistryError::AlreadyActive:
            return "already active";
    }
    return "unknown";
}

enum class OutcomeKind { Success, Failed, Cancelled };

/**
 * @brief Terminal result of one transfer, delivered exactly once.
 */
struct TransferOutcome {
    OutcomeKind kind = OutcomeKind::Failed;
    std::filesystem::path path;  // Success only
    std::string reason;          // Failed only

    static TransferOutcome Success(std::filesystem::path final_path) {
        return {OutcomeKind::Success, std::move(final_path), {}};
    }
    static TransferOutcome Failed(std::string why) { return {OutcomeKind::Failed, {}, std::move(why)}; }
    static TransferOutcome Cancelled() { return {OutcomeKind::Cancelled, {}, {}}; }
};

}  // namespace courier::core
