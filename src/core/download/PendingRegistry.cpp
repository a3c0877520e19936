#include "PendingRegistry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "Destination.hpp"

namespace courier::core {

PendingRegistry::PendingRegistry(std::filesystem::path download_dir)
    : download_dir_(std::move(download_dir)) {}

bool PendingRegistry::is_reserved_locked(const std::filesystem::path& p) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const auto& kv) { return kv.second.destination == p; });
}

PendingRegistry::Result PendingRegistry::Create(const FileAnnouncement& announcement) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (entries_.contains(announcement.token)) {
        return std::unexpected(RegistryError::AlreadyExists);
    }

    const std::string fallback = "file_" + std::to_string(announcement.message_id);
    const std::string name = infra::SanitizeFilename(announcement.filename, fallback);

    PendingDownload entry;
    entry.announcement = announcement;
    entry.status = Status::AwaitingConfirmation;
    entry.created_at = std::chrono::system_clock::now();
    entry.destination = infra::UniqueDestination(
        download_dir_, name, [this](const std::filesystem::path& p) { return is_reserved_locked(p); });
    entry.cancel = MakeCancelFlag();

    spdlog::debug("[Registry] {} -> {}", announcement.token, entry.destination.string());

    auto [it, inserted] = entries_.emplace(announcement.token, std::move(entry));
    return it->second;
}

PendingRegistry::Result PendingRegistry::TryActivate(const Token& token) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(token);
    if (it == entries_.end()) {
        return std::unexpected(RegistryError::NotFound);
    }
    if (it->second.status != Status::AwaitingConfirmation) {
        return std::unexpected(RegistryError::AlreadyActive);
    }

    it->second.status = Status::InProgress;
    it->second.started_at = std::chrono::system_clock::now();
    return it->second;
}

PendingRegistry::Result PendingRegistry::Decline(const Token& token) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(token);
    if (it == entries_.end() || it->second.status != Status::AwaitingConfirmation) {
        return std::unexpected(RegistryError::NotFound);
    }

    PendingDownload removed = std::move(it->second);
    entries_.erase(it);
    removed.status = Status::Declined;
    return removed;
}

std::optional<PendingDownload> PendingRegistry::Resolve(const Token& token, OutcomeKind outcome) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(token);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    PendingDownload removed = std::move(it->second);
    entries_.erase(it);
    // Cancelled has no Status of its own: the snapshot keeps the state it was removed in.
    if (outcome == OutcomeKind::Success) {
        removed.status = Status::Completed;
    } else if (outcome == OutcomeKind::Failed) {
        removed.status = Status::Failed;
    }
    return removed;
}

bool PendingRegistry::AttachPrompt(const Token& token, std::int64_t message_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(token);
    if (it == entries_.end()) {
        return false;
    }
    it->second.prompt_message_id = message_id;
    return true;
}

void PendingRegistry::RecordProgress(const Token& token, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = entries_.find(token); it != entries_.end()) {
        it->second.bytes_transferred = bytes;
    }
}

bool PendingRegistry::Cancel(const Token& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(token);
    if (it == entries_.end() || it->second.status != Status::InProgress) {
        return false;
    }
    it->second.cancel->store(true);
    return true;
}

std::size_t PendingRegistry::CancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (auto& [token, entry] : entries_) {
        if (entry.status == Status::InProgress && !entry.cancel->exchange(true)) {
            ++count;
        }
    }
    return count;
}

std::optional<PendingDownload> PendingRegistry::Get(const Token& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(token);
    return (it != entries_.end()) ? std::optional<PendingDownload>(it->second) : std::nullopt;
}

std::optional<std::chrono::system_clock::time_point> PendingRegistry::PendingSince(
    const Token& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(token);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.created_at;
}

std::vector<PendingDownload> PendingRegistry::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PendingDownload> out;
    out.reserve(entries_.size());
    for (const auto& [token, entry] : entries_) {
        out.push_back(entry);
    }
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b) { return a.created_at < b.created_at; });
    return out;
}

std::size_t PendingRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace courier::core
