#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace courier::infra {

/**
 * @brief RAII guard over an in-flight temporary file.
 * Removes the file on destruction unless the transfer committed it.
 */
class PartialFileGuard {
   public:
    explicit PartialFileGuard(std::filesystem::path path) : path_(std::move(path)) {}

    // Called once the file has been renamed into place.
    void disarm() noexcept { engaged_ = false; }

    ~PartialFileGuard() {
        if (!engaged_ || path_.empty()) {
            return;
        }
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            return;
        }
        std::filesystem::remove(path_, ec);
        if (ec) {
            spdlog::warn("Failed to remove temporary file {}: {}", path_.string(), ec.message());
        } else {
            spdlog::debug("Removed temporary file {}", path_.string());
        }
    }

    PartialFileGuard(const PartialFileGuard&) = delete;
    PartialFileGuard& operator=(const PartialFileGuard&) = delete;
    PartialFileGuard(PartialFileGuard&&) = delete;
    PartialFileGuard& operator=(PartialFileGuard&&) = delete;

   private:
    std::filesystem::path path_;
    bool engaged_ = true;
};

}  // namespace courier::infra
