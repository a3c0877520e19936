#pragma once

#include <cstdint>

namespace courier::core {

/**
 * @brief Admits events from the single configured operator in the single configured chat.
 */
class AccessGuard {
   public:
    AccessGuard(std::int64_t operator_id, std::int64_t chat_id)
        : operator_id_(operator_id), chat_id_(chat_id) {}

    bool Authorize(std::int64_t sender_id, std::int64_t chat_id) const noexcept;

    std::int64_t operator_id() const noexcept { return operator_id_; }
    std::int64_t chat_id() const noexcept { return chat_id_; }

   private:
    std::int64_t operator_id_;
    std::int64_t chat_id_;
};

}  // namespace courier::core
