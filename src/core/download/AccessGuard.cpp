#include "AccessGuard.hpp"

namespace courier::core {

bool AccessGuard::Authorize(std::int64_t sender_id, std::int64_t chat_id) const noexcept {
    return sender_id == operator_id_ && chat_id == chat_id_;
}

}  // namespace courier::core
