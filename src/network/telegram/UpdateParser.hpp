#pragma once

#include <cstdint>
#include <optional>

#include "InboundEvent.hpp"
#include "Types.hpp"

namespace courier::network {

// `update_id` of a raw update, used to advance the getUpdates offset.
std::optional<std::int64_t> UpdateId(const json::object& update);

/**
 * @brief Classifies one Bot API update.
 *
 * - message with document / video / audio  -> FileAnnouncement
 * - message text starting with '/'        -> CommandMessage
 * - other message text                     -> TextMessage
 * - callback_query "yes:<token>"/"no:<token>" -> ButtonPress
 *
 * @return nullopt for anything else (stickers, edits, malformed payloads).
 */
std::optional<core::InboundEvent> ParseUpdate(const json::object& update);

}  // namespace courier::network
