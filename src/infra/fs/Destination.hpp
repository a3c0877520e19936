#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace courier::infra {

/**
 * @brief Reduces a sender-declared name to a bare filename safe to create in the
 * download directory. Returns @p fallback when nothing usable is left.
 */
std::string SanitizeFilename(std::string_view declared, std::string_view fallback);

/**
 * @brief Picks `dir/filename`, or the first free `stem (N).ext` variant.
 * @param is_reserved Extra predicate for names already claimed but not yet on disk.
 */
std::filesystem::path UniqueDestination(
    const std::filesystem::path& dir, const std::string& filename,
    const std::function<bool(const std::filesystem::path&)>& is_reserved = {});

/**
 * @brief Moves @p from to @p to unless something already exists at @p to.
 * @return false when @p to is taken; @p from is left untouched then.
 * @throws std::filesystem::filesystem_error on any other failure.
 */
bool MoveNoReplace(const std::filesystem::path& from, const std::filesystem::path& to);

// Hidden, uuid-suffixed sibling of the destination used while bytes are in flight.
std::filesystem::path TempPathFor(const std::filesystem::path& destination);

}  // namespace courier::infra
