#include "Destination.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace courier::infra {

namespace {

// Name collisions are resolved by counting up; give up long before this.
constexpr int MAX_COLLISION_SUFFIX = 10000;

}  // namespace

std::string SanitizeFilename(std::string_view declared, std::string_view fallback) {
    // Both separators count, whatever platform the sender was on.
    auto slash = declared.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        declared.remove_prefix(slash + 1);
    }

    std::string name;
    name.reserve(declared.size());
    for (char c : declared) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) {
            continue;
        }
        name.push_back(c);
    }

    // Trim surrounding whitespace
    auto first = name.find_first_not_of(' ');
    auto last = name.find_last_not_of(' ');
    name = (first == std::string::npos) ? std::string{} : name.substr(first, last - first + 1);

    if (name.empty() || name == "." || name == "..") {
        return std::string(fallback);
    }
    return name;
}

std::filesystem::path UniqueDestination(
    const std::filesystem::path& dir, const std::string& filename,
    const std::function<bool(const std::filesystem::path&)>& is_reserved) {
    auto taken = [&](const std::filesystem::path& p) {
        std::error_code ec;
        if (std::filesystem::exists(p, ec)) {
            return true;
        }
        return is_reserved && is_reserved(p);
    };

    std::filesystem::path candidate = dir / filename;
    if (!taken(candidate)) {
        return candidate;
    }

    const std::filesystem::path base(filename);
    const std::string stem = base.stem().string();
    const std::string ext = base.extension().string();

    for (int n = 1; n < MAX_COLLISION_SUFFIX; ++n) {
        candidate = dir / (stem + " (" + std::to_string(n) + ")" + ext);
        if (!taken(candidate)) {
            return candidate;
        }
    }
    throw std::runtime_error("No free destination name for " + filename);
}

bool MoveNoReplace(const std::filesystem::path& from, const std::filesystem::path& to) {
#if defined(__linux__) && defined(RENAME_NOREPLACE)
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
        return true;
    }
    if (errno == EEXIST) {
        return false;
    }
    // Filesystems without RENAME_NOREPLACE support fall through to link + unlink.
    if (errno != EINVAL && errno != ENOSYS) {
        throw std::filesystem::filesystem_error("rename", from, to,
                                                std::error_code(errno, std::generic_category()));
    }
#endif
    if (::link(from.c_str(), to.c_str()) != 0) {
        if (errno == EEXIST) {
            return false;
        }
        throw std::filesystem::filesystem_error("link", from, to,
                                                std::error_code(errno, std::generic_category()));
    }
    std::error_code ec;
    std::filesystem::remove(from, ec);
    return true;
}

std::filesystem::path TempPathFor(const std::filesystem::path& destination) {
    boost::uuids::random_generator generator;
    const std::string suffix = boost::uuids::to_string(generator());
    return destination.parent_path() /
           ("." + destination.filename().string() + "." + suffix + ".part");
}

}  // namespace courier::infra
