/**
 * @file FileUtils.hpp
 * @brief Filesystem helpers: per-user directories, path expansion, sizes.
 *
 * @section Dependencies
 * - std::filesystem
 */

#pragma once
#include <string_view>
#include "Types.hpp"

namespace oc::file {

// Per-user base directories, following XDG on Linux and the platform
// conventions elsewhere. Each is suffixed with the application directory.
fs::path configDir();
fs::path cacheDir();

bool ensureDir(const fs::path& dir);

// Expands a leading "~/" to $HOME
fs::path expandPath(std::string_view path);

// Size of a regular file in bytes, 0 if it does not exist
u64 fileSize(const fs::path& path);

} // namespace oc::file
