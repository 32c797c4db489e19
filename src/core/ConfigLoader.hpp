/**
 * @file ConfigLoader.hpp
 * @brief Configuration file I/O.
 *
 * Reads config.toml into a Config and writes it back through a temporary
 * file that is renamed into place, so a crash never leaves a half-written
 * config behind.
 *
 * @section Dependencies
 * - Config
 * - std::filesystem
 */

#pragma once
#include <filesystem>
#include "util/Result.hpp"

namespace oc {

class Config;

class ConfigLoader {
public:
    static Result<void> load(Config& config, const std::filesystem::path& path);
    static Result<void> save(const Config& config,
                             const std::filesystem::path& path);
    static Result<void> loadDefault(Config& config);
};

} // namespace oc
