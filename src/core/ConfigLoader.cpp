#include "ConfigLoader.hpp"
#include <fstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace oc {

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());

        if (auto gen = tbl["general"].as_table()) {
            config.debug_ = (*gen)["debug"].value_or(false);
        }

        ConfigParsers::parseCapture(tbl, config.capture_);
        ConfigParsers::parseMotion(tbl, config.motion_);
        ConfigParsers::parseEncoder(tbl, config.encoder_);
        ConfigParsers::parseRecording(tbl, config.recording_);

        config.markClean();
        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(std::string("Config parse error: ") +
                                 err.what());
    }
}

Result<void> ConfigLoader::loadDefault(Config& config) {
    auto configDir = file::configDir();
    auto defaultPath = configDir / "config.toml";
    config.configPath_ = defaultPath;

    if (fs::exists(defaultPath)) {
        return load(config, defaultPath);
    }

    LOG_WARN("No config file found, writing built-in defaults to {}",
             defaultPath.string());
    config.recording_.outputDirectory =
            file::expandPath(ConfigParsers::kDefaultOutputDirectory);
    if (!file::ensureDir(configDir)) {
        return Result<void>::err("Cannot create config directory: " +
                                 configDir.string());
    }
    auto saved = save(config, defaultPath);
    if (!saved) {
        return saved;
    }
    config.markClean();
    return Result<void>::ok();
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    try {
        auto tbl = ConfigParsers::serialize(config.capture_,
                                            config.motion_,
                                            config.encoder_,
                                            config.recording_,
                                            config.debug_);
        fs::path tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream out(tempPath);
            if (!out)
                return Result<void>::err("Failed to open temp config file");
            out << tbl << '\n';
        }
        fs::rename(tempPath, path);
        LOG_DEBUG("Config saved to: {}", path.string());
        return Result<void>::ok();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save config: {}", e.what());
        return Result<void>::err(std::string("Failed to save config: ") +
                                 e.what());
    }
}

} // namespace oc
