/**
 * @file Config.hpp
 * @brief Configuration management singleton.
 *
 * Config is a thread-safe process-wide holder for the settings read from
 * config.toml. Parsing lives in ConfigParsers and file I/O in ConfigLoader.
 * Core components take the plain section structs, so the singleton is only a
 * convenience for applications.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 * - ConfigParsers
 *
 * @section Patterns
 * - Singleton: Global access point for configuration.
 * - Thread-Safe: Mutex-protected load/save.
 */

#pragma once
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace oc {

class Config {
public:
    static Config& instance();

    Result<void> load(const fs::path& path);
    Result<void> save(const fs::path& path) const;
    Result<void> loadDefault();

    // Restores built-in defaults for every section
    void reset();

    fs::path configPath() const {
        return configPath_;
    }
    bool debug() const {
        return debug_;
    }
    void setDebug(bool v) {
        debug_ = v;
        markDirty();
    }

    const CaptureConfig& capture() const {
        return capture_;
    }
    const MotionConfig& motion() const {
        return motion_;
    }
    const EncoderConfig& encoder() const {
        return encoder_;
    }
    const RecordingConfig& recording() const {
        return recording_;
    }

    CaptureConfig& capture() {
        markDirty();
        return capture_;
    }
    MotionConfig& motion() {
        markDirty();
        return motion_;
    }
    EncoderConfig& encoder() {
        markDirty();
        return encoder_;
    }
    RecordingConfig& recording() {
        markDirty();
        return recording_;
    }

    bool isDirty() const {
        return dirty_;
    }
    void markClean() {
        dirty_ = false;
    }

private:
    friend class ConfigLoader;

    Config() = default;
    void markDirty() {
        dirty_ = true;
    }

    fs::path configPath_;
    bool dirty_{false};
    bool debug_{false};

    CaptureConfig capture_;
    MotionConfig motion_;
    EncoderConfig encoder_;
    RecordingConfig recording_;

    mutable std::mutex mutex_;
};

#define CONFIG oc::Config::instance()

} // namespace oc
