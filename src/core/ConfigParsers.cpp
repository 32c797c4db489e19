#include "ConfigParsers.hpp"
#include <algorithm>
#include <cctype>
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace oc {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_same_v<T, f32>) {
            if (auto val = node.value<double>())
                return static_cast<f32>(*val);
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>())
                return static_cast<T>(std::max<i64>(*val, 0));
        }
    }
    return defaultVal;
}

std::string oneOf(std::string value,
                  std::initializer_list<std::string_view> allowed,
                  std::string_view key,
                  std::string fallback) {
    std::transform(value.begin(), value.end(), value.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    for (auto a : allowed) {
        if (value == a)
            return value;
    }
    LOG_WARN("Unknown {} '{}', using '{}'", key, value, fallback);
    return fallback;
}
} // namespace

void ConfigParsers::parseCapture(const toml::table& tbl, CaptureConfig& cfg) {
    if (auto cap = tbl["capture"].as_table()) {
        cfg.targetFps = std::clamp(get(*cap, "target_fps", 10u), 1u, 60u);
    }
}

void ConfigParsers::parseMotion(const toml::table& tbl, MotionConfig& cfg) {
    if (auto motion = tbl["motion"].as_table()) {
        cfg.enabled = get(*motion, "enabled", true);
        cfg.threshold =
                std::clamp(get(*motion, "threshold", 0.05f), 0.0f, 1.0f);
    }
}

void ConfigParsers::parseEncoder(const toml::table& tbl, EncoderConfig& cfg) {
    if (auto enc = tbl["encoder"].as_table()) {
        cfg.codec = oneOf(get(*enc, "codec", std::string("h264")),
                          {"h264"},
                          "encoder.codec",
                          "h264");
        cfg.quality = oneOf(get(*enc, "quality", std::string("medium")),
                            {"high", "medium", "low"},
                            "encoder.quality",
                            "medium");
        cfg.hardwareAcceleration = get(*enc, "hardware_acceleration", true);
        cfg.hardwareCodec = get(*enc, "hardware_codec", std::string());
        cfg.preset = get(*enc, "preset", std::string("medium"));
        cfg.workerThreads =
                std::clamp(get(*enc, "worker_threads", 1u), 1u, 8u);
    }
}

void ConfigParsers::parseRecording(const toml::table& tbl,
                                   RecordingConfig& cfg) {
    auto outDir = std::string(kDefaultOutputDirectory);
    if (auto rec = tbl["recording"].as_table()) {
        cfg.bufferSize = std::clamp(get(*rec, "buffer_size", 60u), 1u, 3600u);
        cfg.noMotionThreshold =
                std::clamp(get(*rec, "no_motion_threshold", 20u), 1u, 3600u);
        outDir = get(*rec, "output_directory", outDir);
        cfg.filenamePattern = get(*rec,
                                  "filename_pattern",
                                  std::string("segment_{start}_{index}"));
        if (cfg.filenamePattern.empty())
            cfg.filenamePattern = "segment_{start}_{index}";
    }
    cfg.outputDirectory = file::expandPath(outDir);
}

toml::table ConfigParsers::serialize(const CaptureConfig& capture,
                                     const MotionConfig& motion,
                                     const EncoderConfig& encoder,
                                     const RecordingConfig& recording,
                                     bool debug) {
    toml::table root;
    root.insert("general", toml::table{{"debug", debug}});
    root.insert("capture",
                toml::table{{"target_fps", (i64)capture.targetFps}});
    root.insert("motion",
                toml::table{{"enabled", motion.enabled},
                            {"threshold", (double)motion.threshold}});
    root.insert("encoder",
                toml::table{
                        {"codec", encoder.codec},
                        {"quality", encoder.quality},
                        {"hardware_acceleration", encoder.hardwareAcceleration},
                        {"hardware_codec", encoder.hardwareCodec},
                        {"preset", encoder.preset},
                        {"worker_threads", (i64)encoder.workerThreads}});
    root.insert("recording",
                toml::table{
                        {"buffer_size", (i64)recording.bufferSize},
                        {"no_motion_threshold",
                         (i64)recording.noMotionThreshold},
                        {"output_directory", recording.outputDirectory.string()},
                        {"filename_pattern", recording.filenamePattern}});
    return root;
}

} // namespace oc
