/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * Plain structs holding configuration values, one per TOML section. They are
 * kept apart from the loader so components can take them by value without
 * pulling in toml++.
 */

#pragma once
#include <string>
#include "util/Types.hpp"

namespace oc {

// [capture]
struct CaptureConfig {
    u32 targetFps{10};
};

// [motion]
struct MotionConfig {
    bool enabled{true};
    f32 threshold{0.05f};
};

// [encoder]
struct EncoderConfig {
    std::string codec{"h264"};
    std::string quality{"medium"}; // high, medium, low
    bool hardwareAcceleration{true};
    std::string hardwareCodec; // empty = platform default
    std::string preset{"medium"};
    u32 workerThreads{1};
};

// [recording]
struct RecordingConfig {
    u32 bufferSize{60};
    u32 noMotionThreshold{20};
    fs::path outputDirectory;
    std::string filenamePattern{"segment_{start}_{index}"};
};

} // namespace oc
