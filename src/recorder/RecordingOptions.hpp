/**
 * @file RecordingOptions.hpp
 * @brief Capture loop tuning for ScreenRecorder.
 */

#pragma once
#include <string>
#include <string_view>
#include "core/ConfigData.hpp"
#include "util/Types.hpp"

namespace oc {

struct RecordingOptions {
    u32 targetFps{10};
    u32 bufferSize{60};        // frames per segment at most
    u32 noMotionThreshold{20}; // static frames before a segment is cut
    bool motionDetection{true};
    f32 motionThreshold{0.05f};
    fs::path outputDirectory;
    std::string filenamePattern{"segment_{start}_{index}"};

    Duration frameInterval() const {
        return Duration(1000 / (targetFps ? targetFps : 1));
    }

    static RecordingOptions fromConfig(const CaptureConfig& capture,
                                       const MotionConfig& motion,
                                       const RecordingConfig& recording) {
        RecordingOptions o;
        o.targetFps = capture.targetFps;
        o.bufferSize = recording.bufferSize;
        o.noMotionThreshold = recording.noMotionThreshold;
        o.motionDetection = motion.enabled;
        o.motionThreshold = motion.threshold;
        o.outputDirectory = recording.outputDirectory;
        o.filenamePattern = recording.filenamePattern;
        return o;
    }
};

// Substitutes {start} and {index} in a segment filename pattern
std::string expandSegmentName(std::string_view pattern,
                              i64 startTimestamp,
                              usize index);

} // namespace oc
