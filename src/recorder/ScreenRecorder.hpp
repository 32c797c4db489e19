/**
 * @file ScreenRecorder.hpp
 * @brief Consent-gated screen recording facade.
 *
 * ScreenRecorder ties a ScreenCapture backend to the application's
 * ConsentGate and runs a RecordingSession while recording. Every entry point
 * that touches the screen asks the gate first; without consent it fails with
 * PermissionDenied. Start, stop, pause, resume and status are serialized by
 * one mutex, so only one session can exist per recorder.
 *
 * Finished segments are reported through segmentEncoded; the application is
 * responsible for storing them.
 *
 * @section Dependencies
 * - ScreenCapture, ConsentGate
 * - RecordingSession, VideoEncoder
 *
 * @section Patterns
 * - Facade: one object for the whole capture to segment pipeline.
 * - Delegation: the capture loop runs in RecordingSession.
 * - Observer: segmentEncoded / error signals.
 */

#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "ConsentGate.hpp"
#include "EncoderSettings.hpp"
#include "RecordingOptions.hpp"
#include "VideoEncoder.hpp"
#include "capture/ScreenCapture.hpp"
#include "util/Signal.hpp"

namespace oc {

class RecordingSession;

struct RecordingStatus {
    bool isRecording{false};
    std::optional<u32> displayId;
    std::optional<std::string> displayName;
    bool hasConsent{false};
    usize segmentCount{0};
    f32 totalMotionPercentage{0.0f};
    bool isPaused{false};
};

class ScreenRecorder {
public:
    ScreenRecorder(std::unique_ptr<ScreenCapture> capture,
                   std::shared_ptr<ConsentGate> consent,
                   RecordingOptions options = {},
                   EncoderSettings encoderSettings = {});
    ~ScreenRecorder();

    ScreenRecorder(const ScreenRecorder&) = delete;
    ScreenRecorder& operator=(const ScreenRecorder&) = delete;

    // Recorder over the capture backend of this platform
    static CaptureResult<std::unique_ptr<ScreenRecorder>> create(
            std::shared_ptr<ConsentGate> consent,
            RecordingOptions options = {},
            EncoderSettings encoderSettings = {});

    CaptureResult<void> startRecording(u32 displayId);
    CaptureResult<void> stopRecording();
    CaptureResult<void> pauseRecording();
    CaptureResult<void> resumeRecording();

    // Fresh snapshot; the display name comes from a new enumeration
    RecordingStatus status();

    CaptureResult<RawFrame> captureFrame(u32 displayId);
    CaptureResult<std::vector<Display>> availableDisplays();

    bool isRecording() const;

    const RecordingOptions& options() const {
        return options_;
    }

    Signal<const VideoSegment&> segmentEncoded;
    Signal<std::string> error;

private:
    bool hasConsent();

    std::unique_ptr<ScreenCapture> capture_;
    std::shared_ptr<ConsentGate> consent_;
    RecordingOptions options_;
    EncoderSettings encoderSettings_;

    std::unique_ptr<RecordingSession> session_;
    mutable std::mutex mutex_;
};

} // namespace oc
