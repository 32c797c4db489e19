/**
 * @file RecordingSession.hpp
 * @brief Capture loop of one active recording.
 *
 * A RecordingSession captures the recorded display at the target frame
 * rate on its own std::jthread, passes frames through the MotionDetector and
 * buffers the ones that changed. A segment is cut when the buffer is full or
 * when the screen has been static for noMotionThreshold frames; cut segments
 * are handed to VideoEncoder without waiting. Finished encodes are collected
 * on the loop thread and announced through the owning recorder's signals.
 *
 * stop() ends the loop, encodes what is still buffered and waits for every
 * pending encode.
 *
 * @section Patterns
 * - Producer-Consumer: the loop produces segments, VideoEncoder's pool
 *   consumes them.
 * - RAII: the loop thread is a std::jthread joined on destruction.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "RecordingOptions.hpp"
#include "VideoEncoder.hpp"
#include "capture/ScreenCapture.hpp"
#include "motion/MotionDetector.hpp"
#include "util/Signal.hpp"

namespace oc {

class RecordingSession {
public:
    RecordingSession(ScreenCapture& capture,
                     u32 displayId,
                     const RecordingOptions& options,
                     const EncoderSettings& encoderSettings,
                     Signal<const VideoSegment&>& segmentEncoded,
                     Signal<std::string>& error);
    ~RecordingSession();

    RecordingSession(const RecordingSession&) = delete;
    RecordingSession& operator=(const RecordingSession&) = delete;

    void start();
    void stop();

    void setPaused(bool paused);
    bool isPaused() const {
        return paused_;
    }

    u32 displayId() const {
        return displayId_;
    }
    usize segmentCount() const {
        return segmentsCut_;
    }
    u64 framesCaptured() const {
        return framesCaptured_;
    }
    u64 motionFrames() const {
        return motionFrames_;
    }
    // motion frames / captured frames * 100
    f32 motionPercentage() const;

private:
    void threadLoop(std::stop_token stopToken);
    void processFrame(RawFrame frame);
    void cutSegment();
    void collectFinished(bool wait);
    fs::path segmentPath(i64 startTimestamp, usize index) const;

    ScreenCapture& capture_;
    const u32 displayId_;
    const RecordingOptions options_;
    Signal<const VideoSegment&>& segmentEncoded_;
    Signal<std::string>& error_;

    VideoEncoder encoder_;
    MotionDetector detector_;

    // Touched only by the loop thread, or after it has been joined
    std::vector<RawFrame> buffer_;
    u32 noMotionCount_{0};
    std::vector<std::future<Result<VideoSegment>>> pending_;

    std::atomic<bool> paused_{false};
    std::atomic<usize> segmentsCut_{0};
    std::atomic<u64> framesCaptured_{0};
    std::atomic<u64> motionFrames_{0};

    std::mutex waitMutex_;
    std::condition_variable_any wakeUp_;
    std::jthread thread_;
};

} // namespace oc
