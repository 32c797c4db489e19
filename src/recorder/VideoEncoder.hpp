/**
 * @file VideoEncoder.hpp
 * @brief Turns batches or streams of captured frames into MP4 segments.
 *
 * VideoEncoder picks the encoder name from EncoderSettings, runs the encode
 * on its own worker pool and returns a std::future, so callers never run
 * FFmpeg on their own thread. If a hardware encoder was requested and fails
 * to open, the batch is retried once with the software encoder. Failures
 * after the encoder opened are not retried.
 *
 * Segment bounds come from the first and last frame timestamps, not from the
 * time the encode ran.
 *
 * @section Dependencies
 * - VideoEncoderFFmpeg
 * - ThreadPool, Channel
 *
 * @section Patterns
 * - Facade over VideoEncoderFFmpeg.
 * - Producer-Consumer: encodeFrameStream() drains a Channel.
 */

#pragma once
#include <future>
#include <memory>
#include <vector>
#include "EncoderSettings.hpp"
#include "capture/CaptureTypes.hpp"
#include "util/Channel.hpp"
#include "util/Result.hpp"
#include "util/ThreadPool.hpp"

namespace oc {

struct VideoSegment {
    fs::path path;
    i64 startTimestamp{0};
    i64 endTimestamp{0};
    u32 frameCount{0};
    u64 durationMs{0};
    u64 fileSizeBytes{0};
    std::string codecName; // encoder that produced the file
};

using FrameChannel = Channel<RawFrame>;

class VideoEncoder {
public:
    explicit VideoEncoder(EncoderSettings settings = {});
    ~VideoEncoder();

    VideoEncoder(const VideoEncoder&) = delete;
    VideoEncoder& operator=(const VideoEncoder&) = delete;

    std::future<Result<VideoSegment>> encodeFrames(std::vector<RawFrame> frames,
                                                   fs::path outputPath,
                                                   u32 fps);

    // Receives until the channel is closed, then encodes everything in
    // arrival order
    std::future<Result<VideoSegment>> encodeFrameStream(
            std::shared_ptr<FrameChannel> frames,
            fs::path outputPath,
            u32 fps);

    // Blocking encode on the calling thread
    static Result<VideoSegment> encodeFramesSync(const std::vector<RawFrame>& frames,
                                                 const fs::path& outputPath,
                                                 u32 fps,
                                                 const EncoderSettings& settings);

    const EncoderSettings& settings() const {
        return settings_;
    }

    // Waits for queued encodes to finish
    void shutdown();

private:
    EncoderSettings settings_;
    ThreadPool pool_;
};

} // namespace oc
