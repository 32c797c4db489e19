#include "VideoEncoder.hpp"
#include <algorithm>
#include <system_error>
#include "VideoEncoderFFmpeg.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace oc {

namespace {

// Only a file this encode created is removed; anything already at the path stays
Result<VideoSegment> failed(const fs::path& outputPath,
                            std::string msg,
                            bool removeOutput) {
    LOG_ERROR("Encoding {} failed: {}", outputPath.string(), msg);
    if (removeOutput) {
        std::error_code ec;
        if (!fs::remove(outputPath, ec) && ec)
            LOG_WARN("Could not remove {}: {}", outputPath.string(), ec.message());
    }
    return Result<VideoSegment>::err("Encoding failed: " + msg);
}

std::future<Result<VideoSegment>> readyError(std::string msg) {
    std::promise<Result<VideoSegment>> ready;
    ready.set_value(Result<VideoSegment>::err(std::move(msg)));
    return ready.get_future();
}

} // namespace

VideoEncoder::VideoEncoder(EncoderSettings settings)
    : settings_(std::move(settings)), pool_(settings_.workerThreads) {
    LOG_DEBUG("VideoEncoder: codec {}, crf {}, {} worker(s)",
              settings_.resolveCodecName(),
              settings_.crf(),
              pool_.workerCount());
}

VideoEncoder::~VideoEncoder() {
    shutdown();
}

void VideoEncoder::shutdown() {
    pool_.shutdown();
}

std::future<Result<VideoSegment>> VideoEncoder::encodeFrames(
        std::vector<RawFrame> frames,
        fs::path outputPath,
        u32 fps) {
    if (frames.empty())
        return readyError("Encoding failed: no frames to encode");
    if (pool_.isShutdown())
        return readyError("Encoding failed: encoder is shut down");

    return pool_.submit([frames = std::move(frames),
                         outputPath = std::move(outputPath),
                         fps,
                         settings = settings_]() {
        return encodeFramesSync(frames, outputPath, fps, settings);
    });
}

std::future<Result<VideoSegment>> VideoEncoder::encodeFrameStream(
        std::shared_ptr<FrameChannel> frames,
        fs::path outputPath,
        u32 fps) {
    if (!frames)
        return readyError("Frame channel is null");
    if (pool_.isShutdown())
        return readyError("Encoding failed: encoder is shut down");

    return pool_.submit([frames = std::move(frames),
                         outputPath = std::move(outputPath),
                         fps,
                         settings = settings_]() {
        std::vector<RawFrame> batch;
        while (auto frame = frames->receive())
            batch.push_back(std::move(*frame));
        LOG_DEBUG("Frame stream closed after {} frames", batch.size());
        return encodeFramesSync(batch, outputPath, fps, settings);
    });
}

Result<VideoSegment> VideoEncoder::encodeFramesSync(
        const std::vector<RawFrame>& frames,
        const fs::path& outputPath,
        u32 fps,
        const EncoderSettings& settings) {
    if (frames.empty())
        return Result<VideoSegment>::err("Encoding failed: no frames to encode");

    const RawFrame& first = frames.front();
    if (!first.isValid())
        return Result<VideoSegment>::err(
                "Encoding failed: frame 0 is not a valid " +
                std::to_string(first.width) + "x" +
                std::to_string(first.height) + " image");

    EncodeParams params;
    params.outputPath = outputPath;
    params.width = first.width;
    params.height = first.height;
    params.fps = fps;
    params.inputFormat = first.format;
    params.codecName = settings.resolveCodecName();
    params.crf = settings.crf();
    params.preset = settings.preset;

    VideoEncoderFFmpeg encoder;
    auto opened = encoder.open(params);
    bool created = encoder.createdOutput();
    const std::string software = settings.softwareCodec();
    if (!opened && settings.hardwareAcceleration && params.codecName != software) {
        LOG_WARN("Hardware encoder {} unavailable ({}), falling back to {}",
                 params.codecName,
                 opened.error().message,
                 software);
        params.codecName = software;
        opened = encoder.open(params);
        created = created || encoder.createdOutput();
    }
    if (!opened)
        return failed(outputPath, opened.error().message, created);

    for (usize i = 0; i < frames.size(); ++i) {
        if (auto res = encoder.encodeFrame(frames[i]); !res) {
            encoder.release();
            return failed(outputPath,
                          "frame " + std::to_string(i) + ": " + res.error().message,
                          true);
        }
    }

    if (auto res = encoder.finish(); !res) {
        encoder.release();
        return failed(outputPath, res.error().message, true);
    }
    encoder.release();

    VideoSegment segment;
    segment.path = outputPath;
    segment.startTimestamp = first.timestamp;
    segment.endTimestamp = frames.back().timestamp;
    segment.frameCount = static_cast<u32>(frames.size());
    segment.durationMs = static_cast<u64>(
            std::max<i64>(1, segment.endTimestamp - segment.startTimestamp));
    segment.fileSizeBytes = file::fileSize(outputPath);
    segment.codecName = params.codecName;

    LOG_INFO("Encoded {} frames with {} to {} ({} bytes)",
             segment.frameCount,
             segment.codecName,
             outputPath.string(),
             segment.fileSizeBytes);
    return Result<VideoSegment>::ok(std::move(segment));
}

} // namespace oc
