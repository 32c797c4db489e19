#include "RecordingSession.hpp"
#include <chrono>
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace oc {

namespace {

void replaceAll(std::string& s, std::string_view from, const std::string& to) {
    for (usize pos = s.find(from); pos != std::string::npos;
         pos = s.find(from, pos + to.size())) {
        s.replace(pos, from.size(), to);
    }
}

bool sameGeometry(const RawFrame& a, const RawFrame& b) {
    return a.width == b.width && a.height == b.height && a.format == b.format;
}

} // namespace

std::string expandSegmentName(std::string_view pattern,
                              i64 startTimestamp,
                              usize index) {
    std::string name(pattern);
    replaceAll(name, "{start}", std::to_string(startTimestamp));
    replaceAll(name, "{index}", std::to_string(index));
    return name + ".mp4";
}

RecordingSession::RecordingSession(ScreenCapture& capture,
                                   u32 displayId,
                                   const RecordingOptions& options,
                                   const EncoderSettings& encoderSettings,
                                   Signal<const VideoSegment&>& segmentEncoded,
                                   Signal<std::string>& error)
    : capture_(capture),
      displayId_(displayId),
      options_(options),
      segmentEncoded_(segmentEncoded),
      error_(error),
      encoder_(encoderSettings),
      detector_(options.motionThreshold) {
    buffer_.reserve(options_.bufferSize);
}

RecordingSession::~RecordingSession() {
    stop();
}

void RecordingSession::start() {
    if (thread_.joinable())
        return;
    if (!file::ensureDir(options_.outputDirectory)) {
        LOG_WARN("Cannot create output directory {}",
                 options_.outputDirectory.string());
    }
    thread_ = std::jthread([this](std::stop_token st) { threadLoop(st); });
}

void RecordingSession::stop() {
    if (!thread_.joinable())
        return;
    thread_.request_stop();
    wakeUp_.notify_all();
    thread_.join();

    cutSegment();
    collectFinished(true);
    encoder_.shutdown();
    LOG_INFO("Recording session on display {} stopped: {} frames, {} segments",
             displayId_,
             framesCaptured_.load(),
             segmentsCut_.load());
}

void RecordingSession::setPaused(bool paused) {
    paused_ = paused;
    wakeUp_.notify_all();
}

f32 RecordingSession::motionPercentage() const {
    const u64 total = framesCaptured_;
    if (total == 0)
        return 0.0f;
    return static_cast<f32>(motionFrames_) / static_cast<f32>(total) * 100.0f;
}

void RecordingSession::threadLoop(std::stop_token stopToken) {
    LOG_DEBUG("Capture loop started at {} fps", options_.targetFps);
    const auto interval = options_.frameInterval();
    auto nextTick = Clock::now();

    while (!stopToken.stop_requested()) {
        {
            std::unique_lock lock(waitMutex_);
            wakeUp_.wait_until(lock, stopToken, nextTick, [] { return false; });
        }
        if (stopToken.stop_requested())
            break;

        nextTick += interval;
        if (nextTick < Clock::now())
            nextTick = Clock::now() + interval;

        collectFinished(false);
        if (paused_)
            continue;

        auto frame = capture_.captureFrame(displayId_);
        if (!frame) {
            LOG_WARN("Frame capture failed: {}", frame.error().describe());
            continue;
        }
        processFrame(std::move(*frame));
    }
    LOG_DEBUG("Capture loop finishing");
}

void RecordingSession::processFrame(RawFrame frame) {
    ++framesCaptured_;

    // The encoder needs one geometry per segment
    if (!buffer_.empty() && !sameGeometry(buffer_.front(), frame)) {
        LOG_INFO("Display geometry changed to {}x{}, closing segment",
                 frame.width,
                 frame.height);
        cutSegment();
    }

    bool accepted = true;
    if (options_.motionDetection) {
        accepted = detector_.detectMotion(frame).hasMotion;
    }

    if (accepted) {
        ++motionFrames_;
        noMotionCount_ = 0;
        buffer_.push_back(std::move(frame));
        if (buffer_.size() >= options_.bufferSize)
            cutSegment();
    } else {
        ++noMotionCount_;
        if (noMotionCount_ >= options_.noMotionThreshold && !buffer_.empty())
            cutSegment();
    }
}

void RecordingSession::cutSegment() {
    if (buffer_.empty())
        return;

    const usize index = ++segmentsCut_;
    const i64 start = buffer_.front().timestamp;
    auto path = segmentPath(start, index);
    LOG_DEBUG("Cutting segment {} with {} frames -> {}",
              index,
              buffer_.size(),
              path.string());

    std::vector<RawFrame> frames;
    frames.swap(buffer_);
    buffer_.reserve(options_.bufferSize);
    pending_.push_back(encoder_.encodeFrames(
            std::move(frames), std::move(path), options_.targetFps));
}

void RecordingSession::collectFinished(bool wait) {
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (!wait &&
            it->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }
        auto result = it->get();
        it = pending_.erase(it);
        if (result) {
            segmentEncoded_.emitSignal(*result);
        } else {
            LOG_ERROR("Segment encode failed: {}", result.error().message);
            error_.emitSignal(result.error().message);
        }
    }
}

fs::path RecordingSession::segmentPath(i64 startTimestamp, usize index) const {
    return options_.outputDirectory /
           expandSegmentName(options_.filenamePattern, startTimestamp, index);
}

} // namespace oc
