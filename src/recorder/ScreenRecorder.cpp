#include "ScreenRecorder.hpp"
#include "RecordingSession.hpp"
#include "core/Logger.hpp"

namespace oc {

namespace {

constexpr const char* kConsentMissing =
        "Screen recording consent not granted. Please enable it in Privacy & "
        "Consent settings.";

} // namespace

ScreenRecorder::ScreenRecorder(std::unique_ptr<ScreenCapture> capture,
                               std::shared_ptr<ConsentGate> consent,
                               RecordingOptions options,
                               EncoderSettings encoderSettings)
    : capture_(std::move(capture)),
      consent_(std::move(consent)),
      options_(std::move(options)),
      encoderSettings_(std::move(encoderSettings)) {}

ScreenRecorder::~ScreenRecorder() {
    std::unique_ptr<RecordingSession> session;
    {
        std::lock_guard lock(mutex_);
        session = std::move(session_);
    }
    if (session) {
        session->stop();
        if (auto stopped = capture_->stopCapture(); !stopped)
            LOG_WARN("Stopping capture failed: {}", stopped.error().describe());
    }
}

CaptureResult<std::unique_ptr<ScreenRecorder>> ScreenRecorder::create(
        std::shared_ptr<ConsentGate> consent,
        RecordingOptions options,
        EncoderSettings encoderSettings) {
    using R = CaptureResult<std::unique_ptr<ScreenRecorder>>;
    auto capture = createScreenCapture();
    if (!capture)
        return R::err(capture.error());
    return R::ok(std::make_unique<ScreenRecorder>(std::move(*capture),
                                                  std::move(consent),
                                                  std::move(options),
                                                  std::move(encoderSettings)));
}

bool ScreenRecorder::hasConsent() {
    return consent_ && consent_->isConsentGranted(Feature::ScreenRecording);
}

CaptureResult<void> ScreenRecorder::startRecording(u32 displayId) {
    if (!hasConsent())
        return CaptureResult<void>::err(
                CaptureError::permissionDenied(kConsentMissing));

    std::lock_guard lock(mutex_);
    if (session_)
        return CaptureResult<void>::err(CaptureError::alreadyCapturing());

    auto display = capture_->findDisplay(displayId);
    if (!display)
        return CaptureResult<void>::err(display.error());

    if (auto started = capture_->startCapture(displayId); !started)
        return started;

    session_ = std::make_unique<RecordingSession>(*capture_,
                                                  displayId,
                                                  options_,
                                                  encoderSettings_,
                                                  segmentEncoded,
                                                  error);
    session_->start();

    LOG_INFO("Started recording display {} ({}x{})",
             display->name,
             display->width,
             display->height);
    return CaptureResult<void>::ok();
}

CaptureResult<void> ScreenRecorder::stopRecording() {
    std::unique_lock lock(mutex_);
    if (!session_)
        return capture_->stopCapture();

    auto session = std::move(session_);
    // Finishing encodes can take a while and emits signals; do it unlocked
    lock.unlock();
    session->stop();
    lock.lock();

    auto stopped = capture_->stopCapture();
    if (stopped)
        LOG_INFO("Stopped recording after {} segment(s)", session->segmentCount());
    return stopped;
}

CaptureResult<void> ScreenRecorder::pauseRecording() {
    std::lock_guard lock(mutex_);
    if (!session_)
        return CaptureResult<void>::err(CaptureError::notCapturing());
    session_->setPaused(true);
    LOG_INFO("Recording paused");
    return CaptureResult<void>::ok();
}

CaptureResult<void> ScreenRecorder::resumeRecording() {
    std::lock_guard lock(mutex_);
    if (!session_)
        return CaptureResult<void>::err(CaptureError::notCapturing());
    session_->setPaused(false);
    LOG_INFO("Recording resumed");
    return CaptureResult<void>::ok();
}

RecordingStatus ScreenRecorder::status() {
    RecordingStatus st;
    st.hasConsent = hasConsent();

    std::lock_guard lock(mutex_);
    st.isRecording = session_ != nullptr;
    st.displayId = capture_->currentDisplayId();
    if (session_) {
        st.segmentCount = session_->segmentCount();
        st.totalMotionPercentage = session_->motionPercentage();
        st.isPaused = session_->isPaused();
    }
    if (st.displayId) {
        auto display = capture_->findDisplay(*st.displayId);
        if (display)
            st.displayName = display->name;
    }
    return st;
}

CaptureResult<RawFrame> ScreenRecorder::captureFrame(u32 displayId) {
    if (!hasConsent())
        return CaptureResult<RawFrame>::err(
                CaptureError::permissionDenied(kConsentMissing));
    return capture_->captureFrame(displayId);
}

CaptureResult<std::vector<Display>> ScreenRecorder::availableDisplays() {
    return capture_->getDisplays();
}

bool ScreenRecorder::isRecording() const {
    std::lock_guard lock(mutex_);
    return session_ != nullptr;
}

} // namespace oc
