#include <QtTest>
#include <mutex>
#include <thread>
#include "recorder/FFmpegUtils.hpp"
#include "recorder/ScreenRecorder.hpp"
#include "support/FakeConsentGate.hpp"
#include "support/FakeScreenCapture.hpp"

using namespace oc;
using oc::test::FakeConsentGate;
using oc::test::FakeScreenCapture;

class TestScreenRecorder : public QObject {
    Q_OBJECT

private slots:
    void init() {
        QVERIFY(dir_.isValid());
        createRecorder(defaultOptions());
    }

    void cleanup() {
        recorder_.reset();
        capture_ = nullptr;
    }

    void testConsentRequiredToStart() {
        consent_->granted = false;
        auto res = recorder_->startRecording(0);
        QVERIFY(res.isErr());
        QVERIFY(res.error().kind == CaptureErrorKind::PermissionDenied);
        QVERIFY(res.error().message.find("consent not granted") != std::string::npos);
        QVERIFY(!recorder_->isRecording());
        QVERIFY(!capture_->isCapturing());
    }

    void testConsentRequiredToCaptureFrame() {
        QVERIFY(recorder_->captureFrame(0).isOk());
        consent_->granted = false;
        auto res = recorder_->captureFrame(0);
        QVERIFY(res.isErr());
        QVERIFY(res.error().kind == CaptureErrorKind::PermissionDenied);
        QCOMPARE(capture_->framesServed(), u64(1));
    }

    void testUnknownDisplay() {
        auto res = recorder_->startRecording(7);
        QVERIFY(res.isErr());
        QVERIFY(res.error().kind == CaptureErrorKind::DisplayNotFound);
        QCOMPARE(res.error().displayId, 7u);
        QVERIFY(!recorder_->isRecording());
    }

    void testStartTwiceFails() {
        QVERIFY(recorder_->startRecording(0).isOk());
        auto second = recorder_->startRecording(0);
        QVERIFY(second.isErr());
        QVERIFY(second.error().kind == CaptureErrorKind::AlreadyCapturing);
        QVERIFY(recorder_->stopRecording().isOk());
    }

    void testIdleControlsFail() {
        QVERIFY(recorder_->stopRecording().error().kind ==
                CaptureErrorKind::NotCapturing);
        QVERIFY(recorder_->pauseRecording().error().kind ==
                CaptureErrorKind::NotCapturing);
        QVERIFY(recorder_->resumeRecording().error().kind ==
                CaptureErrorKind::NotCapturing);
    }

    void testAvailableDisplays() {
        auto displays = recorder_->availableDisplays();
        QVERIFY(displays.isOk());
        QCOMPARE(displays->size(), size_t(1));
        QCOMPARE(displays->front().name, std::string("Fake Display (64x48)"));
    }

    void testStatusWhenIdle() {
        auto st = recorder_->status();
        QVERIFY(!st.isRecording);
        QVERIFY(!st.displayId.has_value());
        QVERIFY(!st.displayName.has_value());
        QVERIFY(st.hasConsent);
        QVERIFY(!st.isPaused);
        QCOMPARE(st.segmentCount, usize(0));
        QCOMPARE(st.totalMotionPercentage, 0.0f);

        consent_->granted = false;
        QVERIFY(!recorder_->status().hasConsent);
    }

    void testStatusWhileRecording() {
        QVERIFY(recorder_->startRecording(0).isOk());
        auto st = recorder_->status();
        QVERIFY(st.isRecording);
        QCOMPARE(*st.displayId, 0u);
        QCOMPARE(*st.displayName, std::string("Fake Display (64x48)"));
        QVERIFY(recorder_->stopRecording().isOk());

        st = recorder_->status();
        QVERIFY(!st.isRecording);
        QVERIFY(!st.displayId.has_value());
        QCOMPARE(capture_->stoppedCalls.load(), 1);
    }

    void testPauseStopsCapturing() {
        QVERIFY(recorder_->startRecording(0).isOk());
        QTRY_VERIFY_WITH_TIMEOUT(capture_->framesServed() >= 2, 3000);

        QVERIFY(recorder_->pauseRecording().isOk());
        QVERIFY(recorder_->status().isPaused);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        const u64 served = capture_->framesServed();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        QCOMPARE(capture_->framesServed(), served);

        QVERIFY(recorder_->resumeRecording().isOk());
        QVERIFY(!recorder_->status().isPaused);
        QTRY_VERIFY_WITH_TIMEOUT(capture_->framesServed() > served, 3000);
        QVERIFY(recorder_->stopRecording().isOk());
    }

    void testFullBufferProducesSegment() {
        if (!hasSoftwareEncoder())
            QSKIP("FFmpeg was built without libx264");

        QVERIFY(recorder_->startRecording(0).isOk());
        QTRY_VERIFY_WITH_TIMEOUT(segmentCount() >= 1, 10000);
        QVERIFY(recorder_->stopRecording().isOk());

        std::lock_guard lock(mutex_);
        QVERIFY(errors_.empty());
        const VideoSegment& first = segments_.front();
        QCOMPARE(first.frameCount, 5u);
        QVERIFY(fs::exists(first.path));
        QVERIFY(first.fileSizeBytes > 0);
        QCOMPARE(first.path.extension().string(), std::string(".mp4"));
        QVERIFY(first.path.filename().string().starts_with("segment_"));
    }

    void testMotionPercentageWithChangingScreen() {
        QVERIFY(recorder_->startRecording(0).isOk());
        QTRY_VERIFY_WITH_TIMEOUT(capture_->framesServed() >= 3, 3000);
        QVERIFY(recorder_->pauseRecording().isOk());
        // Let a frame that was in flight when pausing finish
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        QCOMPARE(recorder_->status().totalMotionPercentage, 100.0f);
        QVERIFY(recorder_->stopRecording().isOk());
    }

    void testStaticScreenCutsSegment() {
        if (!hasSoftwareEncoder())
            QSKIP("FFmpeg was built without libx264");

        capture_->animate = false;
        QVERIFY(recorder_->startRecording(0).isOk());
        QTRY_VERIFY_WITH_TIMEOUT(segmentCount() >= 1, 10000);

        auto st = recorder_->status();
        QVERIFY(st.totalMotionPercentage < 100.0f);
        QVERIFY(recorder_->stopRecording().isOk());

        std::lock_guard lock(mutex_);
        // Only the baseline frame counts as motion
        QCOMPARE(segments_.front().frameCount, 1u);
    }

    void testStopFlushesBufferedFrames() {
        if (!hasSoftwareEncoder())
            QSKIP("FFmpeg was built without libx264");

        // Static screen with a threshold that is never reached
        auto options = defaultOptions();
        options.noMotionThreshold = 1000;
        createRecorder(options);
        capture_->animate = false;
        QVERIFY(recorder_->startRecording(0).isOk());
        QTRY_VERIFY_WITH_TIMEOUT(capture_->framesServed() >= 2, 3000);
        QCOMPARE(segmentCount(), usize(0));

        QVERIFY(recorder_->stopRecording().isOk());
        // The encode finishes inside stopRecording()
        QCOMPARE(segmentCount(), usize(1));
        QVERIFY(!recorder_->isRecording());
    }

private:
    RecordingOptions defaultOptions() const {
        RecordingOptions options;
        options.targetFps = 30;
        options.bufferSize = 5;
        options.noMotionThreshold = 3;
        options.outputDirectory = fs::path(dir_.path().toStdString()) / "segments";
        return options;
    }

    void createRecorder(const RecordingOptions& options) {
        recorder_.reset();
        consent_ = std::make_shared<FakeConsentGate>(true);
        auto capture = std::make_unique<FakeScreenCapture>();
        capture_ = capture.get();

        EncoderSettings encoder;
        encoder.hardwareAcceleration = false;
        encoder.preset = "ultrafast";

        recorder_ = std::make_unique<ScreenRecorder>(
                std::move(capture), consent_, options, encoder);

        {
            std::lock_guard lock(mutex_);
            segments_.clear();
            errors_.clear();
        }
        recorder_->segmentEncoded.connect([this](const VideoSegment& seg) {
            std::lock_guard lock(mutex_);
            segments_.push_back(seg);
        });
        recorder_->error.connect([this](std::string msg) {
            std::lock_guard lock(mutex_);
            errors_.push_back(std::move(msg));
        });
    }

    static bool hasSoftwareEncoder() {
        return avcodec_find_encoder_by_name("libx264") != nullptr;
    }

    usize segmentCount() {
        std::lock_guard lock(mutex_);
        return segments_.size();
    }

    QTemporaryDir dir_;
    std::shared_ptr<FakeConsentGate> consent_;
    FakeScreenCapture* capture_{nullptr};
    std::unique_ptr<ScreenRecorder> recorder_;

    std::mutex mutex_;
    std::vector<VideoSegment> segments_;
    std::vector<std::string> errors_;
};

QTEST_GUILESS_MAIN(TestScreenRecorder)
#include "test_ScreenRecorder.moc"
