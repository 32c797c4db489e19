#include <QtTest>
#include "motion/MotionDetector.hpp"

using namespace oc;

namespace {

RawFrame solidFrame(u32 w, u32 h, u8 value, PixelFormat fmt = PixelFormat::RGBA8) {
    RawFrame f;
    f.width = w;
    f.height = h;
    f.format = fmt;
    f.data.assign(f.expectedSize(), value);
    return f;
}

void paintRect(RawFrame& f, u32 x0, u32 y0, u32 w, u32 h, u8 value) {
    for (u32 y = y0; y < y0 + h; ++y) {
        for (u32 x = x0; x < x0 + w; ++x) {
            const usize off = (usize(y) * f.width + x) * kBytesPerPixel;
            f.data[off] = value;
            f.data[off + 1] = value;
            f.data[off + 2] = value;
        }
    }
}

} // namespace

class TestMotionDetector : public QObject {
    Q_OBJECT

private slots:
    void testFirstFrameIsFullMotion() {
        MotionDetector detector;
        QVERIFY(!detector.hasBaseline());

        auto result = detector.detectMotion(solidFrame(100, 80, 0));
        QVERIFY(result.hasMotion);
        QCOMPARE(result.changedPercentage, 1.0f);
        QCOMPARE(result.boundingBoxes.size(), size_t(1));
        QVERIFY(result.boundingBoxes[0] == (Rect{0, 0, 100, 80}));
        QVERIFY(detector.hasBaseline());
    }

    void testIdenticalFrameHasNoMotion() {
        MotionDetector detector;
        detector.detectMotion(solidFrame(100, 80, 40));
        auto result = detector.detectMotion(solidFrame(100, 80, 40));
        QVERIFY(!result.hasMotion);
        QCOMPARE(result.changedPercentage, 0.0f);
        QVERIFY(result.boundingBoxes.empty());
    }

    void testSmallDifferencesAreNoise() {
        MotionDetector detector;
        detector.detectMotion(solidFrame(50, 50, 100));
        // A channel difference of exactly the pixel threshold does not count
        auto result = detector.detectMotion(
                solidFrame(50, 50, 100 + MotionDetector::kPixelThreshold));
        QCOMPARE(result.changedPercentage, 0.0f);
        QVERIFY(!result.hasMotion);
    }

    void testAlphaChannelIsIgnored() {
        MotionDetector detector;
        auto base = solidFrame(20, 20, 0);
        detector.detectMotion(base);
        for (usize i = 3; i < base.data.size(); i += 4)
            base.data[i] = 255;
        QVERIFY(!detector.detectMotion(base).hasMotion);
    }

    void testRegionChangeReportsCell() {
        MotionDetector detector(0.01f);
        auto base = solidFrame(100, 100, 0);
        detector.detectMotion(base);

        auto next = base;
        paintRect(next, 0, 0, 10, 10, 200);
        auto result = detector.detectMotion(next);

        QVERIFY(result.hasMotion);
        QCOMPARE(result.changedPercentage, 0.01f);
        QCOMPARE(result.boundingBoxes.size(), size_t(1));
        QVERIFY(result.boundingBoxes[0] == (Rect{0, 0, 10, 10}));
    }

    void testBelowThresholdIsStatic() {
        MotionDetector detector(0.05f);
        auto base = solidFrame(100, 100, 0);
        detector.detectMotion(base);

        auto next = base;
        paintRect(next, 50, 50, 10, 10, 255); // 1% of the frame
        auto result = detector.detectMotion(next);
        QVERIFY(!result.hasMotion);
        QCOMPARE(result.changedPercentage, 0.01f);
        QVERIFY(result.boundingBoxes.empty());
    }

    void testFivePercentChangeTogglesByThreshold() {
        auto base = solidFrame(100, 100, 0);
        auto next = base;
        // 500 of 10000 pixels
        paintRect(next, 0, 0, 100, 5, 200);

        MotionDetector sensitive(0.01f);
        sensitive.detectMotion(base);
        auto low = sensitive.detectMotion(next);
        QVERIFY(low.hasMotion);
        QCOMPARE(low.changedPercentage, 0.05f);
        QVERIFY(!low.boundingBoxes.empty());

        MotionDetector strict(0.5f);
        strict.detectMotion(base);
        auto high = strict.detectMotion(next);
        QVERIFY(!high.hasMotion);
        QCOMPARE(high.changedPercentage, 0.05f);
        QVERIFY(high.boundingBoxes.empty());
    }

    void testGridCoversOddSizes() {
        MotionDetector detector(0.0f);
        detector.detectMotion(solidFrame(105, 33, 0));
        auto result = detector.detectMotion(solidFrame(105, 33, 90));

        QCOMPARE(result.boundingBoxes.size(),
                 size_t(MotionDetector::kGridSize * MotionDetector::kGridSize));
        u64 covered = 0;
        for (const auto& box : result.boundingBoxes) {
            QVERIFY(box.x + box.width <= 105);
            QVERIFY(box.y + box.height <= 33);
            covered += u64(box.width) * box.height;
        }
        QCOMPARE(covered, u64(105) * 33);
    }

    void testResolutionChangeResetsBaseline() {
        MotionDetector detector;
        detector.detectMotion(solidFrame(40, 40, 10));
        auto result = detector.detectMotion(solidFrame(80, 40, 10));
        QVERIFY(result.hasMotion);
        QCOMPARE(result.changedPercentage, 1.0f);
        QVERIFY(result.boundingBoxes[0] == (Rect{0, 0, 80, 40}));

        // Next identical frame compares against the new baseline
        QVERIFY(!detector.detectMotion(solidFrame(80, 40, 10)).hasMotion);
    }

    void testFormatChangeResetsBaseline() {
        MotionDetector detector;
        detector.detectMotion(solidFrame(16, 16, 10, PixelFormat::RGBA8));
        auto result = detector.detectMotion(solidFrame(16, 16, 10, PixelFormat::BGRA8));
        QCOMPARE(result.changedPercentage, 1.0f);
    }

    void testReset() {
        MotionDetector detector;
        detector.detectMotion(solidFrame(10, 10, 0));
        detector.reset();
        QVERIFY(!detector.hasBaseline());
        QCOMPARE(detector.detectMotion(solidFrame(10, 10, 0)).changedPercentage,
                 1.0f);
    }

    void testThresholdIsClamped() {
        MotionDetector detector(2.0f);
        QCOMPARE(detector.threshold(), 1.0f);
        detector.setThreshold(-0.5f);
        QCOMPARE(detector.threshold(), 0.0f);
    }
};

QTEST_GUILESS_MAIN(TestMotionDetector)
#include "test_MotionDetector.moc"
