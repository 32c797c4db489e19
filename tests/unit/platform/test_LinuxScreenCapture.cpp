#include <QtTest>
#include "platform/linux/LinuxScreenCapture.hpp"

using namespace oc;

class TestLinuxScreenCapture : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        savedWayland_ = qgetenv("WAYLAND_DISPLAY");
        savedX11_ = qgetenv("DISPLAY");
        hadWayland_ = qEnvironmentVariableIsSet("WAYLAND_DISPLAY");
        hadX11_ = qEnvironmentVariableIsSet("DISPLAY");
    }

    void cleanupTestCase() {
        restore("WAYLAND_DISPLAY", hadWayland_, savedWayland_);
        restore("DISPLAY", hadX11_, savedX11_);
    }

    void testDetectPrefersWayland() {
        QVERIFY(detectDisplayServer("wayland-0", ":0") == DisplayServer::Wayland);
        QVERIFY(detectDisplayServer("wayland-0", nullptr) == DisplayServer::Wayland);
        QVERIFY(detectDisplayServer(nullptr, ":1") == DisplayServer::X11);
        QVERIFY(detectDisplayServer(nullptr, nullptr) == DisplayServer::Unknown);
    }

    void testDisplayServerNames() {
        QCOMPARE(std::string(toString(DisplayServer::X11)), std::string("X11"));
        QCOMPARE(std::string(toString(DisplayServer::Wayland)),
                 std::string("Wayland"));
        QCOMPARE(std::string(toString(DisplayServer::Unknown)),
                 std::string("Unknown"));
    }

    void testCreateWithoutDisplayServer() {
        qunsetenv("WAYLAND_DISPLAY");
        qunsetenv("DISPLAY");

        auto capture = LinuxScreenCapture::create();
        QVERIFY(capture.isErr());
        QVERIFY(capture.error().kind == CaptureErrorKind::CaptureFailed);
        QVERIFY(capture.error().message.starts_with("No display server detected"));

        auto generic = createScreenCapture();
        QVERIFY(generic.isErr());
    }

    void testWaylandSessionReportsPlaceholder() {
        qputenv("WAYLAND_DISPLAY", "wayland-test");

        auto capture = LinuxScreenCapture::create();
        QVERIFY(capture.isOk());
        QVERIFY((*capture)->displayServer() == DisplayServer::Wayland);
        QCOMPARE(std::string((*capture)->backendName()),
                 std::string("linux-wayland"));

        auto displays = (*capture)->getDisplays();
        QVERIFY(displays.isOk());
        QCOMPARE(displays->size(), size_t(1));
        QVERIFY(displays->front().isPrimary);

        auto frame = (*capture)->captureFrame(0);
        QVERIFY(frame.isErr());
        QVERIFY(frame.error().kind == CaptureErrorKind::NotSupported);

        // The state machine still works on top of the placeholder
        QVERIFY((*capture)->startCapture(0).isOk());
        QVERIFY((*capture)->stopCapture().isOk());

        qunsetenv("WAYLAND_DISPLAY");
    }

    void testX11RepeatedCaptureKeepsGeometry() {
        auto capture = x11CaptureOrSkip();
        if (!capture)
            return;

        auto displays = capture->getDisplays();
        QVERIFY(displays.isOk());
        QVERIFY(!displays->empty());
        const Display& first = displays->front();

        for (int i = 0; i < 5; ++i) {
            auto frame = capture->captureFrame(first.id);
            QVERIFY2(frame.isOk(), frame ? "" : frame.error().message.c_str());
            QCOMPARE(frame->width, first.width);
            QCOMPARE(frame->height, first.height);
            QVERIFY(frame->isValid());
        }
    }

    void testX11RegionOutsideScreenFails() {
        auto capture = x11CaptureOrSkip();
        if (!capture)
            return;

        // XGetImage raises BadMatch here; it must come back as an error
        auto frame = capture->captureRegion(1'000'000, 1'000'000, 64, 64);
        QVERIFY(frame.isErr());
        QVERIFY(frame.error().kind == CaptureErrorKind::CaptureFailed);

        // The connection is still usable afterwards
        auto inside = capture->captureRegion(0, 0, 8, 8);
        QVERIFY2(inside.isOk(), inside ? "" : inside.error().message.c_str());
        QCOMPARE(inside->width, 8u);
    }

    void testRegionOnWaylandIsUnsupported() {
        qputenv("WAYLAND_DISPLAY", "wayland-test");
        auto capture = LinuxScreenCapture::create();
        QVERIFY(capture.isOk());
        auto frame = (*capture)->captureRegion(0, 0, 8, 8);
        QVERIFY(frame.isErr());
        QVERIFY(frame.error().kind == CaptureErrorKind::NotSupported);
        qunsetenv("WAYLAND_DISPLAY");
    }

private:
    // Null (and the test skipped) unless an X server is reachable
    std::unique_ptr<LinuxScreenCapture> x11CaptureOrSkip() {
        restore("DISPLAY", hadX11_, savedX11_);
        qunsetenv("WAYLAND_DISPLAY");
        if (!hadX11_) {
            QTest::qSkip("DISPLAY is not set", __FILE__, __LINE__);
            return nullptr;
        }
        auto capture = LinuxScreenCapture::create();
        if (!capture || !(*capture)->getDisplays()) {
            QTest::qSkip("No reachable X server", __FILE__, __LINE__);
            return nullptr;
        }
        return std::move(*capture);
    }

    static void restore(const char* name, bool had, const QByteArray& value) {
        if (had)
            qputenv(name, value);
        else
            qunsetenv(name);
    }

    QByteArray savedWayland_;
    QByteArray savedX11_;
    bool hadWayland_{false};
    bool hadX11_{false};
};

QTEST_GUILESS_MAIN(TestLinuxScreenCapture)
#include "test_LinuxScreenCapture.moc"
