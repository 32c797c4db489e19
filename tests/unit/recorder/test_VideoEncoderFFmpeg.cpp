#include <QtTest>
#include "recorder/VideoEncoderFFmpeg.hpp"
#include "support/TestFrames.hpp"

using namespace oc;

class TestVideoEncoderFFmpeg : public QObject {
    Q_OBJECT

private slots:
    void init() {
        QVERIFY(dir_.isValid());
    }

    void testUnknownCodecFails() {
        VideoEncoderFFmpeg enc;
        EncodeParams params;
        params.outputPath = path("bad_codec.mp4");
        params.width = 64;
        params.height = 48;
        params.codecName = "no_such_encoder";

        auto res = enc.open(params);
        QVERIFY(res.isErr());
        QCOMPARE(res.error().message, std::string("Codec not found: no_such_encoder"));
        QVERIFY(!enc.isOpen());
    }

    void testTinyFrameRejected() {
        VideoEncoderFFmpeg enc;
        EncodeParams params;
        params.outputPath = path("tiny.mp4");
        params.width = 1;
        params.height = 1;
        QVERIFY(enc.open(params).isErr());
    }

    void testEncodeWithoutOpenFails() {
        VideoEncoderFFmpeg enc;
        auto frame = test::gradientFrame(16, 16, 0, 0);
        QVERIFY(enc.encodeFrame(frame).isErr());
        QVERIFY(enc.finish().isErr());
    }

    void testGeometryMismatchRejected() {
        if (!hasSoftwareEncoder())
            QSKIP("FFmpeg was built without libx264");
        VideoEncoderFFmpeg enc;
        EncodeParams params;
        params.outputPath = path("mismatch.mp4");
        params.width = 64;
        params.height = 48;
        QVERIFY(enc.open(params).isOk());

        auto res = enc.encodeFrame(test::gradientFrame(32, 48, 0, 0));
        QVERIFY(res.isErr());
        QVERIFY(res.error().message.find("does not match") != std::string::npos);

        auto bgra = test::gradientFrame(64, 48, 0, 0, PixelFormat::BGRA8);
        QVERIFY(enc.encodeFrame(bgra).isErr());
        QCOMPARE(enc.framesEncoded(), i64(0));
    }

    void testOddSizeIsRoundedDown() {
        if (!hasSoftwareEncoder())
            QSKIP("FFmpeg was built without libx264");
        VideoEncoderFFmpeg enc;
        EncodeParams params;
        params.outputPath = path("odd.mp4");
        params.width = 65;
        params.height = 49;
        params.fps = 10;
        QVERIFY(enc.open(params).isOk());
        QCOMPARE(enc.outputWidth(), 64u);
        QCOMPARE(enc.outputHeight(), 48u);

        for (u32 i = 0; i < 5; ++i)
            QVERIFY(enc.encodeFrame(test::gradientFrame(65, 49, i, i * 100)).isOk());
        QVERIFY(enc.finish().isOk());
        QCOMPARE(enc.framesEncoded(), i64(5));
        QVERIFY(enc.bytesWritten() > 0);
        QVERIFY(enc.finish().isErr());
        enc.release();
        QVERIFY(!enc.isOpen());
        QVERIFY(fs::file_size(params.outputPath) > 0);
    }

private:
    static bool hasSoftwareEncoder() {
        return avcodec_find_encoder_by_name("libx264") != nullptr;
    }

    fs::path path(const char* name) const {
        return fs::path(dir_.path().toStdString()) / name;
    }

    QTemporaryDir dir_;
};

QTEST_GUILESS_MAIN(TestVideoEncoderFFmpeg)
#include "test_VideoEncoderFFmpeg.moc"
