#include <QtTest>
#include "capture/DisplayId.hpp"
#include "capture/PixelLayout.hpp"

using namespace oc;

class TestPixelLayout : public QObject {
    Q_OBJECT

private slots:
    void testStripRowPaddingRemovesPadding() {
        // 2x2 image, 12 byte rows (4 bytes of padding each)
        std::vector<u8> src = {1, 2, 3, 4, 5, 6, 7, 8, 0xEE, 0xEE, 0xEE, 0xEE,
                               9, 10, 11, 12, 13, 14, 15, 16, 0xEE, 0xEE, 0xEE, 0xEE};
        auto out = pixel::stripRowPadding(src.data(), src.size(), 2, 2, 12);
        QVERIFY(out.isOk());
        std::vector<u8> expected = {1, 2, 3, 4, 5, 6, 7, 8,
                                    9, 10, 11, 12, 13, 14, 15, 16};
        QVERIFY(*out == expected);
    }

    void testStripRowPaddingTightRows() {
        std::vector<u8> src(3 * 2 * 4, 7);
        auto out = pixel::stripRowPadding(src.data(), src.size(), 3, 2, 12);
        QVERIFY(out.isOk());
        QCOMPARE(out->size(), src.size());
    }

    void testStripRowPaddingLastRowNeedsNoPadding() {
        std::vector<u8> src(16 + 8, 1);
        auto out = pixel::stripRowPadding(src.data(), src.size(), 2, 2, 16);
        QVERIFY(out.isOk());
        QCOMPARE(out->size(), size_t(16));
    }

    void testStripRowPaddingRejectsBadInput() {
        std::vector<u8> src(32, 0);
        QVERIFY(pixel::stripRowPadding(nullptr, 32, 2, 2, 8).isErr());
        QVERIFY(pixel::stripRowPadding(src.data(), src.size(), 4, 2, 8).isErr());

        auto tooSmall = pixel::stripRowPadding(src.data(), 20, 2, 3, 8);
        QVERIFY(tooSmall.isErr());
        QVERIFY(tooSmall.error().message.starts_with("Pixel buffer too small"));
    }

    void testPackX11Depth24ForcesOpaque() {
        std::vector<u8> src = {10, 20, 30, 0, 40, 50, 60, 0};
        auto out = pixel::packX11Pixels(src.data(), src.size(), 2, 1, 8, 32, 24);
        QVERIFY(out.isOk());
        std::vector<u8> expected = {10, 20, 30, 255, 40, 50, 60, 255};
        QVERIFY(*out == expected);
    }

    void testPackX11Depth32KeepsAlpha() {
        std::vector<u8> src = {10, 20, 30, 128};
        auto out = pixel::packX11Pixels(src.data(), src.size(), 1, 1, 4, 32, 32);
        QVERIFY(out.isOk());
        QCOMPARE((*out)[3], u8(128));
    }

    void testPackX11PackedBgr() {
        // 2x1, 24 bpp, 8 byte rows
        std::vector<u8> src = {1, 2, 3, 4, 5, 6, 0, 0};
        auto out = pixel::packX11Pixels(src.data(), src.size(), 2, 1, 8, 24, 24);
        QVERIFY(out.isOk());
        std::vector<u8> expected = {1, 2, 3, 255, 4, 5, 6, 255};
        QVERIFY(*out == expected);
    }

    void testPackX11RejectsUnsupportedDepth() {
        std::vector<u8> src(8, 0);
        auto out = pixel::packX11Pixels(src.data(), src.size(), 2, 2, 4, 16, 16);
        QVERIFY(out.isErr());
        QCOMPARE(out.error().message,
                 std::string("Unsupported X11 pixel layout: 16 bits per pixel"));
    }

    void testDisplayIdPacking() {
        static_assert(packDisplayId(0, 0) == 0);
        static_assert(packDisplayId(1, 2) == 0x00010002u);

        const u32 id = packDisplayId(3, 65535);
        const auto ao = unpackDisplayId(id);
        QCOMPARE(ao.adapter, u16(3));
        QCOMPARE(ao.output, u16(65535));
        QVERIFY(unpackDisplayId(packDisplayId(7, 1)) == (AdapterOutput{7, 1}));
        QVERIFY(packDisplayId(0, 1) != packDisplayId(1, 0));
    }
};

QTEST_GUILESS_MAIN(TestPixelLayout)
#include "test_PixelLayout.moc"
