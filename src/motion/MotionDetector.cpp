#include "MotionDetector.hpp"
#include <algorithm>
#include <cstdlib>

namespace oc {

namespace {

inline bool pixelChanged(const u8* a, const u8* b) {
    return std::abs(int(a[0]) - int(b[0])) > MotionDetector::kPixelThreshold ||
           std::abs(int(a[1]) - int(b[1])) > MotionDetector::kPixelThreshold ||
           std::abs(int(a[2]) - int(b[2])) > MotionDetector::kPixelThreshold;
}

} // namespace

MotionDetector::MotionDetector(f32 threshold)
    : threshold_(std::clamp(threshold, 0.0f, 1.0f)) {}

void MotionDetector::setThreshold(f32 threshold) {
    threshold_ = std::clamp(threshold, 0.0f, 1.0f);
}

void MotionDetector::reset() {
    previous_.clear();
    previous_.shrink_to_fit();
    previousWidth_ = 0;
    previousHeight_ = 0;
}

MotionResult MotionDetector::detectMotion(const RawFrame& frame) {
    const bool newBaseline = previous_.empty() ||
                             frame.width != previousWidth_ ||
                             frame.height != previousHeight_ ||
                             frame.format != previousFormat_ ||
                             frame.data.size() != previous_.size();
    if (newBaseline) {
        previous_ = frame.data;
        previousWidth_ = frame.width;
        previousHeight_ = frame.height;
        previousFormat_ = frame.format;

        MotionResult result;
        result.hasMotion = true;
        result.changedPercentage = 1.0f;
        result.boundingBoxes.push_back({0, 0, frame.width, frame.height});
        return result;
    }

    const usize totalPixels = static_cast<usize>(frame.width) * frame.height;
    const usize sampled = std::min(totalPixels, frame.data.size() / kBytesPerPixel);
    usize changed = 0;
    const u8* cur = frame.data.data();
    const u8* prev = previous_.data();
    for (usize i = 0; i < sampled; ++i) {
        if (pixelChanged(cur + i * kBytesPerPixel, prev + i * kBytesPerPixel))
            ++changed;
    }

    MotionResult result;
    result.changedPercentage =
            totalPixels ? static_cast<f32>(changed) / static_cast<f32>(totalPixels)
                        : 0.0f;
    result.hasMotion = totalPixels > 0 && result.changedPercentage >= threshold_;
    if (result.hasMotion && frame.isValid())
        result.boundingBoxes = changedCells(frame);

    previous_ = frame.data;
    return result;
}

std::vector<Rect> MotionDetector::changedCells(const RawFrame& frame) const {
    std::vector<Rect> boxes;
    const u32 w = frame.width;
    const u32 h = frame.height;

    for (u32 gy = 0; gy < kGridSize; ++gy) {
        const u32 y0 = static_cast<u32>(u64(gy) * h / kGridSize);
        const u32 y1 = static_cast<u32>(u64(gy + 1) * h / kGridSize);
        for (u32 gx = 0; gx < kGridSize; ++gx) {
            const u32 x0 = static_cast<u32>(u64(gx) * w / kGridSize);
            const u32 x1 = static_cast<u32>(u64(gx + 1) * w / kGridSize);
            const usize cellPixels = usize(x1 - x0) * (y1 - y0);
            if (cellPixels == 0)
                continue;

            usize changed = 0;
            for (u32 y = y0; y < y1; ++y) {
                const usize row = usize(y) * w;
                for (u32 x = x0; x < x1; ++x) {
                    const usize off = (row + x) * kBytesPerPixel;
                    if (pixelChanged(frame.data.data() + off, previous_.data() + off))
                        ++changed;
                }
            }

            if (static_cast<f32>(changed) / static_cast<f32>(cellPixels) >
                kCellThreshold)
                boxes.push_back({x0, y0, x1 - x0, y1 - y0});
        }
    }
    return boxes;
}

} // namespace oc
