/**
 * @file MotionDetector.hpp
 * @brief Frame-to-frame change detection for the recording pipeline.
 *
 * MotionDetector keeps the previous frame and compares each new frame with
 * it. A pixel counts as changed when any of its colour channels moved by
 * more than kPixelThreshold; a frame has motion when the changed fraction
 * reaches the configured threshold.
 *
 * When a frame has motion it is split into a kGridSize x kGridSize grid and
 * every cell with more than kCellThreshold of its pixels changed is reported
 * as its own box. Neighbouring cells are reported separately, never merged.
 *
 * The first frame, and any frame whose size or pixel format differs from the
 * stored one, reports full motion and becomes the new baseline.
 *
 * @section Patterns
 * - Stateful filter: holds at most one previous frame.
 */

#pragma once
#include <vector>
#include "capture/CaptureTypes.hpp"
#include "util/Types.hpp"

namespace oc {

struct Rect {
    u32 x{0};
    u32 y{0};
    u32 width{0};
    u32 height{0};

    bool operator==(const Rect&) const = default;
};

struct MotionResult {
    bool hasMotion{false};
    f32 changedPercentage{0.0f}; // fraction in [0, 1]
    std::vector<Rect> boundingBoxes;
};

class MotionDetector {
public:
    static constexpr u8 kPixelThreshold = 10;
    static constexpr u32 kGridSize = 10;
    static constexpr f32 kCellThreshold = 0.05f;

    // threshold: fraction of changed pixels needed for motion, clamped to [0, 1]
    explicit MotionDetector(f32 threshold = 0.05f);

    MotionResult detectMotion(const RawFrame& frame);

    // Forgets the stored frame; the next call behaves like the first
    void reset();

    f32 threshold() const {
        return threshold_;
    }
    void setThreshold(f32 threshold);

    bool hasBaseline() const {
        return !previous_.empty();
    }

private:
    std::vector<Rect> changedCells(const RawFrame& frame) const;

    f32 threshold_;
    std::vector<u8> previous_;
    u32 previousWidth_{0};
    u32 previousHeight_{0};
    PixelFormat previousFormat_{PixelFormat::RGBA8};
};

} // namespace oc
