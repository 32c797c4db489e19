/**
 * @file CaptureTypes.hpp
 * @brief Value types shared by every capture backend.
 *
 * Display describes one monitor from a single enumeration snapshot. Its id is
 * only meaningful inside the running process and must never be persisted.
 * RawFrame is a tightly packed 4 bytes-per-pixel image, row-major, no padding.
 *
 * @section Errors
 * CaptureError carries a CaptureErrorKind so callers can react to the kind
 * (re-enumerate on DisplayNotFound, surface PermissionDenied to the user)
 * while the message keeps the backend diagnostic text.
 */

#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace oc {

enum class PixelFormat { RGBA8, BGRA8 };

constexpr std::string_view toString(PixelFormat fmt) {
    return fmt == PixelFormat::RGBA8 ? "RGBA8" : "BGRA8";
}

constexpr usize kBytesPerPixel = 4;

struct Display {
    u32 id{0};
    std::string name;
    u32 width{0};
    u32 height{0};
    bool isPrimary{false};
};

struct RawFrame {
    i64 timestamp{0}; // ms since epoch
    u32 width{0};
    u32 height{0};
    std::vector<u8> data;
    PixelFormat format{PixelFormat::RGBA8};

    usize expectedSize() const {
        return static_cast<usize>(width) * height * kBytesPerPixel;
    }
    bool isValid() const {
        return width > 0 && height > 0 && data.size() == expectedSize();
    }
};

enum class CaptureErrorKind {
    PermissionDenied,
    DisplayNotFound,
    CaptureFailed,
    NotSupported,
    AlreadyCapturing,
    NotCapturing
};

std::string_view toString(CaptureErrorKind kind);

struct CaptureError {
    CaptureErrorKind kind{CaptureErrorKind::CaptureFailed};
    std::string message;
    u32 displayId{0}; // set for DisplayNotFound

    static CaptureError permissionDenied(std::string msg) {
        return {CaptureErrorKind::PermissionDenied, std::move(msg), 0};
    }
    static CaptureError displayNotFound(u32 id) {
        return {CaptureErrorKind::DisplayNotFound,
                "Display not found: " + std::to_string(id),
                id};
    }
    static CaptureError captureFailed(std::string msg) {
        return {CaptureErrorKind::CaptureFailed, std::move(msg), 0};
    }
    static CaptureError notSupported(std::string msg) {
        return {CaptureErrorKind::NotSupported, std::move(msg), 0};
    }
    static CaptureError alreadyCapturing() {
        return {CaptureErrorKind::AlreadyCapturing,
                "Capture is already in progress",
                0};
    }
    static CaptureError notCapturing() {
        return {CaptureErrorKind::NotCapturing, "Capture is not active", 0};
    }

    // "<Kind>: <message>"
    std::string describe() const;
};

template <typename T>
using CaptureResult = Result<T, CaptureError>;

} // namespace oc
