#include "CaptureTypes.hpp"

namespace oc {

std::string_view toString(CaptureErrorKind kind) {
    switch (kind) {
    case CaptureErrorKind::PermissionDenied:
        return "PermissionDenied";
    case CaptureErrorKind::DisplayNotFound:
        return "DisplayNotFound";
    case CaptureErrorKind::CaptureFailed:
        return "CaptureFailed";
    case CaptureErrorKind::NotSupported:
        return "NotSupported";
    case CaptureErrorKind::AlreadyCapturing:
        return "AlreadyCapturing";
    case CaptureErrorKind::NotCapturing:
        return "NotCapturing";
    }
    return "Unknown";
}

std::string CaptureError::describe() const {
    return std::string(toString(kind)) + ": " + message;
}

} // namespace oc
