#include "ConsentGate.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace oc {

std::string_view toString(Feature feature) {
    switch (feature) {
    case Feature::ScreenRecording:
        return "screen_recording";
    case Feature::OsActivity:
        return "os_activity";
    case Feature::KeyboardRecording:
        return "keyboard_recording";
    case Feature::MouseRecording:
        return "mouse_recording";
    case Feature::CameraRecording:
        return "camera_recording";
    case Feature::MicrophoneRecording:
        return "microphone_recording";
    }
    return "unknown";
}

std::optional<Feature> parseFeature(std::string_view tag) {
    std::string lower(tag);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (Feature f : kAllFeatures) {
        if (toString(f) == lower)
            return f;
    }
    return std::nullopt;
}

} // namespace oc
