/**
 * @file ConsentGate.hpp
 * @brief Interface to the application's consent store.
 *
 * The recorder asks the gate before touching the screen. Storing and
 * changing consent is the application's business; it implements this
 * interface over whatever store it uses.
 */

#pragma once
#include <array>
#include <optional>
#include <string_view>

namespace oc {

enum class Feature {
    ScreenRecording,
    OsActivity,
    KeyboardRecording,
    MouseRecording,
    CameraRecording,
    MicrophoneRecording
};

inline constexpr std::array<Feature, 6> kAllFeatures{
        Feature::ScreenRecording,
        Feature::OsActivity,
        Feature::KeyboardRecording,
        Feature::MouseRecording,
        Feature::CameraRecording,
        Feature::MicrophoneRecording};

// Stable snake_case tag, e.g. "screen_recording"
std::string_view toString(Feature feature);

// Case-insensitive inverse of toString()
std::optional<Feature> parseFeature(std::string_view tag);

class ConsentGate {
public:
    virtual ~ConsentGate() = default;

    virtual bool isConsentGranted(Feature feature) = 0;
};

} // namespace oc
