/**
 * @file EncoderSettings.hpp
 * @brief Codec, quality and hardware-acceleration choices for VideoEncoder.
 *
 * Maps the user-facing vocabulary (codec family, quality level, hardware
 * on/off) to concrete FFmpeg encoder names and CRF values. Hardware encoder
 * names are per platform; a non-empty hardwareCodecOverride replaces the
 * platform name.
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "core/ConfigData.hpp"
#include "util/Types.hpp"

namespace oc {

enum class VideoCodec { H264 };

enum class CompressionQuality { High, Medium, Low };

enum class Platform { MacOS, Windows, Linux, Other };

constexpr Platform currentPlatform() {
#if defined(__APPLE__)
    return Platform::MacOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Other;
#endif
}

constexpr u32 toCrf(CompressionQuality q) {
    switch (q) {
    case CompressionQuality::High:
        return 20;
    case CompressionQuality::Medium:
        return 25;
    case CompressionQuality::Low:
        return 30;
    }
    return 25;
}

std::string_view toString(CompressionQuality q);
std::optional<CompressionQuality> parseQuality(std::string_view name);
std::optional<VideoCodec> parseCodec(std::string_view name);

// Hardware encoder for the platform, or the software one where there is none
std::string_view hardwareCodecName(VideoCodec codec, Platform platform);
std::string_view softwareCodecName(VideoCodec codec);

struct EncoderSettings {
    VideoCodec codec{VideoCodec::H264};
    CompressionQuality quality{CompressionQuality::Medium};
    bool hardwareAcceleration{true};
    std::string hardwareCodecOverride;
    std::string preset{"medium"};
    u32 workerThreads{1};
    Platform platform{currentPlatform()};

    // Name tried first: the hardware encoder when acceleration is on,
    // otherwise the software encoder
    std::string resolveCodecName() const;
    std::string softwareCodec() const {
        return std::string(softwareCodecName(codec));
    }
    u32 crf() const {
        return toCrf(quality);
    }

    static EncoderSettings fromConfig(const EncoderConfig& cfg);
};

} // namespace oc
