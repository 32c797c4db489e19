#include "EncoderSettings.hpp"
#include "core/Logger.hpp"

namespace oc {

std::string_view toString(CompressionQuality q) {
    switch (q) {
    case CompressionQuality::High:
        return "high";
    case CompressionQuality::Medium:
        return "medium";
    case CompressionQuality::Low:
        return "low";
    }
    return "medium";
}

std::optional<CompressionQuality> parseQuality(std::string_view name) {
    if (name == "high")
        return CompressionQuality::High;
    if (name == "medium")
        return CompressionQuality::Medium;
    if (name == "low")
        return CompressionQuality::Low;
    return std::nullopt;
}

std::optional<VideoCodec> parseCodec(std::string_view name) {
    if (name == "h264")
        return VideoCodec::H264;
    return std::nullopt;
}

std::string_view hardwareCodecName(VideoCodec codec, Platform platform) {
    switch (codec) {
    case VideoCodec::H264:
        switch (platform) {
        case Platform::MacOS:
            return "h264_videotoolbox";
        case Platform::Windows:
            return "h264_nvenc";
        case Platform::Linux:
            return "h264_vaapi";
        case Platform::Other:
            break;
        }
        return "libx264";
    }
    return "libx264";
}

std::string_view softwareCodecName(VideoCodec codec) {
    switch (codec) {
    case VideoCodec::H264:
        return "libx264";
    }
    return "libx264";
}

std::string EncoderSettings::resolveCodecName() const {
    if (!hardwareAcceleration)
        return softwareCodec();
    if (!hardwareCodecOverride.empty())
        return hardwareCodecOverride;
    return std::string(hardwareCodecName(codec, platform));
}

EncoderSettings EncoderSettings::fromConfig(const EncoderConfig& cfg) {
    EncoderSettings s;
    if (auto codec = parseCodec(cfg.codec)) {
        s.codec = *codec;
    } else {
        LOG_WARN("Unsupported codec '{}', using h264", cfg.codec);
    }
    if (auto quality = parseQuality(cfg.quality)) {
        s.quality = *quality;
    } else {
        LOG_WARN("Unknown quality '{}', using medium", cfg.quality);
    }
    s.hardwareAcceleration = cfg.hardwareAcceleration;
    s.hardwareCodecOverride = cfg.hardwareCodec;
    s.preset = cfg.preset.empty() ? std::string("medium") : cfg.preset;
    s.workerThreads = cfg.workerThreads == 0 ? 1 : cfg.workerThreads;
    return s;
}

} // namespace oc
