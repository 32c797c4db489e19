/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * Converts between toml++ tables and the section structs in ConfigData.
 * Missing keys keep their built-in defaults and numeric values are clamped
 * to their valid ranges.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace oc {

class ConfigParsers {
public:
    static constexpr const char* kDefaultOutputDirectory = "~/Videos/observer";

    static void parseCapture(const toml::table& tbl, CaptureConfig& cfg);
    static void parseMotion(const toml::table& tbl, MotionConfig& cfg);
    static void parseEncoder(const toml::table& tbl, EncoderConfig& cfg);
    static void parseRecording(const toml::table& tbl, RecordingConfig& cfg);

    static toml::table serialize(const CaptureConfig& capture,
                                 const MotionConfig& motion,
                                 const EncoderConfig& encoder,
                                 const RecordingConfig& recording,
                                 bool debug);
};

} // namespace oc
