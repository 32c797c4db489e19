/**
 * @file Types.hpp
 * @brief Fixed-width type aliases and time helpers shared across the project.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace oc {

namespace fs = std::filesystem;

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;
using usize = std::size_t;

using Clock = std::chrono::steady_clock;
using Duration = std::chrono::milliseconds;

// Wall-clock milliseconds since the Unix epoch
inline i64 nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
}

} // namespace oc
