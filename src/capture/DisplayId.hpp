/**
 * @file DisplayId.hpp
 * @brief Packing of (adapter, output) pairs into 32-bit display ids.
 *
 * The adapter index occupies the high 16 bits and the output index the low
 * 16 bits, so a display id can be traced back to the adapter/output pair it
 * was enumerated from.
 */

#pragma once
#include "util/Types.hpp"

namespace oc {

struct AdapterOutput {
    u16 adapter{0};
    u16 output{0};

    bool operator==(const AdapterOutput&) const = default;
};

constexpr u32 packDisplayId(u16 adapter, u16 output) {
    return (static_cast<u32>(adapter) << 16) | static_cast<u32>(output);
}

constexpr AdapterOutput unpackDisplayId(u32 id) {
    return {static_cast<u16>(id >> 16), static_cast<u16>(id & 0xFFFFu)};
}

} // namespace oc
