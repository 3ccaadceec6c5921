#ifndef CELLPAINT_CORE_TYPES_H
#define CELLPAINT_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight types and constants shared by the layer stores.

namespace cellpaint {

// Capacity defaults
static constexpr std::uint32_t kDefaultAdditiveCapacity = 100;
static constexpr std::uint32_t kMaxAdditiveCapacity = 4096;

// Command buffer format constants
static constexpr std::uint32_t commandMagicCplc = 0x434C5043; // "CPLC"
static constexpr std::uint32_t commandVersion = 1;
static constexpr std::size_t commandHeaderBytes = 4 * 4;
static constexpr std::size_t perCommandHeaderBytes = 4 * 4;

static constexpr std::uint8_t kChannelMax = 255;

struct Color {
    std::uint8_t r;
    std::uint8_t g;
    std::uint8_t b;
};

inline bool operator==(const Color& a, const Color& b) noexcept {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}
inline bool operator!=(const Color& a, const Color& b) noexcept {
    return !(a == b);
}

inline Color invertColor(const Color& c) noexcept {
    return Color{
        static_cast<std::uint8_t>(kChannelMax - c.r),
        static_cast<std::uint8_t>(kChannelMax - c.g),
        static_cast<std::uint8_t>(kChannelMax - c.b),
    };
}

// Saturates an intermediate channel value to [0, 255].
inline std::uint8_t clampChannel(int v) noexcept {
    if (v < 0) return 0;
    if (v > kChannelMax) return kChannelMax;
    return static_cast<std::uint8_t>(v);
}

enum class StoreKind : std::uint8_t {
    SingleSlot = 0,
    Additive = 1,
    ToggleSet = 2,
};

struct StoreConfig {
    StoreKind kind = StoreKind::SingleSlot;
    std::uint32_t capacity = kDefaultAdditiveCapacity; // Additive only
};

enum class CommandOp : std::uint32_t {
    Add = 1,
    Erase = 2,
    Special = 3,
};

enum class StoreError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    UnknownCommand = 4,
    UnknownLayer = 5,
    Rejected = 6, // valid operation that left the store unchanged
};

} // namespace cellpaint

#endif // CELLPAINT_CORE_TYPES_H
