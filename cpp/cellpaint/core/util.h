#ifndef CELLPAINT_CORE_UTIL_H
#define CELLPAINT_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cstring>

namespace cellpaint {

static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline std::size_t alignTo4(std::size_t n) noexcept {
    return (n + 3u) & ~static_cast<std::size_t>(3u);
}

} // namespace cellpaint

#endif // CELLPAINT_CORE_UTIL_H
