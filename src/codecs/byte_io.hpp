#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace sct_image {

// Little-endian readers (caller guarantees the bytes exist)
inline std::uint16_t read_le16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0]) |
           static_cast<std::uint16_t>(static_cast<std::uint16_t>(p[1]) << 8);
}

inline std::uint32_t read_le32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

// Bounds-checked variants: return false and leave value untouched when
// the field does not fit in the buffer
inline bool read_le16(std::span<const std::uint8_t> data, std::size_t offset, std::uint16_t& value) {
    if (offset > data.size() || data.size() - offset < 2) {
        return false;
    }
    value = read_le16(data.data() + offset);
    return true;
}

inline bool read_le32(std::span<const std::uint8_t> data, std::size_t offset, std::uint32_t& value) {
    if (offset > data.size() || data.size() - offset < 4) {
        return false;
    }
    value = read_le32(data.data() + offset);
    return true;
}

// Big-endian reader for 64-bit texture blocks
inline std::uint64_t read_be64(const std::uint8_t* p) {
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<std::uint64_t>(p[i]);
    }
    return value;
}

} // namespace sct_image
