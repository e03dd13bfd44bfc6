#ifndef SCT_IMAGE_CONTAINER_HPP_
#define SCT_IMAGE_CONTAINER_HPP_

#include <sct_image/sct_image_export.h>
#include <sct_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace sct_image {

// ============================================================================
// Container Variants
// ============================================================================

enum class container_variant {
    legacy,   // "SCT" - 9 byte header, always compressed
    v2,       // "SCT2" - 34 byte header with flags
    unknown
};

[[nodiscard]] SCT_IMAGE_EXPORT const char* to_string(container_variant variant) noexcept;

// "SCT2" read as a little-endian 32-bit integer
inline constexpr std::uint32_t SCT2_SIGNATURE = 0x32544353;
// "SC" read as a little-endian 16-bit integer, followed by 'T'
inline constexpr std::uint16_t SCT_SIGNATURE_WORD = 0x4353;
inline constexpr std::uint8_t SCT_SIGNATURE_BYTE = 0x54;

inline constexpr std::size_t SCT_HEADER_SIZE = 9;
inline constexpr std::size_t SCT2_HEADER_SIZE = 34;

// SCT2 header flag bits
inline constexpr std::uint8_t SCT2_FLAG_HAS_ALPHA = 0x01;
inline constexpr std::uint8_t SCT2_FLAG_CROP = 0x02;
inline constexpr std::uint8_t SCT2_FLAG_RAW = 0x10;
inline constexpr std::uint8_t SCT2_FLAG_MIPMAP = 0x20;
inline constexpr std::uint8_t SCT2_FLAG_COMPRESSED = 0x80;

// ============================================================================
// Normalized Header
// ============================================================================

/**
 * Header fields shared by both container variants.
 * Legacy containers leave flags and total_size zeroed.
 */
struct container_header {
    container_variant variant = container_variant::unknown;
    std::uint16_t width = 0;
    std::uint16_t height = 0;
    std::uint16_t texture_width = 0;
    std::uint16_t texture_height = 0;
    std::uint32_t pixel_format_code = 0;
    std::uint32_t data_offset = 0;
    std::uint32_t total_size = 0;
    std::uint8_t flags = 0;
    bool declared_compressed = false;

    [[nodiscard]] bool has_alpha() const noexcept { return (flags & SCT2_FLAG_HAS_ALPHA) != 0; }
    [[nodiscard]] bool crop() const noexcept { return (flags & SCT2_FLAG_CROP) != 0; }
    [[nodiscard]] bool raw() const noexcept { return (flags & SCT2_FLAG_RAW) != 0; }
    [[nodiscard]] bool mipmap() const noexcept { return (flags & SCT2_FLAG_MIPMAP) != 0; }
};

// ============================================================================
// Sniffing and Header Decoding
// ============================================================================

/**
 * Classify a buffer by its leading signature bytes.
 * Buffers shorter than 4 bytes are always unknown.
 */
[[nodiscard]] SCT_IMAGE_EXPORT container_variant sniff_container(std::span<const std::uint8_t> data) noexcept;

/**
 * Decode a legacy SCT header.
 * @param data Complete file data (at least 9 bytes)
 * @param header Receives the normalized header
 * @return Decode result; truncated_data when too short,
 *         invalid_format for zero dimensions
 */
[[nodiscard]] SCT_IMAGE_EXPORT decode_result decode_legacy_header(std::span<const std::uint8_t> data,
                                                                  container_header& header);

/**
 * Decode an SCT2 header.
 * @param data Complete file data (at least 34 bytes)
 * @param header Receives the normalized header
 * @return Decode result; truncated_data when too short or when the
 *         data offset points past the end, invalid_format for zero dimensions
 */
[[nodiscard]] SCT_IMAGE_EXPORT decode_result decode_v2_header(std::span<const std::uint8_t> data,
                                                              container_header& header);

/**
 * Sniff the variant and run the matching header decoder.
 */
[[nodiscard]] SCT_IMAGE_EXPORT decode_result decode_container_header(std::span<const std::uint8_t> data,
                                                                     container_header& header);

} // namespace sct_image

#endif // SCT_IMAGE_CONTAINER_HPP_
