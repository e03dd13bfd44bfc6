#ifndef SCT_IMAGE_PIXEL_FORMATS_HPP_
#define SCT_IMAGE_PIXEL_FORMATS_HPP_

#include <sct_image/sct_image_export.h>

#include <cstdint>
#include <string_view>

namespace sct_image {

// ============================================================================
// Pixel Format Catalog
// ============================================================================

enum class channel_layout {
    rgb,
    rgba
};

enum class decode_pathway {
    rgb565_le,           // 16-bit packed 5/6/5, little-endian
    etc2_rgba8,          // ETC2 color + EAC alpha, 16 bytes per 4x4 block
    astc,                // ASTC, block size in the descriptor
    plain_rgb,           // 8-bit RGB triplets
    plain_rgba,          // 8-bit RGBA quads
    compressed_generic,  // block format without a decoder, passed through as bytes
    unknown
};

[[nodiscard]] SCT_IMAGE_EXPORT const char* to_string(decode_pathway pathway) noexcept;

struct pixel_format_descriptor {
    channel_layout layout = channel_layout::rgba;
    int channels = 4;
    decode_pathway pathway = decode_pathway::unknown;
    int block_width = 0;   // ASTC only
    int block_height = 0;  // ASTC only
    std::string_view name = "UNKNOWN";
};

/**
 * Map an SCT pixel format code to its channel layout and decode pathway.
 *   4       RGB565 little-endian
 *   6       RGB
 *   16      named RGB565, stored as plain RGB
 *   17-26   RGBA (except 19)
 *   19      ETC2 RGBA8
 *   40      ASTC 4x4
 *   41-53   block compressed without a decoder (except 44, 47)
 *   44      ASTC 6x6
 *   47      ASTC 8x8
 * Any other code is unknown and treated as RGBA.
 */
[[nodiscard]] SCT_IMAGE_EXPORT pixel_format_descriptor classify_pixel_format(std::uint32_t code) noexcept;

} // namespace sct_image

#endif // SCT_IMAGE_PIXEL_FORMATS_HPP_
