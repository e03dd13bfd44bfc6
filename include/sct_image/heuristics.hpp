#ifndef SCT_IMAGE_HEURISTICS_HPP_
#define SCT_IMAGE_HEURISTICS_HPP_

#include <sct_image/sct_image_export.h>
#include <sct_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace sct_image {

/**
 * Measurements taken while deciding whether an SCT2 payload is compressed.
 */
struct compression_probe {
    std::size_t expected_size = 0;     // estimated size of the raw texture data
    double size_ratio = 0.0;           // payload size / expected size
    double decompressed_ratio = 0.0;   // decompressed size / expected size
    bool decompression_works = false;  // decompressor produced at least one byte
    bool compressed = false;           // final decision
};

/**
 * Estimate the raw byte size of a texture.
 * Format 40 (ASTC 4x4) uses 16 bytes per 4x4 block; other formats use
 * width * height * options.approx_bytes_per_pixel.
 */
[[nodiscard]] SCT_IMAGE_EXPORT std::size_t expected_texture_size(int width, int height,
                                                                 std::uint32_t pixel_format_code,
                                                                 const decode_options& options = {}) noexcept;

/**
 * Probe an SCT2 payload whose flags (raw 0x10, has_alpha 0x01) do not say
 * reliably whether it is compressed. The payload counts as compressed when
 * it is smaller than options.compressed_size_ratio of the expected size,
 * decompresses to at least one byte, and the decompressed size is a better
 * match for the expected size than the payload itself.
 */
[[nodiscard]] SCT_IMAGE_EXPORT compression_probe probe_compression(std::span<const std::uint8_t> payload,
                                                                   int width, int height,
                                                                   std::uint32_t pixel_format_code,
                                                                   const decode_options& options = {});

/**
 * Decision-only form of probe_compression().
 * Payloads shorter than the compression frame header are never compressed.
 */
[[nodiscard]] SCT_IMAGE_EXPORT bool should_decompress(std::span<const std::uint8_t> payload,
                                                      int width, int height,
                                                      std::uint32_t pixel_format_code,
                                                      const decode_options& options = {});

} // namespace sct_image

#endif // SCT_IMAGE_HEURISTICS_HPP_
