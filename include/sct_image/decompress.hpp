#ifndef SCT_IMAGE_DECOMPRESS_HPP_
#define SCT_IMAGE_DECOMPRESS_HPP_

#include <sct_image/sct_image_export.h>
#include <sct_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sct_image {

// Frame prefix: declared decompressed size + declared compressed size
inline constexpr std::size_t LZ4_FRAME_HEADER_SIZE = 8;

// Shortest back-reference the format can encode
inline constexpr std::size_t LZ4_MIN_MATCH = 4;

/**
 * Output of the SCT LZ4 variant.
 * bytes.size() == actual_size <= declared_size; a stream that ends early
 * yields a shorter buffer, never a zero-padded one.
 */
struct decompressed_payload {
    std::vector<std::uint8_t> bytes;
    std::uint32_t declared_size = 0;
    std::size_t actual_size = 0;

    [[nodiscard]] bool complete() const noexcept { return actual_size == declared_size; }
};

/**
 * Decompress an SCT payload.
 *
 * Frame layout (little-endian):
 *   0-3  declared decompressed size
 *   4-7  declared compressed size (informational)
 *   8-   token stream running to the end of the payload
 *
 * Malformed streams (missing offsets, back-references before the start of
 * the output) end decoding and return what was produced so far.
 *
 * @param payload Compressed payload
 * @param out Receives the decompressed bytes
 * @return truncated_data if the payload is shorter than the frame header or
 *         declares a size above MAX_PIXEL_BUFFER_SIZE, success otherwise
 */
[[nodiscard]] SCT_IMAGE_EXPORT decode_result lz4_decompress(std::span<const std::uint8_t> payload,
                                                            decompressed_payload& out);

} // namespace sct_image

#endif // SCT_IMAGE_DECOMPRESS_HPP_
