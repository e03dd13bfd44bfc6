#ifndef SCT_IMAGE_CODECS_SCT_HPP_
#define SCT_IMAGE_CODECS_SCT_HPP_

#include <sct_image/sct_image_export.h>
#include <sct_image/container.hpp>
#include <sct_image/heuristics.hpp>
#include <sct_image/pixel_formats.hpp>
#include <sct_image/surface.hpp>
#include <sct_image/types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sct_image {

// ============================================================================
// Decode Report
// ============================================================================

enum class payload_source {
    raw,           // payload used as stored
    decompressed,  // payload replaced by the LZ4 variant output
    fallback_raw   // decompression attempted, failed, raw payload used
};

[[nodiscard]] SCT_IMAGE_EXPORT const char* to_string(payload_source source) noexcept;

/**
 * What the decoder found and decided for one file.
 * Meant for diagnostics; decoding never depends on it.
 */
struct decode_report {
    std::size_t payload_size = 0;                 // bytes after the header
    std::size_t data_size = 0;                    // bytes handed to the pixel decoder
    std::uint32_t declared_size = 0;              // from the compression frame, if decompressed
    payload_source source = payload_source::raw;
    std::optional<compression_probe> probe;       // SCT2 raw/alpha flagged files only
    std::vector<std::string> notes;               // codec fallbacks and similar events
};

// ============================================================================
// Decoded Image
// ============================================================================

struct decoded_image {
    int width = 0;
    int height = 0;
    container_header header;
    pixel_format_descriptor format;
    std::vector<std::uint8_t> rgba;  // exactly width * height * 4 bytes
    decode_report report;
};

// ============================================================================
// SCT / SCT2 Decoder
// ============================================================================

class SCT_IMAGE_EXPORT sct_decoder {
public:
    static constexpr std::string_view name = "sct";
    static constexpr std::string_view extensions[] = {".sct", ".sct2"};

    /**
     * Check if data appears to be an SCT or SCT2 texture.
     * @param data Raw file data
     * @return true if the signature matches either container variant
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode SCT texture data to a surface (always RGBA).
     * @param data Raw file data
     * @param surf Destination surface
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});

    /**
     * Decode SCT texture data to an RGBA buffer with header and diagnostics.
     * Supports:
     *   - Legacy SCT (always LZ4 compressed)
     *   - SCT2 with declared, probed or opportunistic decompression
     *   - RGB565, RGB, RGBA, ETC2 RGBA8, ASTC 4x4/6x6/8x8
     *
     * @param data Raw file data
     * @param image Receives the decoded image
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result decode_image(std::span<const std::uint8_t> data,
                                                     decoded_image& image,
                                                     const decode_options& options = {});

    /**
     * Extract the pixel data following the header, decompressing it when the
     * container variant and flags call for it.
     * @param data Raw file data
     * @param header Header decoded from data
     * @param pixel_data Receives the bytes for the pixel decoder
     * @param report Receives the decompression decision
     * @param options Decode options
     * @return Decode result; only legacy files fail on a bad compression frame
     */
    [[nodiscard]] static decode_result extract_pixel_data(std::span<const std::uint8_t> data,
                                                           const container_header& header,
                                                           std::vector<std::uint8_t>& pixel_data,
                                                           decode_report& report,
                                                           const decode_options& options = {});
};

} // namespace sct_image

#endif // SCT_IMAGE_CODECS_SCT_HPP_
