#include <sct_image/heuristics.hpp>
#include <sct_image/decompress.hpp>

namespace sct_image {

namespace {

constexpr std::uint32_t ASTC_4X4_FORMAT_CODE = 40;
constexpr std::size_t ASTC_BLOCK_DIM = 4;
constexpr std::size_t ASTC_BLOCK_BYTES = 16;

} // namespace

std::size_t expected_texture_size(int width, int height, std::uint32_t pixel_format_code,
                                  const decode_options& options) noexcept {
    if (width <= 0 || height <= 0) {
        return 0;
    }

    const auto w = static_cast<std::size_t>(width);
    const auto h = static_cast<std::size_t>(height);

    if (pixel_format_code == ASTC_4X4_FORMAT_CODE) {
        const std::size_t blocks_w = (w + ASTC_BLOCK_DIM - 1) / ASTC_BLOCK_DIM;
        const std::size_t blocks_h = (h + ASTC_BLOCK_DIM - 1) / ASTC_BLOCK_DIM;
        return blocks_w * blocks_h * ASTC_BLOCK_BYTES;
    }

    const int bpp = options.approx_bytes_per_pixel > 0 ? options.approx_bytes_per_pixel : 2;
    return w * h * static_cast<std::size_t>(bpp);
}

compression_probe probe_compression(std::span<const std::uint8_t> payload, int width, int height,
                                    std::uint32_t pixel_format_code, const decode_options& options) {
    compression_probe probe;
    if (payload.size() < LZ4_FRAME_HEADER_SIZE) {
        return probe;
    }

    probe.expected_size = expected_texture_size(width, height, pixel_format_code, options);
    if (probe.expected_size == 0) {
        return probe;
    }

    const auto expected = static_cast<double>(probe.expected_size);
    probe.size_ratio = static_cast<double>(payload.size()) / expected;

    decompressed_payload decompressed;
    if (lz4_decompress(payload, decompressed)) {
        probe.decompressed_ratio = static_cast<double>(decompressed.actual_size) / expected;
        probe.decompression_works = decompressed.actual_size > 0;
    }

    probe.compressed = probe.size_ratio < options.compressed_size_ratio &&
                       probe.decompression_works &&
                       probe.decompressed_ratio > probe.size_ratio;
    return probe;
}

bool should_decompress(std::span<const std::uint8_t> payload, int width, int height,
                       std::uint32_t pixel_format_code, const decode_options& options) {
    return probe_compression(payload, width, height, pixel_format_code, options).compressed;
}

} // namespace sct_image
