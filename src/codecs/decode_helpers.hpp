#pragma once

#include <sct_image/types.hpp>
#include <sct_image/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>

namespace sct_image {

// Default dimension limits
constexpr int DEFAULT_MAX_DIMENSION = 16384;

// Get effective dimension limits from options
inline std::pair<int, int> get_dimension_limits(const decode_options& options,
                                                int default_limit = DEFAULT_MAX_DIMENSION) {
    int max_w = options.max_width > 0 ? options.max_width : default_limit;
    int max_h = options.max_height > 0 ? options.max_height : default_limit;
    return {max_w, max_h};
}

// Validate dimensions against limits, returning failure result if exceeded
inline decode_result validate_dimensions(int width, int height,
                                         const decode_options& options,
                                         int default_limit = DEFAULT_MAX_DIMENSION) {
    auto [max_w, max_h] = get_dimension_limits(options, default_limit);
    if (width > max_w || height > max_h) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "Image dimensions exceed limits");
    }
    return decode_result::success();
}

// Copy pixel data row-by-row to a surface
// data: pointer to pixel data (row-major, contiguous)
// row_bytes: bytes per row in the source data
// height: number of rows to copy
inline void write_rows(surface& surf, const std::uint8_t* data,
                       std::size_t row_bytes, int height) {
    for (int y = 0; y < height; ++y) {
        surf.write_pixels(0, y, static_cast<int>(row_bytes),
                          data + static_cast<std::size_t>(y) * row_bytes);
    }
}

// Number of blocks needed to cover size pixels
inline std::size_t blocks_for(int size, int block_dim) {
    return (static_cast<std::size_t>(size) + static_cast<std::size_t>(block_dim) - 1) /
           static_cast<std::size_t>(block_dim);
}

} // namespace sct_image
