#ifndef SCT_IMAGE_TYPES_HPP_
#define SCT_IMAGE_TYPES_HPP_

#include <sct_image/sct_image_export.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace sct_image {

class texture_codec;

// ============================================================================
// Pixel Formats
// ============================================================================

enum class pixel_format {
    rgba8888    // 32-bit, 8-bit RGBA components
};

[[nodiscard]] constexpr std::size_t bytes_per_pixel(pixel_format fmt) noexcept {
    switch (fmt) {
        case pixel_format::rgba8888: return 4;
    }
    return 0;
}

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    invalid_format,
    unsupported_encoding,
    dimensions_exceeded,
    truncated_data,
    io_error,
    internal_error
};

[[nodiscard]] SCT_IMAGE_EXPORT const char* to_string(decode_error err) noexcept;

// ============================================================================
// Decode Result
// ============================================================================

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Options
// ============================================================================

struct decode_options {
    // Maximum allowed dimensions (0 = use default)
    int max_width = 16384;
    int max_height = 16384;

    // Compression probe for SCT2 payloads flagged raw/alpha.
    // A payload is only treated as compressed when it is smaller than
    // compressed_size_ratio times the expected texture size.
    double compressed_size_ratio = 0.95;

    // Expected bytes per pixel for formats without a block size estimate
    int approx_bytes_per_pixel = 2;

    // Block texture codec (nullptr = built-in codec)
    const texture_codec* codec = nullptr;
};

} // namespace sct_image

#endif // SCT_IMAGE_TYPES_HPP_
