#include <sct_image/codecs/png.hpp>
#include <lodepng.h>

#include <fstream>

namespace sct_image {

// ============================================================================
// PNG Encoder
// ============================================================================

std::vector<std::uint8_t> encode_png(std::span<const std::uint8_t> rgba, int width, int height) {
    const std::size_t expected = pixel_buffer_size(width, height, pixel_format::rgba8888);
    if (expected == 0 || rgba.size() < expected) {
        return {};
    }

    std::vector<std::uint8_t> png_data;
    unsigned error = lodepng::encode(png_data, rgba.data(),
                                     static_cast<unsigned>(width), static_cast<unsigned>(height),
                                     LCT_RGBA, 8);
    if (error) {
        return {};
    }

    return png_data;
}

std::vector<std::uint8_t> encode_png(const memory_surface& surf) {
    if (surf.width() <= 0 || surf.height() <= 0) {
        return {};
    }

    return encode_png(surf.pixels(), surf.width(), surf.height());
}

decode_result write_file(std::span<const std::uint8_t> data, const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return decode_result::failure(decode_error::io_error,
            "Cannot open " + path.string() + " for writing");
    }

    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!file.good()) {
        return decode_result::failure(decode_error::io_error, "Failed writing " + path.string());
    }

    return decode_result::success();
}

bool save_png(const memory_surface& surf, const std::filesystem::path& path) {
    auto png_data = encode_png(surf);
    if (png_data.empty()) {
        return false;
    }
    return write_file(png_data, path).ok;
}

// ============================================================================
// PNG Surface
// ============================================================================

std::vector<std::uint8_t> png_surface::encode() const {
    return encode_png(*this);
}

bool png_surface::save(const std::filesystem::path& path) const {
    return save_png(*this, path);
}

} // namespace sct_image
