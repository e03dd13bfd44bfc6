#include <sct_image/surface.hpp>

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>

namespace sct_image {

std::size_t pixel_buffer_size(int width, int height, pixel_format format) noexcept {
    if (width <= 0 || height <= 0) {
        return 0;
    }

    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);
    const std::size_t bpp = bytes_per_pixel(format);

    if (w > std::numeric_limits<std::size_t>::max() / bpp) {
        return 0;
    }
    const std::size_t pitch = w * bpp;

    if (pitch > std::numeric_limits<std::size_t>::max() / h) {
        return 0;
    }
    const std::size_t total_size = pitch * h;

    return total_size <= MAX_PIXEL_BUFFER_SIZE ? total_size : 0;
}

bool memory_surface::set_size(int width, int height, pixel_format format) {
    const std::size_t total_size = pixel_buffer_size(width, height, format);
    if (total_size == 0) {
        return false;
    }

    try {
        pixels_.assign(total_size, 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    format_ = format;
    pitch_ = static_cast<std::size_t>(width) * bytes_per_pixel(format);

    return true;
}

void memory_surface::write_pixels(int x, int y, int count, const std::uint8_t* pixels) {
    if (y < 0 || y >= height_ || x < 0 || count <= 0 || !pixels) {
        return;
    }

    // x is a byte offset into the row; clip the run at the row end
    const std::size_t x_offset = static_cast<std::size_t>(x);
    if (x_offset >= pitch_) {
        return;
    }

    const std::size_t bytes_to_copy = std::min(static_cast<std::size_t>(count), pitch_ - x_offset);
    std::memcpy(pixels_.data() + static_cast<std::size_t>(y) * pitch_ + x_offset,
                pixels, bytes_to_copy);
}

} // namespace sct_image
