#ifndef SCT_IMAGE_CODECS_PNG_HPP_
#define SCT_IMAGE_CODECS_PNG_HPP_

#include <sct_image/sct_image_export.h>
#include <sct_image/types.hpp>
#include <sct_image/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace sct_image {

// ============================================================================
// PNG Encoder Functions
// ============================================================================

/**
 * Encode a tightly packed RGBA buffer to PNG format.
 * @param rgba width * height * 4 bytes
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] SCT_IMAGE_EXPORT std::vector<std::uint8_t> encode_png(std::span<const std::uint8_t> rgba,
                                                                    int width, int height);

/**
 * Encode a memory surface to PNG format.
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] SCT_IMAGE_EXPORT std::vector<std::uint8_t> encode_png(const memory_surface& surf);

/**
 * Write already encoded PNG data to a file.
 * @return io_error result if the file cannot be written
 */
[[nodiscard]] SCT_IMAGE_EXPORT decode_result write_file(std::span<const std::uint8_t> data,
                                                        const std::filesystem::path& path);

/**
 * Save a memory surface to a PNG file.
 * @return true on success
 */
[[nodiscard]] SCT_IMAGE_EXPORT bool save_png(const memory_surface& surf,
                                             const std::filesystem::path& path);

// ============================================================================
// PNG Surface
// ============================================================================

/**
 * Surface that can save its contents as PNG.
 */
class SCT_IMAGE_EXPORT png_surface : public memory_surface {
public:
    png_surface() = default;
    ~png_surface() override = default;

    png_surface(const png_surface&) = delete;
    png_surface& operator=(const png_surface&) = delete;
    png_surface(png_surface&&) noexcept = default;
    png_surface& operator=(png_surface&&) noexcept = default;

    [[nodiscard]] std::vector<std::uint8_t> encode() const;
    [[nodiscard]] bool save(const std::filesystem::path& path) const;
};

} // namespace sct_image

#endif // SCT_IMAGE_CODECS_PNG_HPP_
