#ifndef SCT_IMAGE_TEXTURE_CODEC_HPP_
#define SCT_IMAGE_TEXTURE_CODEC_HPP_

#include <sct_image/sct_image_export.h>
#include <sct_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sct_image {

// ============================================================================
// Block Texture Codec Interface
// ============================================================================

/**
 * Decoder for GPU block-compressed textures.
 * The SCT decoder calls into this interface for ETC2 and ASTC payloads.
 * Implementations must be safe to call from several threads at once.
 */
class SCT_IMAGE_EXPORT texture_codec {
public:
    virtual ~texture_codec() = default;

    /**
     * Decode ETC2 RGBA8 (EAC alpha + ETC2 color, 16 bytes per 4x4 block).
     * @param blocks Block data, at least ceil(w/4)*ceil(h/4)*16 bytes
     * @param width Width in pixels
     * @param height Height in pixels
     * @param rgba Receives width*height*4 bytes in R,G,B,A order
     */
    [[nodiscard]] virtual decode_result decode_etc2_rgba8(std::span<const std::uint8_t> blocks,
                                                          int width, int height,
                                                          std::vector<std::uint8_t>& rgba) const = 0;

    /**
     * Decode ETC2 RGB8 (8 bytes per 4x4 block). Alpha is set to 255.
     */
    [[nodiscard]] virtual decode_result decode_etc2_rgb8(std::span<const std::uint8_t> blocks,
                                                         int width, int height,
                                                         std::vector<std::uint8_t>& rgba) const = 0;

    /**
     * Decode LDR ASTC with the given block footprint.
     * @param bgra Receives width*height*4 bytes in B,G,R,A order
     */
    [[nodiscard]] virtual decode_result decode_astc(std::span<const std::uint8_t> blocks,
                                                    int width, int height,
                                                    int block_width, int block_height,
                                                    std::vector<std::uint8_t>& bgra) const = 0;
};

/**
 * Built-in codec: ETC2 through texgenpack,
 * ASTC through ARM astcenc.
 */
[[nodiscard]] SCT_IMAGE_EXPORT const texture_codec& default_texture_codec();

} // namespace sct_image

#endif // SCT_IMAGE_TEXTURE_CODEC_HPP_
