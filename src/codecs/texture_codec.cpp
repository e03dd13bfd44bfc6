// Built-in block texture codec: ETC2 via texgenpack, ASTC via ARM astcenc

#include <sct_image/texture_codec.hpp>
#include <sct_image/surface.hpp>
#include "decode_helpers.hpp"

#include <astcenc.h>
#include <texgenpack.h>

#include <cstring>
#include <memory>
#include <new>
#include <string>

namespace sct_image {

namespace {

constexpr std::size_t ASTC_BLOCK_BYTES = 16;
constexpr int ETC2_BLOCK_DIM = 4;
constexpr std::size_t ETC2_RGB8_BLOCK_BYTES = 8;
constexpr std::size_t ETC2_RGBA8_BLOCK_BYTES = 16;


decode_result allocate_output(int width, int height, std::vector<std::uint8_t>& out) {
    const std::size_t size = pixel_buffer_size(width, height, pixel_format::rgba8888);
    if (size == 0) {
        return decode_result::failure(decode_error::dimensions_exceeded, "Invalid texture dimensions");
    }
    try {
        out.assign(size, 0);
    } catch (const std::bad_alloc&) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate texture buffer");
    }
    return decode_result::success();
}

struct texgenpack_image_deleter {
    void operator()(Image* image) const { destroy_image(image); }
};

// Decode an ETC2 texture through texgenpack, then crop its block-aligned
// image to width x height RGBA
decode_result decode_etc2(std::span<const std::uint8_t> blocks, int width, int height,
                          bool with_alpha, std::vector<std::uint8_t>& rgba) {
    const std::size_t block_bytes = with_alpha ? ETC2_RGBA8_BLOCK_BYTES : ETC2_RGB8_BLOCK_BYTES;
    const std::size_t blocks_x = blocks_for(width, ETC2_BLOCK_DIM);
    const std::size_t blocks_y = blocks_for(height, ETC2_BLOCK_DIM);
    const std::size_t needed = blocks_x * blocks_y * block_bytes;

    if (blocks.size() < needed) {
        return decode_result::failure(decode_error::truncated_data,
            "ETC2 data too short: expected " + std::to_string(needed) +
            " bytes, got " + std::to_string(blocks.size()));
    }

    auto result = allocate_output(width, height, rgba);
    if (!result) return result;

    // texgenpack reads blocks as 32-bit words
    std::vector<unsigned int> words;
    try {
        words.resize(needed / sizeof(unsigned int));
    } catch (const std::bad_alloc&) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate block buffer");
    }
    std::memcpy(words.data(), blocks.data(), needed);

    Texture texture = {};
    texture.pixels = words.data();
    texture.width = width;
    texture.height = height;
    texture.extended_width = static_cast<int>(blocks_x) * ETC2_BLOCK_DIM;
    texture.extended_height = static_cast<int>(blocks_y) * ETC2_BLOCK_DIM;
    texture.type = with_alpha ? TEXTURE_TYPE_ETC2_EAC : TEXTURE_TYPE_ETC2_RGB8;
    texture.info = match_texture_type(texture.type);
    if (texture.info == nullptr) {
        return decode_result::failure(decode_error::unsupported_encoding, "texgenpack has no ETC2 decoder");
    }
    texture.bits_per_block = texture.info->bits_per_block;
    texture.block_width = texture.info->block_width;
    texture.block_height = texture.info->block_height;
    set_texture_decoding_function(&texture, nullptr);

    Image image = {};
    convert_texture_to_image(&texture, &image);
    if (image.pixels == nullptr) {
        return decode_result::failure(decode_error::unsupported_encoding, "texgenpack failed to decode ETC2 data");
    }
    std::unique_ptr<Image, texgenpack_image_deleter> image_guard(&image);

    // Image pixels are packed R | G << 8 | B << 16 | A << 24, one row per extended_width
    const auto pitch = static_cast<std::size_t>(image.extended_width);
    std::uint8_t* out = rgba.data();
    for (int y = 0; y < height; ++y) {
        const unsigned int* row = image.pixels + static_cast<std::size_t>(y) * pitch;
        for (int x = 0; x < width; ++x) {
            const unsigned int pixel = row[x];
            *out++ = static_cast<std::uint8_t>(pixel & 0xFF);
            *out++ = static_cast<std::uint8_t>((pixel >> 8) & 0xFF);
            *out++ = static_cast<std::uint8_t>((pixel >> 16) & 0xFF);
            *out++ = with_alpha ? static_cast<std::uint8_t>((pixel >> 24) & 0xFF) : std::uint8_t{255};
        }
    }

    return decode_result::success();
}

class builtin_texture_codec final : public texture_codec {
public:
    [[nodiscard]] decode_result decode_etc2_rgba8(std::span<const std::uint8_t> blocks,
                                                  int width, int height,
                                                  std::vector<std::uint8_t>& rgba) const override {
        return decode_etc2(blocks, width, height, true, rgba);
    }

    [[nodiscard]] decode_result decode_etc2_rgb8(std::span<const std::uint8_t> blocks,
                                                 int width, int height,
                                                 std::vector<std::uint8_t>& rgba) const override {
        return decode_etc2(blocks, width, height, false, rgba);
    }

    [[nodiscard]] decode_result decode_astc(std::span<const std::uint8_t> blocks,
                                            int width, int height,
                                            int block_width, int block_height,
                                            std::vector<std::uint8_t>& bgra) const override {
        if (block_width <= 0 || block_height <= 0) {
            return decode_result::failure(decode_error::unsupported_encoding, "Invalid ASTC block size");
        }

        const std::size_t needed = blocks_for(width, block_width) * blocks_for(height, block_height) *
                                   ASTC_BLOCK_BYTES;
        if (blocks.size() < needed) {
            return decode_result::failure(decode_error::truncated_data,
                "ASTC data too short: expected " + std::to_string(needed) +
                " bytes, got " + std::to_string(blocks.size()));
        }

        auto result = allocate_output(width, height, bgra);
        if (!result) return result;

        astcenc_config config;
        astcenc_error status = astcenc_config_init(ASTCENC_PRF_LDR,
            static_cast<unsigned int>(block_width), static_cast<unsigned int>(block_height), 1,
            ASTCENC_PRE_FASTEST, ASTCENC_FLG_DECOMPRESS_ONLY, &config);
        if (status != ASTCENC_SUCCESS) {
            return decode_result::failure(decode_error::unsupported_encoding,
                std::string("astcenc config: ") + astcenc_get_error_string(status));
        }

        // One context per call keeps the codec usable from several threads
        astcenc_context* context = nullptr;
        status = astcenc_context_alloc(&config, 1, &context);
        if (status != ASTCENC_SUCCESS) {
            return decode_result::failure(decode_error::internal_error,
                std::string("astcenc context: ") + astcenc_get_error_string(status));
        }
        std::unique_ptr<astcenc_context, decltype(&astcenc_context_free)> context_guard(context, astcenc_context_free);

        void* slices[1] = {bgra.data()};
        astcenc_image image{};
        image.dim_x = static_cast<unsigned int>(width);
        image.dim_y = static_cast<unsigned int>(height);
        image.dim_z = 1;
        image.data_type = ASTCENC_TYPE_U8;
        image.data = slices;

        // The codec contract is B,G,R,A output
        const astcenc_swizzle swizzle{ASTCENC_SWZ_B, ASTCENC_SWZ_G, ASTCENC_SWZ_R, ASTCENC_SWZ_A};

        status = astcenc_decompress_image(context, blocks.data(), needed, &image, &swizzle, 0);
        if (status != ASTCENC_SUCCESS) {
            return decode_result::failure(decode_error::unsupported_encoding,
                std::string("astcenc decompress: ") + astcenc_get_error_string(status));
        }

        return decode_result::success();
    }
};

} // namespace

const texture_codec& default_texture_codec() {
    static const builtin_texture_codec codec{};
    return codec;
}

} // namespace sct_image
