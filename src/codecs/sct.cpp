#include <sct_image/codecs/sct.hpp>
#include <sct_image/decompress.hpp>
#include <sct_image/texture_codec.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <algorithm>
#include <cstring>
#include <new>
#include <utility>

namespace sct_image {

namespace {

// ASTC 4x4 pixel format code; SCT2 files in this format are expected to be
// compressed, so a missing compressed flag is not reported for them
constexpr std::uint32_t ASTC_4X4_FORMAT_CODE = 40;

constexpr int ETC2_BLOCK = 4;
constexpr std::size_t ETC2_RGBA8_BLOCK_BYTES = 16;
constexpr std::size_t ETC2_RGB8_BLOCK_BYTES = 8;
constexpr std::size_t ASTC_BLOCK_BYTES = 16;

constexpr std::uint8_t ALPHA_OPAQUE = 255;

// Try the LZ4 variant; on failure keep the raw payload
void decompress_or_keep(std::span<const std::uint8_t> payload,
                        std::vector<std::uint8_t>& pixel_data,
                        decode_report& report) {
    decompressed_payload decompressed;
    auto result = lz4_decompress(payload, decompressed);
    if (result) {
        report.source = payload_source::decompressed;
        report.declared_size = decompressed.declared_size;
        pixel_data = std::move(decompressed.bytes);
        return;
    }

    report.source = payload_source::fallback_raw;
    report.notes.push_back("Decompression failed, using raw data: " + result.message);
    pixel_data.assign(payload.begin(), payload.end());
}

// Copy a block-aligned decode into the top-left corner of the canvas
void crop_into(const std::vector<std::uint8_t>& decoded, int decoded_width,
               std::vector<std::uint8_t>& canvas, int width, int height) {
    const std::size_t src_pitch = static_cast<std::size_t>(decoded_width) * 4;
    const std::size_t dst_pitch = static_cast<std::size_t>(width) * 4;
    const std::size_t copy_bytes = std::min(src_pitch, dst_pitch);

    for (int y = 0; y < height; ++y) {
        const std::size_t src_offset = static_cast<std::size_t>(y) * src_pitch;
        if (src_offset + copy_bytes > decoded.size()) {
            break;
        }
        std::memcpy(canvas.data() + static_cast<std::size_t>(y) * dst_pitch,
                    decoded.data() + src_offset, copy_bytes);
    }
}

// Copy the first size bytes of data, zero-filling what is missing
std::vector<std::uint8_t> padded_copy(std::span<const std::uint8_t> data, std::size_t size) {
    std::vector<std::uint8_t> padded(size, 0);
    const std::size_t copy_bytes = std::min(size, data.size());
    if (copy_bytes > 0) {
        std::memcpy(padded.data(), data.data(), copy_bytes);
    }
    return padded;
}

void swap_red_blue(std::vector<std::uint8_t>& pixels) {
    for (std::size_t i = 0; i + 3 < pixels.size(); i += 4) {
        std::swap(pixels[i], pixels[i + 2]);
    }
}

void decode_rgb565(std::span<const std::uint8_t> data, std::vector<std::uint8_t>& canvas) {
    const std::size_t pixel_count = std::min(data.size() / 2, canvas.size() / 4);
    for (std::size_t i = 0; i < pixel_count; ++i) {
        const std::uint16_t pixel = read_le16(data.data() + i * 2);
        std::uint8_t* dst = canvas.data() + i * 4;
        dst[0] = static_cast<std::uint8_t>(((pixel >> 11) & 0x1F) << 3);
        dst[1] = static_cast<std::uint8_t>(((pixel >> 5) & 0x3F) << 2);
        dst[2] = static_cast<std::uint8_t>((pixel & 0x1F) << 3);
        dst[3] = ALPHA_OPAQUE;
    }
}

// Plain 8-bit pixels; partial trailing pixels are dropped
void decode_plain(std::span<const std::uint8_t> data, int channels, std::vector<std::uint8_t>& canvas) {
    const auto stride = static_cast<std::size_t>(channels);
    const std::size_t pixel_count = std::min(data.size() / stride, canvas.size() / 4);
    for (std::size_t i = 0; i < pixel_count; ++i) {
        const std::uint8_t* src = data.data() + i * stride;
        std::uint8_t* dst = canvas.data() + i * 4;
        dst[0] = src[0];
        dst[1] = src[1];
        dst[2] = src[2];
        dst[3] = channels == 4 ? src[3] : ALPHA_OPAQUE;
    }
}

decode_result decode_etc2(std::span<const std::uint8_t> data, int width, int height,
                          const texture_codec& codec, std::vector<std::uint8_t>& canvas,
                          decode_report& report) {
    const std::size_t blocks_x = blocks_for(width, ETC2_BLOCK);
    const std::size_t blocks_y = blocks_for(height, ETC2_BLOCK);
    const int aligned_width = static_cast<int>(blocks_x) * ETC2_BLOCK;
    const int aligned_height = static_cast<int>(blocks_y) * ETC2_BLOCK;

    const std::size_t rgba_size = blocks_x * blocks_y * ETC2_RGBA8_BLOCK_BYTES;
    if (data.size() < rgba_size) {
        report.notes.push_back("ETC2 data short by " + std::to_string(rgba_size - data.size()) +
                               " bytes, padding with zeros");
    }

    std::vector<std::uint8_t> decoded;
    auto result = codec.decode_etc2_rgba8(padded_copy(data, rgba_size), aligned_width, aligned_height, decoded);
    if (result) {
        crop_into(decoded, aligned_width, canvas, width, height);
        return result;
    }
    report.notes.push_back("ETC2 RGBA8 decode failed (" + result.message + "), trying ETC2 RGB8");

    const std::size_t rgb_size = blocks_x * blocks_y * ETC2_RGB8_BLOCK_BYTES;
    auto rgb_result = codec.decode_etc2_rgb8(padded_copy(data, rgb_size), aligned_width, aligned_height, decoded);
    if (rgb_result) {
        crop_into(decoded, aligned_width, canvas, width, height);
        return rgb_result;
    }

    return decode_result::failure(decode_error::unsupported_encoding,
        "ETC2 decode failed: " + rgb_result.message);
}

decode_result decode_astc(std::span<const std::uint8_t> data, const container_header& header,
                          const pixel_format_descriptor& format, const texture_codec& codec,
                          std::vector<std::uint8_t>& canvas, decode_report& report) {
    const int width = header.width;
    const int height = header.height;
    const std::size_t needed = blocks_for(width, format.block_width) *
                               blocks_for(height, format.block_height) * ASTC_BLOCK_BYTES;
    if (data.size() < needed) {
        report.notes.push_back("ASTC data short by " + std::to_string(needed - data.size()) +
                               " bytes, padding with zeros");
    }

    std::vector<std::uint8_t> decoded;
    auto result = codec.decode_astc(padded_copy(data, needed), width, height,
                                    format.block_width, format.block_height, decoded);
    if (result) {
        crop_into(decoded, width, canvas, width, height);
        swap_red_blue(canvas);
        return result;
    }

    // Retry at the physical texture size when the header pads the image
    const int texture_width = header.texture_width;
    const int texture_height = header.texture_height;
    if (texture_width >= width && texture_height >= height &&
        (texture_width != width || texture_height != height)) {
        report.notes.push_back("ASTC decode at " + std::to_string(width) + "x" + std::to_string(height) +
                               " failed (" + result.message + "), retrying at texture size " +
                               std::to_string(texture_width) + "x" + std::to_string(texture_height));

        const std::size_t texture_needed = blocks_for(texture_width, format.block_width) *
                                           blocks_for(texture_height, format.block_height) * ASTC_BLOCK_BYTES;
        auto retry = codec.decode_astc(padded_copy(data, texture_needed), texture_width, texture_height,
                                       format.block_width, format.block_height, decoded);
        if (retry) {
            crop_into(decoded, texture_width, canvas, width, height);
            swap_red_blue(canvas);
            return retry;
        }
        result = std::move(retry);
    }

    return decode_result::failure(decode_error::unsupported_encoding,
        std::string(format.name) + " decode failed: " + result.message);
}

} // namespace

const char* to_string(payload_source source) noexcept {
    switch (source) {
        case payload_source::raw:          return "raw";
        case payload_source::decompressed: return "decompressed";
        case payload_source::fallback_raw: return "raw (decompression failed)";
    }
    return "unknown";
}

bool sct_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return sniff_container(data) != container_variant::unknown;
}

decode_result sct_decoder::extract_pixel_data(std::span<const std::uint8_t> data,
                                              const container_header& header,
                                              std::vector<std::uint8_t>& pixel_data,
                                              decode_report& report,
                                              const decode_options& options) {
    if (header.data_offset > data.size()) {
        return decode_result::failure(decode_error::truncated_data, "Data offset past end of file");
    }

    const auto payload = data.subspan(header.data_offset);
    report.payload_size = payload.size();

    if (header.variant == container_variant::legacy) {
        // Legacy payloads are always compressed; a bad frame is fatal
        decompressed_payload decompressed;
        auto result = lz4_decompress(payload, decompressed);
        if (!result) {
            return result;
        }
        report.source = payload_source::decompressed;
        report.declared_size = decompressed.declared_size;
        pixel_data = std::move(decompressed.bytes);
    } else if (header.raw() || header.has_alpha()) {
        // Raw and alpha flags are unreliable; let the data decide
        report.probe = probe_compression(payload, header.width, header.height,
                                         header.pixel_format_code, options);
        if (report.probe->compressed) {
            decompress_or_keep(payload, pixel_data, report);
        } else {
            report.source = payload_source::raw;
            pixel_data.assign(payload.begin(), payload.end());
        }
    } else if (payload.size() >= LZ4_FRAME_HEADER_SIZE) {
        if (header.pixel_format_code != ASTC_4X4_FORMAT_CODE && !header.declared_compressed) {
            report.notes.push_back("No compression declared, attempting decompression anyway");
        }
        decompress_or_keep(payload, pixel_data, report);
    } else {
        report.source = payload_source::raw;
        pixel_data.assign(payload.begin(), payload.end());
    }

    report.data_size = pixel_data.size();
    return decode_result::success();
}

decode_result sct_decoder::decode_image(std::span<const std::uint8_t> data,
                                        decoded_image& image,
                                        const decode_options& options) {
    image = decoded_image{};

    auto result = decode_container_header(data, image.header);
    if (!result) return result;

    image.width = image.header.width;
    image.height = image.header.height;

    result = validate_dimensions(image.width, image.height, options);
    if (!result) return result;

    std::vector<std::uint8_t> pixel_data;
    result = extract_pixel_data(data, image.header, pixel_data, image.report, options);
    if (!result) return result;

    image.format = classify_pixel_format(image.header.pixel_format_code);

    const std::size_t canvas_size = pixel_buffer_size(image.width, image.height, pixel_format::rgba8888);
    if (canvas_size == 0) {
        return decode_result::failure(decode_error::dimensions_exceeded, "Image too large");
    }
    try {
        image.rgba.assign(canvas_size, 0);
    } catch (const std::bad_alloc&) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate image buffer");
    }

    const texture_codec& codec = options.codec ? *options.codec : default_texture_codec();

    switch (image.format.pathway) {
        case decode_pathway::rgb565_le:
            decode_rgb565(pixel_data, image.rgba);
            break;
        case decode_pathway::etc2_rgba8:
            result = decode_etc2(pixel_data, image.width, image.height, codec, image.rgba, image.report);
            break;
        case decode_pathway::astc:
            result = decode_astc(pixel_data, image.header, image.format, codec, image.rgba, image.report);
            break;
        case decode_pathway::plain_rgb:
        case decode_pathway::plain_rgba:
        case decode_pathway::compressed_generic:
        case decode_pathway::unknown:
            decode_plain(pixel_data, image.format.channels, image.rgba);
            break;
    }

    return result;
}

decode_result sct_decoder::decode(std::span<const std::uint8_t> data,
                                  surface& surf,
                                  const decode_options& options) {
    decoded_image image;
    auto result = decode_image(data, image, options);
    if (!result) return result;

    if (!surf.set_size(image.width, image.height, pixel_format::rgba8888)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
    }

    write_rows(surf, image.rgba.data(), static_cast<std::size_t>(image.width) * 4, image.height);

    return decode_result::success();
}

} // namespace sct_image
