#include <sct_image/decompress.hpp>
#include <sct_image/surface.hpp>
#include "codecs/byte_io.hpp"

#include <algorithm>
#include <string>

namespace sct_image {

namespace {

constexpr std::uint8_t LZ4_RUN_MASK = 0x0F;
constexpr std::size_t LZ4_EXTENDED_RUN = 15;
constexpr std::uint8_t LZ4_EXTENSION_CONTINUE = 255;

// Add LZ4-style length extension bytes: each 255 continues, anything else ends
std::size_t read_extended_length(std::span<const std::uint8_t> src, std::size_t& pos, std::size_t length) {
    while (pos < src.size()) {
        const std::uint8_t extra = src[pos++];
        length += extra;
        if (extra != LZ4_EXTENSION_CONTINUE) {
            break;
        }
    }
    return length;
}

} // namespace

decode_result lz4_decompress(std::span<const std::uint8_t> payload, decompressed_payload& out) {
    out = decompressed_payload{};

    std::uint32_t declared_size = 0;
    if (payload.size() < LZ4_FRAME_HEADER_SIZE || !read_le32(payload, 0, declared_size)) {
        return decode_result::failure(decode_error::truncated_data, "Compressed data too short");
    }
    if (declared_size > MAX_PIXEL_BUFFER_SIZE) {
        return decode_result::failure(decode_error::truncated_data,
            "Declared decompressed size too large: " + std::to_string(declared_size));
    }
    out.declared_size = declared_size;

    const std::size_t dst_size = declared_size;
    std::vector<std::uint8_t>& dst = out.bytes;
    dst.reserve(std::min(dst_size, payload.size() * 4));

    std::size_t src_pos = LZ4_FRAME_HEADER_SIZE;

    while (src_pos < payload.size() && dst.size() < dst_size) {
        const std::uint8_t token = payload[src_pos++];

        std::size_t literal_length = (token >> 4) & LZ4_RUN_MASK;
        std::size_t match_length = token & LZ4_RUN_MASK;

        if (literal_length == LZ4_EXTENDED_RUN) {
            literal_length = read_extended_length(payload, src_pos, literal_length);
        }

        // Literals are clamped to what the source holds and the output accepts
        literal_length = std::min({literal_length, payload.size() - src_pos, dst_size - dst.size()});
        dst.insert(dst.end(), payload.begin() + static_cast<std::ptrdiff_t>(src_pos),
                   payload.begin() + static_cast<std::ptrdiff_t>(src_pos + literal_length));
        src_pos += literal_length;

        if (src_pos >= payload.size() || dst.size() >= dst_size) {
            break;
        }

        std::uint16_t offset = 0;
        if (!read_le16(payload, src_pos, offset)) {
            break;
        }
        src_pos += 2;

        if (match_length == LZ4_EXTENDED_RUN) {
            match_length = read_extended_length(payload, src_pos, match_length);
        }
        match_length += LZ4_MIN_MATCH;

        if (offset > dst.size()) {
            break;
        }
        const std::size_t match_start = dst.size() - offset;

        // Byte-wise copy: the source may overlap bytes written by this same match.
        // A zero offset would read the unwritten cursor and copies nothing.
        for (std::size_t i = 0; i < match_length && dst.size() < dst_size && match_start + i < dst.size(); ++i) {
            const std::uint8_t value = dst[match_start + i];
            dst.push_back(value);
        }
    }

    out.actual_size = dst.size();
    return decode_result::success();
}

} // namespace sct_image
