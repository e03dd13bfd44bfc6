#include <sct_image/container.hpp>
#include "codecs/byte_io.hpp"

#include <string>

namespace sct_image {

namespace {

// Legacy (SCT) layout
constexpr std::size_t SCT_FORMAT_OFFSET = 4;
constexpr std::size_t SCT_WIDTH_OFFSET = 5;
constexpr std::size_t SCT_HEIGHT_OFFSET = 7;

// SCT2 layout
constexpr std::size_t SCT2_TOTAL_SIZE_OFFSET = 4;
constexpr std::size_t SCT2_DATA_OFFSET_OFFSET = 12;
constexpr std::size_t SCT2_FORMAT_OFFSET = 20;
constexpr std::size_t SCT2_WIDTH_OFFSET = 24;
constexpr std::size_t SCT2_HEIGHT_OFFSET = 26;
constexpr std::size_t SCT2_TEXTURE_WIDTH_OFFSET = 28;
constexpr std::size_t SCT2_TEXTURE_HEIGHT_OFFSET = 30;
constexpr std::size_t SCT2_FLAGS_OFFSET = 32;

decode_result validate_common(std::span<const std::uint8_t> data, const container_header& header) {
    if (header.width == 0 || header.height == 0) {
        return decode_result::failure(decode_error::invalid_format,
            "Invalid image dimensions: " + std::to_string(header.width) + "x" +
            std::to_string(header.height));
    }
    if (header.data_offset > data.size()) {
        return decode_result::failure(decode_error::truncated_data,
            "Data offset " + std::to_string(header.data_offset) +
            " is past the end of the file (" + std::to_string(data.size()) + " bytes)");
    }
    return decode_result::success();
}

} // namespace

const char* to_string(container_variant variant) noexcept {
    switch (variant) {
        case container_variant::legacy:  return "SCT";
        case container_variant::v2:      return "SCT2";
        case container_variant::unknown: return "unknown";
    }
    return "unknown";
}

container_variant sniff_container(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < 4) {
        return container_variant::unknown;
    }

    if (read_le32(data.data()) == SCT2_SIGNATURE) {
        return container_variant::v2;
    }

    if (read_le16(data.data()) == SCT_SIGNATURE_WORD && data[2] == SCT_SIGNATURE_BYTE) {
        return container_variant::legacy;
    }

    return container_variant::unknown;
}

decode_result decode_legacy_header(std::span<const std::uint8_t> data, container_header& header) {
    if (data.size() < SCT_HEADER_SIZE) {
        return decode_result::failure(decode_error::truncated_data,
            "File too small to contain a valid SCT header");
    }

    const auto* ptr = data.data();

    // Byte 3 is padding; the format code is a single byte
    header = container_header{};
    header.variant = container_variant::legacy;
    header.pixel_format_code = ptr[SCT_FORMAT_OFFSET];
    header.width = read_le16(ptr + SCT_WIDTH_OFFSET);
    header.height = read_le16(ptr + SCT_HEIGHT_OFFSET);
    header.texture_width = header.width;
    header.texture_height = header.height;
    header.data_offset = static_cast<std::uint32_t>(SCT_HEADER_SIZE);
    header.declared_compressed = true;

    return validate_common(data, header);
}

decode_result decode_v2_header(std::span<const std::uint8_t> data, container_header& header) {
    if (data.size() < SCT2_HEADER_SIZE) {
        return decode_result::failure(decode_error::truncated_data,
            "File too small to contain a valid SCT2 header");
    }

    const auto* ptr = data.data();

    // Bytes 8-11 and 16-19 are unknown
    header = container_header{};
    header.variant = container_variant::v2;
    header.total_size = read_le32(ptr + SCT2_TOTAL_SIZE_OFFSET);
    header.data_offset = read_le32(ptr + SCT2_DATA_OFFSET_OFFSET);
    header.pixel_format_code = read_le32(ptr + SCT2_FORMAT_OFFSET);
    header.width = read_le16(ptr + SCT2_WIDTH_OFFSET);
    header.height = read_le16(ptr + SCT2_HEIGHT_OFFSET);
    header.texture_width = read_le16(ptr + SCT2_TEXTURE_WIDTH_OFFSET);
    header.texture_height = read_le16(ptr + SCT2_TEXTURE_HEIGHT_OFFSET);
    header.flags = ptr[SCT2_FLAGS_OFFSET];
    header.declared_compressed = (header.flags & SCT2_FLAG_COMPRESSED) != 0;

    return validate_common(data, header);
}

decode_result decode_container_header(std::span<const std::uint8_t> data, container_header& header) {
    switch (sniff_container(data)) {
        case container_variant::legacy:
            return decode_legacy_header(data, header);
        case container_variant::v2:
            return decode_v2_header(data, header);
        case container_variant::unknown:
            break;
    }
    return decode_result::failure(decode_error::invalid_format, "Not an SCT or SCT2 file");
}

} // namespace sct_image
