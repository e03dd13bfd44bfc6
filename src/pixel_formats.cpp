#include <sct_image/pixel_formats.hpp>

namespace sct_image {

namespace {

constexpr pixel_format_descriptor rgb_format(decode_pathway pathway, std::string_view name) {
    return {channel_layout::rgb, 3, pathway, 0, 0, name};
}

constexpr pixel_format_descriptor rgba_format(decode_pathway pathway, std::string_view name) {
    return {channel_layout::rgba, 4, pathway, 0, 0, name};
}

constexpr pixel_format_descriptor astc_format(int block, std::string_view name) {
    return {channel_layout::rgba, 4, decode_pathway::astc, block, block, name};
}

struct format_entry {
    std::uint32_t code;
    pixel_format_descriptor descriptor;
};

constexpr format_entry FORMAT_TABLE[] = {
    {4,  rgb_format(decode_pathway::rgb565_le, "RGB565_LE")},
    {6,  rgb_format(decode_pathway::plain_rgb, "RGB")},
    {16, rgb_format(decode_pathway::plain_rgb, "RGB565")},
    {19, rgba_format(decode_pathway::etc2_rgba8, "ETC2_RGBA8")},
    {40, astc_format(4, "ASTC_4x4")},
    {44, astc_format(6, "ASTC_6x6")},
    {47, astc_format(8, "ASTC_8x8")},
};

} // namespace

const char* to_string(decode_pathway pathway) noexcept {
    switch (pathway) {
        case decode_pathway::rgb565_le:          return "rgb565_le";
        case decode_pathway::etc2_rgba8:         return "etc2_rgba8";
        case decode_pathway::astc:               return "astc";
        case decode_pathway::plain_rgb:          return "plain_rgb";
        case decode_pathway::plain_rgba:         return "plain_rgba";
        case decode_pathway::compressed_generic: return "compressed_generic";
        case decode_pathway::unknown:            return "unknown";
    }
    return "unknown";
}

pixel_format_descriptor classify_pixel_format(std::uint32_t code) noexcept {
    // Alpha formats; 19 has a dedicated decoder
    if (code >= 17 && code <= 26 && code != 19) {
        return rgba_format(decode_pathway::plain_rgba, "RGBA");
    }

    // Block compressed formats; 44 and 47 have dedicated decoders
    if (code >= 41 && code <= 53 && code != 44 && code != 47) {
        return rgba_format(decode_pathway::compressed_generic, "COMPRESSED");
    }

    for (const auto& entry : FORMAT_TABLE) {
        if (entry.code == code) {
            return entry.descriptor;
        }
    }

    return rgba_format(decode_pathway::unknown, "UNKNOWN");
}

} // namespace sct_image
