#include <doctest/doctest.h>
#include <sct_image/sct_image.hpp>

using sct_image::channel_layout;
using sct_image::decode_pathway;

TEST_CASE("Pixel formats: exact codes") {
    SUBCASE("RGB565 little-endian") {
        auto desc = sct_image::classify_pixel_format(4);
        CHECK(desc.pathway == decode_pathway::rgb565_le);
        CHECK(desc.layout == channel_layout::rgb);
        CHECK(desc.channels == 3);
        CHECK(desc.name == "RGB565_LE");
    }

    SUBCASE("RGB") {
        auto desc = sct_image::classify_pixel_format(6);
        CHECK(desc.pathway == decode_pathway::plain_rgb);
        CHECK(desc.channels == 3);
    }

    SUBCASE("Code 16 is named RGB565 but stored as RGB") {
        auto desc = sct_image::classify_pixel_format(16);
        CHECK(desc.name == "RGB565");
        CHECK(desc.pathway == decode_pathway::plain_rgb);
        CHECK(desc.channels == 3);
    }

    SUBCASE("ETC2 RGBA8") {
        auto desc = sct_image::classify_pixel_format(19);
        CHECK(desc.pathway == decode_pathway::etc2_rgba8);
        CHECK(desc.channels == 4);
    }

    SUBCASE("ASTC block sizes") {
        auto astc4 = sct_image::classify_pixel_format(40);
        auto astc6 = sct_image::classify_pixel_format(44);
        auto astc8 = sct_image::classify_pixel_format(47);
        CHECK(astc4.pathway == decode_pathway::astc);
        CHECK(astc4.block_width == 4);
        CHECK(astc4.block_height == 4);
        CHECK(astc6.pathway == decode_pathway::astc);
        CHECK(astc6.block_width == 6);
        CHECK(astc8.pathway == decode_pathway::astc);
        CHECK(astc8.block_height == 8);
    }
}

TEST_CASE("Pixel formats: ranges") {
    SUBCASE("17 to 26 except 19 are RGBA") {
        for (std::uint32_t code = 17; code <= 26; ++code) {
            INFO("code ", code);
            auto desc = sct_image::classify_pixel_format(code);
            if (code == 19) {
                CHECK(desc.pathway == decode_pathway::etc2_rgba8);
            } else {
                CHECK(desc.pathway == decode_pathway::plain_rgba);
                CHECK(desc.channels == 4);
            }
        }
    }

    SUBCASE("41 to 53 except 44 and 47 are generic compressed") {
        for (std::uint32_t code = 41; code <= 53; ++code) {
            INFO("code ", code);
            auto desc = sct_image::classify_pixel_format(code);
            if (code == 44 || code == 47) {
                CHECK(desc.pathway == decode_pathway::astc);
            } else {
                CHECK(desc.pathway == decode_pathway::compressed_generic);
                CHECK(desc.layout == channel_layout::rgba);
                CHECK(desc.channels == 4);
            }
        }
    }

    SUBCASE("Anything else is unknown RGBA") {
        for (std::uint32_t code : {0u, 1u, 5u, 27u, 39u, 54u, 1000u}) {
            INFO("code ", code);
            auto desc = sct_image::classify_pixel_format(code);
            CHECK(desc.pathway == decode_pathway::unknown);
            CHECK(desc.channels == 4);
            CHECK(desc.name == "UNKNOWN");
        }
    }
}
