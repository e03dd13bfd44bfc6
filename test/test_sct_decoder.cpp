#include <doctest/doctest.h>
#include <sct_image/sct_image.hpp>

#include "helpers/sct_builder.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <utility>
#include <vector>

using sct_image::decode_error;
using sct_image::decoded_image;
using sct_image::payload_source;
using sct_image::sct_decoder;

namespace {

constexpr std::uint8_t FLAG_HAS_ALPHA = 0x01;
constexpr std::uint8_t FLAG_RAW = 0x10;

// Records every call and fills outputs with a recognizable pixel
class fake_codec : public sct_image::texture_codec {
public:
    bool fail_rgba8 = false;
    bool fail_rgb8 = false;
    int astc_failures = 0;  // fail this many ASTC calls before succeeding

    mutable int rgba8_calls = 0;
    mutable int rgb8_calls = 0;
    mutable std::vector<std::pair<int, int>> sizes;
    mutable std::vector<std::size_t> block_bytes;

    [[nodiscard]] sct_image::decode_result decode_etc2_rgba8(std::span<const std::uint8_t> blocks,
                                                             int width, int height,
                                                             std::vector<std::uint8_t>& rgba) const override {
        ++rgba8_calls;
        record(blocks, width, height);
        if (fail_rgba8) {
            return sct_image::decode_result::failure(decode_error::unsupported_encoding, "fake rgba8");
        }
        fill(rgba, width, height, {1, 2, 3, 4});
        return sct_image::decode_result::success();
    }

    [[nodiscard]] sct_image::decode_result decode_etc2_rgb8(std::span<const std::uint8_t> blocks,
                                                            int width, int height,
                                                            std::vector<std::uint8_t>& rgba) const override {
        ++rgb8_calls;
        record(blocks, width, height);
        if (fail_rgb8) {
            return sct_image::decode_result::failure(decode_error::unsupported_encoding, "fake rgb8");
        }
        fill(rgba, width, height, {5, 6, 7, 255});
        return sct_image::decode_result::success();
    }

    [[nodiscard]] sct_image::decode_result decode_astc(std::span<const std::uint8_t> blocks,
                                                       int width, int height,
                                                       int /*block_width*/, int /*block_height*/,
                                                       std::vector<std::uint8_t>& bgra) const override {
        record(blocks, width, height);
        if (static_cast<int>(sizes.size()) <= astc_failures) {
            return sct_image::decode_result::failure(decode_error::unsupported_encoding, "fake astc");
        }
        fill(bgra, width, height, {10, 20, 30, 40});
        return sct_image::decode_result::success();
    }

private:
    void record(std::span<const std::uint8_t> blocks, int width, int height) const {
        sizes.emplace_back(width, height);
        block_bytes.push_back(blocks.size());
    }

    static void fill(std::vector<std::uint8_t>& out, int width, int height,
                     std::array<std::uint8_t, 4> pixel) {
        out.resize(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4);
        for (std::size_t i = 0; i < out.size(); i += 4) {
            out[i + 0] = pixel[0];
            out[i + 1] = pixel[1];
            out[i + 2] = pixel[2];
            out[i + 3] = pixel[3];
        }
    }
};

std::array<std::uint8_t, 4> pixel_at(const decoded_image& image, int x, int y) {
    const std::size_t offset = (static_cast<std::size_t>(y) * static_cast<std::size_t>(image.width) +
                                static_cast<std::size_t>(x)) * 4;
    return {image.rgba[offset], image.rgba[offset + 1], image.rgba[offset + 2], image.rgba[offset + 3]};
}

} // namespace

TEST_CASE("SCT decoder: sniff") {
    SUBCASE("Legacy") {
        auto data = sct_test::make_sct(4, 1, 1, {});
        CHECK(sct_decoder::sniff(data));
    }

    SUBCASE("SCT2") {
        auto data = sct_test::make_sct2(4, 1, 1, 1, 1, 0, {});
        CHECK(sct_decoder::sniff(data));
    }

    SUBCASE("Invalid signature") {
        std::vector<std::uint8_t> data = {0x89, 'P', 'N', 'G'};
        CHECK_FALSE(sct_decoder::sniff(data));
    }

    SUBCASE("Too short") {
        std::vector<std::uint8_t> data = {'S', 'C'};
        CHECK_FALSE(sct_decoder::sniff(data));
    }
}

TEST_CASE("SCT decoder: legacy RGB565") {
    // Red 0xF800 and green 0x07E0
    auto data = sct_test::make_sct(4, 2, 1, sct_test::lz4_literals({0x00, 0xF8, 0xE0, 0x07}));

    decoded_image image;
    auto result = sct_decoder::decode_image(data, image);
    REQUIRE(result.ok);
    CHECK(image.width == 2);
    CHECK(image.height == 1);
    CHECK(image.rgba == std::vector<std::uint8_t>{248, 0, 0, 255, 0, 252, 0, 255});
    CHECK(image.report.source == payload_source::decompressed);
    CHECK(image.report.declared_size == 4);
    CHECK(image.report.data_size == 4);
}

TEST_CASE("SCT decoder: surface output") {
    auto data = sct_test::make_sct(4, 2, 1, sct_test::lz4_literals({0x00, 0xF8, 0xE0, 0x07}));

    SUBCASE("Direct") {
        sct_image::memory_surface surface;
        REQUIRE(sct_decoder::decode(data, surface).ok);
        CHECK(surface.width() == 2);
        CHECK(surface.height() == 1);
        CHECK(surface.format() == sct_image::pixel_format::rgba8888);
        CHECK(surface.pixels()[0] == 248);
        CHECK(surface.pixels()[5] == 252);
    }

    SUBCASE("Through the registry") {
        sct_image::memory_surface surface;
        REQUIRE(sct_image::decode(data, surface).ok);
        CHECK(surface.width() == 2);

        sct_image::memory_surface named;
        REQUIRE(sct_image::decode(data, named, "sct").ok);

        sct_image::memory_surface missing;
        CHECK_FALSE(sct_image::decode(data, missing, "dds").ok);
    }

    SUBCASE("Registry lookup by extension") {
        const auto& registry = sct_image::codec_registry::instance();
        REQUIRE(registry.find_decoder_by_extension(".SCT2") != nullptr);
        CHECK(registry.find_decoder_by_extension(".sct")->name() == "sct");
        CHECK(registry.find_decoder_by_extension(".png") == nullptr);
        CHECK(registry.find_decoder_by_extension("") == nullptr);
    }

    SUBCASE("Unknown data through the registry") {
        std::vector<std::uint8_t> junk(32, 0x42);
        sct_image::memory_surface surface;
        auto result = sct_image::decode(junk, surface);
        CHECK_FALSE(result.ok);
        CHECK(result.error == decode_error::invalid_format);
    }
}

TEST_CASE("SCT decoder: payload policy") {
    SUBCASE("Legacy decompression failure is fatal") {
        auto data = sct_test::make_sct(4, 2, 1, {0x01, 0x02, 0x03});
        decoded_image image;
        auto result = sct_decoder::decode_image(data, image);
        CHECK_FALSE(result.ok);
        CHECK(result.error == decode_error::truncated_data);
    }

    SUBCASE("Raw flag with a raw-sized payload skips decompression") {
        // 2x2 RGBA is twice the 8 bytes the probe expects
        std::vector<std::uint8_t> payload = {
            1, 2, 3, 4,   5, 6, 7, 8,
            9, 10, 11, 12, 13, 14, 15, 16
        };
        auto data = sct_test::make_sct2(17, 2, 2, 2, 2, FLAG_RAW, payload);
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image).ok);
        CHECK(image.report.source == payload_source::raw);
        REQUIRE(image.report.probe.has_value());
        CHECK_FALSE(image.report.probe->compressed);
        CHECK(image.rgba == payload);
    }

    SUBCASE("Alpha flag with a compressed payload decompresses") {
        // 16x16 RGBA of 0x5A: one literal, then offset 1 length 1023
        std::vector<std::uint8_t> payload;
        sct_test::put_le32(payload, 1024);
        sct_test::put_le32(payload, 8);
        sct_test::append(payload, {0x1F, 0x5A, 0x01, 0x00, 0xFF, 0xFF, 0xFF, 0xEF});

        auto data = sct_test::make_sct2(18, 16, 16, 16, 16, FLAG_HAS_ALPHA, payload);
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image).ok);
        REQUIRE(image.report.probe.has_value());
        CHECK(image.report.probe->compressed);
        CHECK(image.report.source == payload_source::decompressed);
        CHECK(image.rgba == std::vector<std::uint8_t>(1024, 0x5A));
    }

    SUBCASE("Unflagged payload is decompressed opportunistically") {
        auto data = sct_test::make_sct2(6, 1, 1, 1, 1, 0, sct_test::lz4_literals({9, 8, 7}));
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image).ok);
        CHECK(image.report.source == payload_source::decompressed);
        CHECK_FALSE(image.report.notes.empty());
        CHECK(image.rgba == std::vector<std::uint8_t>{9, 8, 7, 255});
    }

    SUBCASE("Failed opportunistic decompression falls back to raw") {
        std::vector<std::uint8_t> payload = {0xFF, 0xFF, 0xFF, 0xFF, 0, 0, 0, 0};
        auto data = sct_test::make_sct2(6, 2, 1, 2, 1, 0, payload);
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image).ok);
        CHECK(image.report.source == payload_source::fallback_raw);
        CHECK(image.rgba == std::vector<std::uint8_t>{0xFF, 0xFF, 0xFF, 255, 0xFF, 0, 0, 255});
    }

    SUBCASE("Short unflagged payload is used raw") {
        auto data = sct_test::make_sct2(6, 1, 1, 1, 1, 0, {40, 50, 60});
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image).ok);
        CHECK(image.report.source == payload_source::raw);
        CHECK(image.rgba == std::vector<std::uint8_t>{40, 50, 60, 255});
    }
}

TEST_CASE("SCT decoder: plain pixel data") {
    SUBCASE("RGB is padded with opaque alpha") {
        auto data = sct_test::make_sct(6, 2, 1, sct_test::lz4_literals({1, 2, 3, 4, 5, 6}));
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image).ok);
        CHECK(image.rgba == std::vector<std::uint8_t>{1, 2, 3, 255, 4, 5, 6, 255});
    }

    SUBCASE("Missing pixels stay zero") {
        auto data = sct_test::make_sct(6, 2, 2, sct_test::lz4_literals({1, 2, 3, 4, 5}));
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image).ok);
        REQUIRE(image.rgba.size() == 16);
        CHECK(pixel_at(image, 0, 0) == std::array<std::uint8_t, 4>{1, 2, 3, 255});
        CHECK(pixel_at(image, 1, 0) == std::array<std::uint8_t, 4>{0, 0, 0, 0});
        CHECK(pixel_at(image, 1, 1) == std::array<std::uint8_t, 4>{0, 0, 0, 0});
    }

    SUBCASE("Unknown formats pass bytes through as RGBA") {
        auto data = sct_test::make_sct(99, 1, 1, sct_test::lz4_literals({7, 8, 9, 10}));
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image).ok);
        CHECK(image.format.pathway == sct_image::decode_pathway::unknown);
        CHECK(image.rgba == std::vector<std::uint8_t>{7, 8, 9, 10});
    }
}

TEST_CASE("SCT decoder: ETC2") {
    fake_codec codec;
    sct_image::decode_options options;
    options.codec = &codec;

    // 5x5 needs 2x2 blocks; supply one block only
    auto data = sct_test::make_sct(19, 5, 5, sct_test::lz4_literals(std::vector<std::uint8_t>(16, 0)));

    SUBCASE("Padded to whole blocks and cropped") {
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image, options).ok);
        CHECK(codec.rgba8_calls == 1);
        CHECK(codec.rgb8_calls == 0);
        REQUIRE(codec.sizes.size() == 1);
        CHECK(codec.sizes[0] == std::pair<int, int>{8, 8});
        CHECK(codec.block_bytes[0] == 64);
        CHECK(image.rgba.size() == 5 * 5 * 4);
        CHECK(pixel_at(image, 4, 4) == std::array<std::uint8_t, 4>{1, 2, 3, 4});
        CHECK_FALSE(image.report.notes.empty());
    }

    SUBCASE("Falls back to RGB8 blocks") {
        codec.fail_rgba8 = true;
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image, options).ok);
        CHECK(codec.rgb8_calls == 1);
        REQUIRE(codec.block_bytes.size() == 2);
        CHECK(codec.block_bytes[1] == 32);
        CHECK(pixel_at(image, 0, 0) == std::array<std::uint8_t, 4>{5, 6, 7, 255});
    }

    SUBCASE("Fails when both layouts fail") {
        codec.fail_rgba8 = true;
        codec.fail_rgb8 = true;
        decoded_image image;
        auto result = sct_decoder::decode_image(data, image, options);
        CHECK_FALSE(result.ok);
        CHECK(result.error == decode_error::unsupported_encoding);
    }
}

TEST_CASE("SCT decoder: ASTC") {
    fake_codec codec;
    sct_image::decode_options options;
    options.codec = &codec;

    SUBCASE("Codec output is swapped from BGRA") {
        auto data = sct_test::make_sct(40, 4, 4, sct_test::lz4_literals(std::vector<std::uint8_t>(16, 0)));
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image, options).ok);
        REQUIRE(codec.sizes.size() == 1);
        CHECK(codec.sizes[0] == std::pair<int, int>{4, 4});
        CHECK(pixel_at(image, 0, 0) == std::array<std::uint8_t, 4>{30, 20, 10, 40});
        CHECK(pixel_at(image, 3, 3) == std::array<std::uint8_t, 4>{30, 20, 10, 40});
    }

    SUBCASE("Block size follows the format code") {
        auto data = sct_test::make_sct(47, 10, 10, sct_test::lz4_literals(std::vector<std::uint8_t>(16, 0)));
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image, options).ok);
        REQUIRE(codec.block_bytes.size() == 1);
        CHECK(codec.block_bytes[0] == 2 * 2 * 16);
    }

    SUBCASE("Unflagged ASTC 4x4 payload decompresses without a note") {
        auto data = sct_test::make_sct2(40, 4, 4, 4, 4, 0,
                                        sct_test::lz4_literals(std::vector<std::uint8_t>(16, 0)));
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image, options).ok);
        CHECK(image.report.source == payload_source::decompressed);
        for (const auto& note : image.report.notes) {
            CHECK(note.find("No compression declared") == std::string::npos);
        }

        auto other = sct_test::make_sct2(44, 6, 6, 6, 6, 0,
                                         sct_test::lz4_literals(std::vector<std::uint8_t>(16, 0)));
        decoded_image other_image;
        REQUIRE(sct_decoder::decode_image(other, other_image, options).ok);
        CHECK(std::any_of(other_image.report.notes.begin(), other_image.report.notes.end(),
                          [](const std::string& note) {
                              return note.find("No compression declared") != std::string::npos;
                          }));
    }

    SUBCASE("Retries at the texture size") {
        codec.astc_failures = 1;
        auto data = sct_test::make_sct2(40, 3, 3, 4, 4, FLAG_RAW, std::vector<std::uint8_t>(16, 0));
        decoded_image image;
        REQUIRE(sct_decoder::decode_image(data, image, options).ok);
        REQUIRE(codec.sizes.size() == 2);
        CHECK(codec.sizes[0] == std::pair<int, int>{3, 3});
        CHECK(codec.sizes[1] == std::pair<int, int>{4, 4});
        CHECK(image.rgba.size() == 3 * 3 * 4);
        CHECK(pixel_at(image, 2, 2) == std::array<std::uint8_t, 4>{30, 20, 10, 40});
        CHECK_FALSE(image.report.notes.empty());
    }

    SUBCASE("Fails without a larger texture size") {
        codec.astc_failures = 1;
        auto data = sct_test::make_sct(40, 4, 4, sct_test::lz4_literals(std::vector<std::uint8_t>(16, 0)));
        decoded_image image;
        auto result = sct_decoder::decode_image(data, image, options);
        CHECK_FALSE(result.ok);
        CHECK(result.error == decode_error::unsupported_encoding);
        CHECK(codec.sizes.size() == 1);
    }
}

TEST_CASE("SCT decoder: limits and errors") {
    SUBCASE("Dimensions over the limit") {
        auto data = sct_test::make_sct(6, 200, 10, sct_test::lz4_literals({1, 2, 3}));
        sct_image::decode_options options;
        options.max_width = 100;
        decoded_image image;
        auto result = sct_decoder::decode_image(data, image, options);
        CHECK_FALSE(result.ok);
        CHECK(result.error == decode_error::dimensions_exceeded);
    }

    SUBCASE("Not an SCT file") {
        std::vector<std::uint8_t> data(40, 0);
        decoded_image image;
        auto result = sct_decoder::decode_image(data, image);
        CHECK_FALSE(result.ok);
        CHECK(result.error == decode_error::invalid_format);
    }

    SUBCASE("Zero dimensions") {
        auto data = sct_test::make_sct(6, 0, 10, sct_test::lz4_literals({1, 2, 3}));
        decoded_image image;
        auto result = sct_decoder::decode_image(data, image);
        CHECK_FALSE(result.ok);
        CHECK(result.error == decode_error::invalid_format);
    }
}
