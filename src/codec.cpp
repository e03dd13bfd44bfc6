#include <sct_image/codec.hpp>
#include <sct_image/codecs/sct.hpp>

#include <algorithm>
#include <cctype>

namespace sct_image {

namespace {

bool equals_ignore_case(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

class sct_decoder_impl : public decoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return sct_decoder::name;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return sct_decoder::extensions;
    }

    [[nodiscard]] bool sniff(std::span<const std::uint8_t> data) const noexcept override {
        return sct_decoder::sniff(data);
    }

    [[nodiscard]] decode_result decode(std::span<const std::uint8_t> data,
                                        surface& surf,
                                        const decode_options& options) const override {
        return sct_decoder::decode(data, surf, options);
    }
};

} // namespace

// ============================================================================
// Codec Registry
// ============================================================================

codec_registry& codec_registry::instance() {
    static codec_registry registry;
    return registry;
}

codec_registry::codec_registry() {
    decoders_.push_back(std::make_unique<sct_decoder_impl>());
}

codec_registry::~codec_registry() = default;

void codec_registry::register_decoder(std::unique_ptr<decoder> dec) {
    if (dec) {
        decoders_.push_back(std::move(dec));
    }
}

const decoder* codec_registry::find_decoder(std::span<const std::uint8_t> data) const {
    for (const auto& dec : decoders_) {
        if (dec->sniff(data)) {
            return dec.get();
        }
    }
    return nullptr;
}

const decoder* codec_registry::find_decoder(std::string_view name) const {
    for (const auto& dec : decoders_) {
        if (dec->name() == name) {
            return dec.get();
        }
    }
    return nullptr;
}

const decoder* codec_registry::find_decoder_by_extension(std::string_view extension) const {
    for (const auto& dec : decoders_) {
        const auto exts = dec->extensions();
        if (std::any_of(exts.begin(), exts.end(),
                        [extension](std::string_view ext) { return equals_ignore_case(ext, extension); })) {
            return dec.get();
        }
    }
    return nullptr;
}

// ============================================================================
// Convenience Functions
// ============================================================================

decode_result decode(std::span<const std::uint8_t> data,
                     surface& surf,
                     const decode_options& options) {
    const auto* dec = codec_registry::instance().find_decoder(data);
    if (!dec) {
        return decode_result::failure(decode_error::invalid_format, "Not an SCT or SCT2 file");
    }
    return dec->decode(data, surf, options);
}

decode_result decode(std::span<const std::uint8_t> data,
                     surface& surf,
                     std::string_view codec_name,
                     const decode_options& options) {
    const auto* dec = codec_registry::instance().find_decoder(codec_name);
    if (!dec) {
        return decode_result::failure(decode_error::invalid_format,
            std::string("Unknown codec: ") + std::string(codec_name));
    }
    return dec->decode(data, surf, options);
}

} // namespace sct_image
