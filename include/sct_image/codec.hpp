#ifndef SCT_IMAGE_CODEC_HPP_
#define SCT_IMAGE_CODEC_HPP_

#include <sct_image/sct_image_export.h>
#include <sct_image/types.hpp>
#include <sct_image/surface.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sct_image {

// ============================================================================
// Decoder Interface
// ============================================================================

/**
 * Abstract base class for texture decoders.
 * Used by the codec registry for runtime polymorphism.
 */
class SCT_IMAGE_EXPORT decoder {
public:
    virtual ~decoder() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::span<const std::string_view> extensions() const noexcept = 0;
    [[nodiscard]] virtual bool sniff(std::span<const std::uint8_t> data) const noexcept = 0;
    [[nodiscard]] virtual decode_result decode(std::span<const std::uint8_t> data,
                                                surface& surf,
                                                const decode_options& options) const = 0;
};

// ============================================================================
// Codec Registry
// ============================================================================

/**
 * Registry for texture decoders.
 * The SCT decoder is registered by default; user code can add more at runtime.
 */
class SCT_IMAGE_EXPORT codec_registry {
public:
    [[nodiscard]] static codec_registry& instance();

    /**
     * Register a decoder.
     * @param dec Unique pointer to decoder (ownership transferred)
     */
    void register_decoder(std::unique_ptr<decoder> dec);

    // Find decoder by sniffing data; nullptr if none matches
    [[nodiscard]] const decoder* find_decoder(std::span<const std::uint8_t> data) const;

    // Find decoder by name (e.g., "sct"); nullptr if unknown
    [[nodiscard]] const decoder* find_decoder(std::string_view name) const;

    /**
     * Find decoder by file extension, compared case-insensitively.
     * @param extension Extension including the dot (e.g., ".SCT2")
     * @return Pointer to decoder if found, nullptr otherwise
     */
    [[nodiscard]] const decoder* find_decoder_by_extension(std::string_view extension) const;

    [[nodiscard]] std::size_t decoder_count() const noexcept {
        return decoders_.size();
    }

    [[nodiscard]] const decoder* decoder_at(std::size_t index) const noexcept {
        return index < decoders_.size() ? decoders_[index].get() : nullptr;
    }

private:
    codec_registry();
    ~codec_registry();

    codec_registry(const codec_registry&) = delete;
    codec_registry& operator=(const codec_registry&) = delete;

    std::vector<std::unique_ptr<decoder>> decoders_;
};

// ============================================================================
// Convenience Decode Functions
// ============================================================================

/**
 * Decode texture data to a surface (auto-detect format).
 * @param data Raw file data
 * @param surf Destination surface
 * @param options Decode options
 * @return Decode result
 */
[[nodiscard]] SCT_IMAGE_EXPORT decode_result decode(std::span<const std::uint8_t> data,
                                                     surface& surf,
                                                     const decode_options& options = {});

/**
 * Decode texture data to a surface with an explicit codec.
 */
[[nodiscard]] SCT_IMAGE_EXPORT decode_result decode(std::span<const std::uint8_t> data,
                                                     surface& surf,
                                                     std::string_view codec_name,
                                                     const decode_options& options = {});

} // namespace sct_image

#endif // SCT_IMAGE_CODEC_HPP_
