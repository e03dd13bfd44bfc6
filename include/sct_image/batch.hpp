#ifndef SCT_IMAGE_BATCH_HPP_
#define SCT_IMAGE_BATCH_HPP_

#include <sct_image/sct_image_export.h>
#include <sct_image/codecs/sct.hpp>
#include <sct_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <vector>

namespace sct_image {

// ============================================================================
// Output Directory Cache
// ============================================================================

/**
 * Remembers which output directories were already created, so parallel
 * conversions create each directory at most once.
 * Safe to share between threads.
 */
class SCT_IMAGE_EXPORT output_directory_cache {
public:
    output_directory_cache() = default;

    output_directory_cache(const output_directory_cache&) = delete;
    output_directory_cache& operator=(const output_directory_cache&) = delete;

    /**
     * Create dir (and its parents) unless this cache already did.
     * @return io_error result if the directory cannot be created
     */
    [[nodiscard]] decode_result ensure(const std::filesystem::path& dir);

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::set<std::filesystem::path> created_;
};

// ============================================================================
// File Conversion
// ============================================================================

struct conversion_result {
    std::filesystem::path input;
    std::filesystem::path output;
    decode_result result;
    decoded_image image;  // header, format and report; pixels released after encoding
};

// True when a registered decoder claims the extension (.sct, .sct2), ignoring case
[[nodiscard]] SCT_IMAGE_EXPORT bool is_texture_file(const std::filesystem::path& path);

/**
 * Read a whole file into memory.
 * @return io_error result if the file cannot be read
 */
[[nodiscard]] SCT_IMAGE_EXPORT decode_result read_file(const std::filesystem::path& path,
                                                       std::vector<std::uint8_t>& data);

/**
 * Decode one texture and write <stem>.png into output_dir.
 */
[[nodiscard]] SCT_IMAGE_EXPORT conversion_result convert_file(const std::filesystem::path& input,
                                                              const std::filesystem::path& output_dir,
                                                              output_directory_cache& cache,
                                                              const decode_options& options = {});

[[nodiscard]] SCT_IMAGE_EXPORT conversion_result convert_file(const std::filesystem::path& input,
                                                              const std::filesystem::path& output_dir,
                                                              const decode_options& options = {});

// ============================================================================
// Directory Conversion
// ============================================================================

/**
 * Recursively list the texture files below dir, sorted by path.
 */
[[nodiscard]] SCT_IMAGE_EXPORT std::vector<std::filesystem::path> collect_inputs(const std::filesystem::path& dir);

struct batch_summary {
    std::size_t total = 0;
    std::size_t failed = 0;
};

/**
 * Called once per file. May be called from several worker threads at once.
 */
using conversion_callback = std::function<void(const conversion_result&)>;

/**
 * Convert every texture below input_dir, mirroring its subdirectories
 * below output_dir. A failed file is reported and the rest continue.
 * @param jobs Worker count (0 = hardware concurrency)
 */
[[nodiscard]] SCT_IMAGE_EXPORT batch_summary convert_directory(const std::filesystem::path& input_dir,
                                                               const std::filesystem::path& output_dir,
                                                               output_directory_cache& cache,
                                                               const decode_options& options = {},
                                                               unsigned jobs = 0,
                                                               const conversion_callback& on_result = {});

} // namespace sct_image

#endif // SCT_IMAGE_BATCH_HPP_
