#include <sct_image/batch.hpp>
#include <sct_image/codec.hpp>
#include <sct_image/codecs/png.hpp>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>

namespace sct_image {

namespace fs = std::filesystem;

namespace {

// Mirror the input file's directory below output_root
fs::path mirrored_directory(const fs::path& input, const fs::path& input_root, const fs::path& output_root) {
    const fs::path relative = input.parent_path().lexically_relative(input_root);
    if (relative.empty() || relative == ".") {
        return output_root;
    }
    return output_root / relative;
}

// Joins every started worker, including when starting a later one throws
class worker_pool {
public:
    explicit worker_pool(unsigned size) { threads_.reserve(size); }
    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;
    ~worker_pool() { join(); }

    template <typename Fn>
    void start(unsigned count, Fn&& fn) {
        for (unsigned i = 0; i < count; ++i) {
            try {
                threads_.emplace_back(fn);
            } catch (const std::system_error&) {
                if (threads_.empty()) throw;
                // Run with the workers already started
                return;
            }
        }
    }

    void join() {
        for (auto& thread : threads_) {
            if (thread.joinable()) thread.join();
        }
    }

private:
    std::vector<std::thread> threads_;
};

} // namespace

// ============================================================================
// Output Directory Cache
// ============================================================================

decode_result output_directory_cache::ensure(const fs::path& dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!created_.insert(dir).second) {
        return decode_result::success();
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        created_.erase(dir);
        return decode_result::failure(decode_error::io_error,
            "Cannot create directory " + dir.string() + ": " + ec.message());
    }
    return decode_result::success();
}

std::size_t output_directory_cache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_.size();
}

// ============================================================================
// File Conversion
// ============================================================================

bool is_texture_file(const fs::path& path) {
    const std::string ext = path.extension().string();
    return !ext.empty() && codec_registry::instance().find_decoder_by_extension(ext) != nullptr;
}

decode_result read_file(const fs::path& path, std::vector<std::uint8_t>& data) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return decode_result::failure(decode_error::io_error, "Cannot open " + path.string());
    }

    const auto size = file.tellg();
    if (size < 0) {
        return decode_result::failure(decode_error::io_error, "Cannot size " + path.string());
    }
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);
    if (!file) {
        return decode_result::failure(decode_error::io_error, "Failed reading " + path.string());
    }

    return decode_result::success();
}

conversion_result convert_file(const fs::path& input,
                               const fs::path& output_dir,
                               output_directory_cache& cache,
                               const decode_options& options) {
    conversion_result conversion;
    conversion.input = input;
    conversion.output = output_dir / input.stem();
    conversion.output += ".png";

    std::vector<std::uint8_t> data;
    conversion.result = read_file(input, data);
    if (!conversion.result) return conversion;

    conversion.result = sct_decoder::decode_image(data, conversion.image, options);
    if (!conversion.result) return conversion;

    const auto png_data = encode_png(conversion.image.rgba, conversion.image.width, conversion.image.height);
    conversion.image.rgba = {};
    if (png_data.empty()) {
        conversion.result = decode_result::failure(decode_error::internal_error, "PNG encoding failed");
        return conversion;
    }

    conversion.result = cache.ensure(output_dir);
    if (!conversion.result) return conversion;

    conversion.result = write_file(png_data, conversion.output);
    return conversion;
}

conversion_result convert_file(const fs::path& input,
                               const fs::path& output_dir,
                               const decode_options& options) {
    output_directory_cache cache;
    return convert_file(input, output_dir, cache, options);
}

// ============================================================================
// Directory Conversion
// ============================================================================

std::vector<fs::path> collect_inputs(const fs::path& dir) {
    std::vector<fs::path> inputs;

    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && is_texture_file(it->path())) {
            inputs.push_back(it->path());
        }
    }

    std::sort(inputs.begin(), inputs.end());
    return inputs;
}

batch_summary convert_directory(const fs::path& input_dir,
                                const fs::path& output_dir,
                                output_directory_cache& cache,
                                const decode_options& options,
                                unsigned jobs,
                                const conversion_callback& on_result) {
    const std::vector<fs::path> inputs = collect_inputs(input_dir);

    batch_summary summary;
    summary.total = inputs.size();
    if (inputs.empty()) {
        return summary;
    }

    if (jobs == 0) {
        jobs = std::max(1u, std::thread::hardware_concurrency());
    }
    jobs = static_cast<unsigned>(std::min<std::size_t>(jobs, inputs.size()));

    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> failed{0};

    auto worker = [&]() {
        for (std::size_t i = next++; i < inputs.size(); i = next++) {
            const fs::path target = mirrored_directory(inputs[i], input_dir, output_dir);
            const conversion_result conversion = convert_file(inputs[i], target, cache, options);
            if (!conversion.result) {
                ++failed;
            }
            if (on_result) {
                on_result(conversion);
            }
        }
    };

    if (jobs == 1) {
        worker();
    } else {
        worker_pool pool(jobs);
        try {
            pool.start(jobs, worker);
        } catch (const std::system_error&) {
            // No thread could be started; convert on the calling thread
            worker();
        }
        pool.join();
    }

    summary.failed = failed.load();
    return summary;
}

} // namespace sct_image
