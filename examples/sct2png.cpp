#include <sct_image/sct_image.hpp>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct cli_options {
    std::filesystem::path input;
    std::filesystem::path output_dir;
    unsigned jobs = 0;
    bool verbose = false;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <input> [output_dir]\n";
    std::cerr << "Converts SCT/SCT2 textures to PNG. <input> may be a file or a directory.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --out <dir>   Output directory (default: next to the input)\n";
    std::cerr << "  -j, --jobs <n>    Worker threads for directories (default: all cores)\n";
    std::cerr << "  -v, --verbose     Print header and decompression details\n";
    std::cerr << "  -l, --list        List available codecs\n";
    std::cerr << "  -h, --help        Show this help\n";
}

void list_codecs() {
    std::cout << "Available codecs:\n";
    const auto& registry = sct_image::codec_registry::instance();
    for (std::size_t i = 0; i < registry.decoder_count(); ++i) {
        const auto* decoder = registry.decoder_at(i);
        std::cout << "  " << decoder->name() << " (";
        bool first = true;
        for (const auto& ext : decoder->extensions()) {
            if (!first) std::cout << ", ";
            std::cout << ext;
            first = false;
        }
        std::cout << ")\n";
    }
}

void print_details(const sct_image::decoded_image& image) {
    const auto& header = image.header;
    const auto& report = image.report;

    std::cout << "  Container: " << sct_image::to_string(header.variant) << "\n";
    std::cout << "  Size: " << header.width << "x" << header.height
              << " (texture " << header.texture_width << "x" << header.texture_height << ")\n";
    std::cout << "  Pixel format: " << header.pixel_format_code << " (" << image.format.name << ", "
              << sct_image::to_string(image.format.pathway) << ")\n";
    if (header.variant == sct_image::container_variant::v2) {
        std::cout << "  Flags: 0x" << std::hex << static_cast<int>(header.flags) << std::dec
                  << (header.has_alpha() ? " alpha" : "")
                  << (header.crop() ? " crop" : "")
                  << (header.raw() ? " raw" : "")
                  << (header.mipmap() ? " mipmap" : "") << "\n";
    }
    if (report.probe) {
        std::cout << std::fixed << std::setprecision(3)
                  << "  Probe: expected " << report.probe->expected_size
                  << " bytes, size ratio " << report.probe->size_ratio
                  << ", decompressed ratio " << report.probe->decompressed_ratio
                  << (report.probe->compressed ? ", compressed" : ", raw") << "\n";
        std::cout.unsetf(std::ios::floatfield);
    }
    std::cout << "  Payload: " << report.payload_size << " bytes, "
              << sct_image::to_string(report.source);
    if (report.source == sct_image::payload_source::decompressed) {
        std::cout << " to " << report.data_size << " of " << report.declared_size << " declared bytes";
    }
    std::cout << "\n";
    for (const auto& note : report.notes) {
        std::cout << "  Note: " << note << "\n";
    }
}

// Returns false for usage errors
bool parse_arguments(int argc, char* argv[], cli_options& options) {
    std::vector<std::string_view> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "-v" || arg == "--v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-o" || arg == "--out") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " needs a directory\n";
                return false;
            }
            options.output_dir = argv[++i];
        } else if (arg.rfind("--out=", 0) == 0) {
            options.output_dir = std::string(arg.substr(6));
        } else if (arg == "-j" || arg == "--jobs") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " needs a number\n";
                return false;
            }
            options.jobs = static_cast<unsigned>(std::strtoul(argv[++i], nullptr, 10));
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        return false;
    }
    options.input = std::string(positional[0]);
    if (positional.size() == 2) {
        if (!options.output_dir.empty()) {
            std::cerr << "Error: Output directory given twice\n";
            return false;
        }
        options.output_dir = std::string(positional[1]);
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-l") == 0 || std::strcmp(argv[i], "--list") == 0) {
            list_codecs();
            return 0;
        }
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
    }

    cli_options options;
    if (!parse_arguments(argc, argv, options)) {
        print_usage(argv[0]);
        return 1;
    }

    std::error_code ec;
    const bool is_directory = std::filesystem::is_directory(options.input, ec);
    if (!is_directory && !std::filesystem::is_regular_file(options.input, ec)) {
        std::cerr << "Error: File not found: " << options.input << "\n";
        return 1;
    }

    if (options.output_dir.empty()) {
        options.output_dir = is_directory ? options.input : options.input.parent_path();
        if (options.output_dir.empty()) {
            options.output_dir = ".";
        }
    }

    const auto start = std::chrono::steady_clock::now();
    std::mutex console_mutex;
    sct_image::output_directory_cache cache;

    auto report = [&](const sct_image::conversion_result& conversion) {
        std::lock_guard<std::mutex> lock(console_mutex);
        if (!conversion.result) {
            std::cerr << "Error: Failed to convert " << conversion.input << ": "
                      << conversion.result.message << "\n";
            if (options.verbose && conversion.image.width > 0) {
                print_details(conversion.image);
            }
            return;
        }
        std::cout << "Saved: " << conversion.output << "\n";
        if (options.verbose) {
            print_details(conversion.image);
        }
    };

    int status = 0;
    if (is_directory) {
        const auto summary = sct_image::convert_directory(options.input, options.output_dir, cache,
                                                          {}, options.jobs, report);
        if (summary.total == 0) {
            std::cout << "No .sct or .sct2 files found in " << options.input << "\n";
        } else {
            std::cout << "Converted " << (summary.total - summary.failed) << " of "
                      << summary.total << " files\n";
        }
        status = summary.failed > 0 ? 1 : 0;
    } else {
        const auto conversion = sct_image::convert_file(options.input, options.output_dir, cache);
        report(conversion);
        status = conversion.result ? 0 : 1;
    }

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    std::cout << std::fixed << std::setprecision(2) << "Elapsed: " << elapsed.count() << "s\n";

    return status;
}
