/**
 * @file upload_example.cpp
 * @brief File upload example with progress reporting and error handling
 *
 * This example demonstrates:
 * - Reading configuration and the token from the environment
 * - Uploading a local file, with multipart chosen by size
 * - Rendering upload progress events
 * - Mapping error codes to hints
 *
 * Requires BLOB_READ_WRITE_TOKEN in the environment.
 */

#include <kcenon/blob/blob.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::blob;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief Create a test file with pattern content
 */
auto create_test_file(const std::filesystem::path& path, std::size_t size) -> bool {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    std::vector<char> buffer(std::min(size, std::size_t{65536}));
    for (std::size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = static_cast<char>('A' + (i % 26));
    }

    std::size_t remaining = size;
    while (remaining > 0) {
        auto to_write = std::min(remaining, buffer.size());
        file.write(buffer.data(), static_cast<std::streamsize>(to_write));
        remaining -= to_write;
    }

    std::cout << "Created test file: " << path << " (" << format_bytes(size) << ")" << std::endl;
    return static_cast<bool>(file);
}

auto parse_size(const std::string& size_str) -> std::optional<std::size_t> {
    std::size_t pos = 0;
    double value = 0;
    try {
        value = std::stod(size_str, &pos);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    if (pos < size_str.size()) {
        switch (static_cast<char>(std::toupper(size_str[pos]))) {
            case 'K': return static_cast<std::size_t>(value * 1024);
            case 'M': return static_cast<std::size_t>(value * 1024 * 1024);
            case 'G': return static_cast<std::size_t>(value * 1024 * 1024 * 1024);
            default: return std::nullopt;
        }
    }
    return static_cast<std::size_t>(value);
}

void print_progress(const upload_progress_event& event) {
    constexpr int bar_width = 30;
    int filled = static_cast<int>(event.percentage / 100.0 * bar_width);

    std::cout << "\r[";
    for (int i = 0; i < bar_width; ++i) {
        if (i < filled) std::cout << "=";
        else if (i == filled) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << event.percentage << "%"
              << " | " << format_bytes(event.loaded) << "/" << format_bytes(event.total)
              << "     " << std::flush;
}

void print_hint(const error& err) {
    switch (err.code) {
        case error_code::no_token_provided:
            std::cerr << "Hint: export BLOB_READ_WRITE_TOKEN" << std::endl;
            break;
        case error_code::access_denied:
        case error_code::token_expired:
            std::cerr << "Hint: the token is not valid for this store" << std::endl;
            break;
        case error_code::content_type_not_allowed:
            std::cerr << "Hint: pass --content-type with an allowed media type" << std::endl;
            break;
        case error_code::rate_limited:
            if (err.retry_after_seconds) {
                std::cerr << "Hint: retry after " << *err.retry_after_seconds << " seconds"
                          << std::endl;
            }
            break;
        case error_code::transfer_timeout:
            std::cerr << "Hint: raise the upload deadline or the part concurrency" << std::endl;
            break;
        default:
            break;
    }
}

void print_usage(const char* program) {
    std::cout << "Upload Example - Blob Upload System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> <pathname>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --private               Store with private access" << std::endl;
    std::cout << "  --content-type <type>   Content type of the blob" << std::endl;
    std::cout << "  --random-suffix         Let the service add a random suffix" << std::endl;
    std::cout << "  -o, --overwrite         Allow overwriting an existing blob" << std::endl;
    std::cout << "  --multipart             Force multipart upload" << std::endl;
    std::cout << "  --cooperative           Drive the upload on one io_context" << std::endl;
    std::cout << "  --create-test <size>    Create a test file first (e.g. 10M, 1G)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    put_options options;
    bool cooperative = false;
    std::string local_path;
    std::string pathname;
    std::optional<std::size_t> create_test_size;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--private") {
            options.access = blob_access::private_access;
        } else if (arg == "--content-type") {
            if (++i >= argc) {
                std::cerr << "Error: --content-type requires an argument" << std::endl;
                return 1;
            }
            options.content_type = argv[i];
        } else if (arg == "--random-suffix") {
            options.add_random_suffix = true;
        } else if (arg == "-o" || arg == "--overwrite") {
            options.allow_overwrite = true;
        } else if (arg == "--multipart") {
            options.multipart = true;
        } else if (arg == "--cooperative") {
            cooperative = true;
        } else if (arg == "--create-test") {
            if (++i >= argc) {
                std::cerr << "Error: --create-test requires a size argument" << std::endl;
                return 1;
            }
            create_test_size = parse_size(argv[i]);
            if (!create_test_size) {
                std::cerr << "Error: invalid size: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg[0] != '-') {
            if (local_path.empty()) {
                local_path = arg;
            } else if (pathname.empty()) {
                pathname = arg;
            }
        }
    }

    if (local_path.empty() || pathname.empty()) {
        std::cerr << "Error: Both local_file and pathname are required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (create_test_size && !create_test_file(local_path, *create_test_size)) {
        std::cerr << "Error creating test file: " << local_path << std::endl;
        return 1;
    }

    auto config = blob_config::from_environment();

    std::cout << "========================================" << std::endl;
    std::cout << "       Blob Upload Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  API: " << config.api_url << std::endl;
    std::cout << "  Local file: " << local_path << std::endl;
    std::cout << "  Pathname: " << pathname << std::endl;
    std::cout << "  Access: " << to_string(options.access) << std::endl;
    std::cout << "  Multipart threshold: " << format_bytes(config.multipart.threshold)
              << std::endl;
    std::cout << "  Model: " << (cooperative ? "cooperative" : "threaded") << std::endl;
    std::cout << std::endl;

    auto client_result = blob_client::builder()
        .with_config(config)
        .with_execution_model(cooperative ? execution_model::cooperative
                                          : execution_model::threaded)
        .build();
    if (!client_result) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    options.on_upload_progress = print_progress;

    auto start = std::chrono::steady_clock::now();
    auto blob = client.upload_file(local_path, pathname, options);
    std::cout << std::endl;

    if (!blob) {
        std::cerr << "Upload failed [" << to_string(blob.error().code) << "]: "
                  << blob.error().message << std::endl;
        print_hint(blob.error());
        return 1;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    std::cout << std::endl;
    std::cout << "Upload complete in " << elapsed.count() << " ms" << std::endl;
    std::cout << "  URL: " << blob.value().url << std::endl;
    std::cout << "  Download URL: " << blob.value().download_url << std::endl;
    std::cout << "  Pathname: " << blob.value().pathname << std::endl;
    std::cout << "  Content type: " << blob.value().content_type << std::endl;
    return 0;
}
