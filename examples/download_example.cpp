/**
 * @file download_example.cpp
 * @brief Blob download example with progress reporting
 *
 * Downloads a blob URL, or a pathname in the token's store, to a local file.
 */

#include <kcenon/blob/blob.h>

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

using namespace kcenon::blob;

namespace {

void print_usage(const char* program) {
    std::cout << "Download Example - Blob Upload System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <url_or_pathname> <local_file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --private      Blob has private access (sends the token)" << std::endl;
    std::cout << "  -o, --overwrite  Replace an existing local file" << std::endl;
    std::cout << "  -p, --parents    Create missing parent directories" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    download_options options;
    std::string source;
    std::string local_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--private") {
            options.access = blob_access::private_access;
        } else if (arg == "-o" || arg == "--overwrite") {
            options.overwrite = true;
        } else if (arg == "-p" || arg == "--parents") {
            options.create_parents = true;
        } else if (source.empty()) {
            source = arg;
        } else if (local_path.empty()) {
            local_path = arg;
        }
    }

    if (source.empty() || local_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto client_result = blob_client::builder()
        .with_config(blob_config::from_environment())
        .build();
    if (!client_result) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }

    options.on_progress = [](uint64_t loaded, std::optional<uint64_t> total) {
        std::cout << "\r" << loaded;
        if (total) {
            std::cout << " / " << *total << " bytes (" << std::fixed << std::setprecision(1)
                      << compute_percentage(loaded, *total) << "%)";
        } else {
            std::cout << " bytes";
        }
        std::cout << "     " << std::flush;
    };

    auto saved = client_result.value().download_file(source, local_path, options);
    std::cout << std::endl;
    if (!saved) {
        std::cerr << "Download failed [" << to_string(saved.error().code) << "]: "
                  << saved.error().message << std::endl;
        return 1;
    }

    std::cout << "Saved to " << saved.value() << std::endl;
    return 0;
}
