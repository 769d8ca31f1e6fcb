/**
 * @file multipart_example.cpp
 * @brief Manual multipart upload driven part by part
 *
 * This example demonstrates:
 * - Creating a multipart upload session
 * - Reading and uploading parts from a stream one at a time
 * - Completing the upload with the collected part results
 * - Observing orchestrator state transitions with create_uploader()
 *
 * Requires BLOB_READ_WRITE_TOKEN in the environment.
 */

#include <kcenon/blob/blob.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace kcenon::blob;

namespace {

void print_usage(const char* program) {
    std::cout << "Multipart Example - Blob Upload System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [--orchestrated] <local_file> <pathname>" << std::endl;
    std::cout << std::endl;
    std::cout << "  --orchestrated   Let multipart_uploader schedule the parts" << std::endl;
}

auto upload_manually(blob_client& client, const std::string& local_path,
                     const std::string& pathname) -> result<put_blob_result> {
    std::ifstream file(local_path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::file_not_found, "cannot open " + local_path});
    }

    auto mpu = client.multipart();
    put_options options;
    auto headers = make_put_headers(options);

    auto session = mpu.create_multipart_upload(pathname, headers);
    if (!session) {
        return unexpected(session.error());
    }
    std::cout << "[create] upload id " << session.value().upload_id << std::endl;

    const auto part_size = client.config().multipart.part_size;
    std::vector<part_result> parts;
    uint32_t part_number = 1;
    while (file) {
        byte_buffer chunk(part_size);
        file.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(part_size));
        chunk.resize(static_cast<std::size_t>(file.gcount()));
        if (chunk.empty()) {
            break;
        }

        auto size = chunk.size();
        auto part = mpu.upload_part(session.value(), part_number, std::move(chunk));
        if (!part) {
            return unexpected(part.error());
        }
        std::cout << "[upload] part " << part_number << " (" << size << " bytes) etag "
                  << part.value().etag << std::endl;
        parts.push_back(part.value());
        ++part_number;
    }

    std::cout << "[complete] " << parts.size() << " parts" << std::endl;
    return mpu.complete_multipart_upload(session.value(), std::move(parts));
}

auto upload_orchestrated(blob_client& client, const std::string& local_path,
                         const std::string& pathname) -> result<put_blob_result> {
    auto stream = std::make_shared<std::ifstream>(local_path, std::ios::binary);
    if (!*stream) {
        return unexpected(error{error_code::file_not_found, "cannot open " + local_path});
    }

    auto uploader = client.create_uploader();
    uploader.set_observer([](upload_state from, upload_state to) {
        std::cout << "[state] " << to_string(from) << " -> " << to_string(to) << std::endl;
    });

    return uploader.upload(pathname, std::shared_ptr<std::istream>(stream),
                           make_put_headers(put_options{}), std::nullopt,
                           [](const upload_progress_event& event) {
                               std::cout << "\r" << event.percentage << "%   " << std::flush;
                           });
}

}  // namespace

int main(int argc, char* argv[]) {
    bool orchestrated = false;
    std::string local_path;
    std::string pathname;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--orchestrated") {
            orchestrated = true;
        } else if (local_path.empty()) {
            local_path = arg;
        } else if (pathname.empty()) {
            pathname = arg;
        }
    }

    if (local_path.empty() || pathname.empty()) {
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
    auto& client = client_result.value();

    auto blob = orchestrated ? upload_orchestrated(client, local_path, pathname)
                             : upload_manually(client, local_path, pathname);
    std::cout << std::endl;
    if (!blob) {
        std::cerr << "Multipart upload failed [" << to_string(blob.error().code) << "]: "
                  << blob.error().message << std::endl;
        return 1;
    }

    std::cout << "Stored at " << blob.value().url << std::endl;
    return 0;
}
