/**
 * @file test_download_file.cpp
 * @brief Unit tests for download_file
 */

#include <gtest/gtest.h>

#include <kcenon/blob/client/blob_client.h>

#include "support/fake_blob_service.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace kcenon::blob::test {

namespace {

constexpr const char* test_token = "vercel_blob_rw_store123_secretvalue";
constexpr const char* public_url = "https://store123.public.blob.vercel-storage.com/docs/a.txt";

auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

class DownloadFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_ = std::make_shared<fake_blob_service>();
        auto built = blob_client::builder()
                         .with_token(test_token)
                         .with_transport(service_)
                         .build();
        ASSERT_TRUE(built) << built.error().message;
        client_ = std::make_unique<blob_client>(std::move(built.value()));

        dir_ = std::filesystem::temp_directory_path() /
               ("blob_download_test_" + blob_utils::generate_random_hex(6));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::shared_ptr<fake_blob_service> service_;
    std::unique_ptr<blob_client> client_;
    std::filesystem::path dir_;
};

TEST_F(DownloadFileTest, PathnameResolvesInTokenStore) {
    std::string content(5000, 'z');
    service_->add_download(public_url, content);

    auto saved = client_->download_file("docs/a.txt", dir_ / "a.txt");
    ASSERT_TRUE(saved) << saved.error().message;
    EXPECT_EQ(read_file(dir_ / "a.txt"), content);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.txt.part"));

    auto gets = service_->requests_for("get");
    ASSERT_EQ(gets.size(), 1u);
    EXPECT_EQ(gets[0].url, std::string(public_url) + "?download=1");
    EXPECT_TRUE(gets[0].header("authorization").empty());
}

TEST_F(DownloadFileTest, FullUrlIsUsedAsIs) {
    service_->add_download("https://cdn.test/x.bin", "abc");
    ASSERT_TRUE(client_->download_file("https://cdn.test/x.bin", dir_ / "x.bin"));
    EXPECT_EQ(read_file(dir_ / "x.bin"), "abc");
}

TEST_F(DownloadFileTest, PrivateAccessSendsToken) {
    service_->add_download("https://store123.private.blob.vercel-storage.com/p.txt", "secret");
    download_options options;
    options.access = blob_access::private_access;
    ASSERT_TRUE(client_->download_file("p.txt", dir_ / "p.txt", options));
    EXPECT_EQ(service_->requests_for("get")[0].header("authorization"),
              std::string("Bearer ") + test_token);
}

TEST_F(DownloadFileTest, ProgressReachesContentLength) {
    std::string content(4096, 'q');
    service_->add_download(public_url, content);

    std::vector<std::pair<uint64_t, std::optional<uint64_t>>> events;
    download_options options;
    options.on_progress = [&](uint64_t loaded, std::optional<uint64_t> total) {
        events.emplace_back(loaded, total);
    };
    ASSERT_TRUE(client_->download_file("docs/a.txt", dir_ / "a.txt", options));
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().first, content.size());
    ASSERT_TRUE(events.back().second.has_value());
    EXPECT_EQ(*events.back().second, content.size());
}

TEST_F(DownloadFileTest, MissingBlobIsNotFound) {
    auto saved = client_->download_file("docs/missing.txt", dir_ / "missing.txt");
    ASSERT_FALSE(saved);
    EXPECT_EQ(saved.error().code, error_code::not_found);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "missing.txt"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "missing.txt.part"));
}

TEST_F(DownloadFileTest, ExistingDestinationNeedsOverwrite) {
    service_->add_download(public_url, "new");
    std::ofstream(dir_ / "a.txt") << "old";

    auto refused = client_->download_file("docs/a.txt", dir_ / "a.txt");
    ASSERT_FALSE(refused);
    EXPECT_EQ(refused.error().code, error_code::file_already_exists);
    EXPECT_EQ(read_file(dir_ / "a.txt"), "old");

    download_options options;
    options.overwrite = true;
    ASSERT_TRUE(client_->download_file("docs/a.txt", dir_ / "a.txt", options));
    EXPECT_EQ(read_file(dir_ / "a.txt"), "new");
}

TEST_F(DownloadFileTest, ParentsCreatedOnRequest) {
    service_->add_download(public_url, "nested");
    download_options options;
    options.create_parents = true;
    ASSERT_TRUE(client_->download_file("docs/a.txt", dir_ / "x" / "y" / "a.txt", options));
    EXPECT_EQ(read_file(dir_ / "x" / "y" / "a.txt"), "nested");
}

TEST_F(DownloadFileTest, TransportFailureIsUnknown) {
    service_->script("get", scripted_response::transport_failure());
    auto saved = client_->download_file("docs/a.txt", dir_ / "a.txt");
    ASSERT_FALSE(saved);
    EXPECT_EQ(saved.error().code, error_code::unknown_error);
}

TEST(DownloadFileTokenTest, OpaqueTokenNeedsFullUrl) {
    auto service = std::make_shared<fake_blob_service>();
    auto built = blob_client::builder()
                     .with_token("opaque-token")
                     .with_transport(service)
                     .build();
    ASSERT_TRUE(built);
    auto saved = built.value().download_file("docs/a.txt", std::filesystem::temp_directory_path() /
                                                               "never_written.txt");
    ASSERT_FALSE(saved);
    EXPECT_EQ(saved.error().code, error_code::invalid_argument);
    EXPECT_TRUE(service->requests().empty());
}

}  // namespace kcenon::blob::test
