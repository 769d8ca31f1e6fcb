/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and credential masking
 */

#include <gtest/gtest.h>

#include <kcenon/blob/core/logging.h>

#include <string>
#include <vector>

namespace kcenon::blob::test {

// =============================================================================
// Masking
// =============================================================================

TEST(MaskingConfigTest, DefaultMasksTokensOnly) {
    masking_config config;
    EXPECT_TRUE(config.mask_tokens);
    EXPECT_FALSE(config.mask_upload_ids);
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST(SensitiveInfoMaskerTest, MasksBearerToken) {
    sensitive_info_masker masker;
    EXPECT_EQ(masker.mask("authorization: Bearer abcdefghij"),
              "authorization: Bearer abcd******");
}

TEST(SensitiveInfoMaskerTest, MasksRawReadWriteToken) {
    sensitive_info_masker masker;
    auto masked = masker.mask("token vercel_blob_rw_store_secret rejected");
    EXPECT_EQ(masked.find("secret"), std::string::npos);
    EXPECT_NE(masked.find("vercel_blob_rw_stor"), std::string::npos);
    EXPECT_NE(masked.find(" rejected"), std::string::npos);
}

TEST(SensitiveInfoMaskerTest, NoneLeavesTextAlone) {
    sensitive_info_masker masker(masking_config::none());
    EXPECT_EQ(masker.mask("Bearer abcdefghij"), "Bearer abcdefghij");
}

TEST(SensitiveInfoMaskerTest, UploadIdMaskedOnlyWhenConfigured) {
    EXPECT_EQ(sensitive_info_masker().mask_upload_id("upload-12345"), "upload-12345");
    EXPECT_EQ(sensitive_info_masker(masking_config::all_masked()).mask_upload_id("upload-12345"),
              "uplo********");
}

// =============================================================================
// Context
// =============================================================================

TEST(TransferLogContextTest, OnlySetFieldsAppear) {
    transfer_log_context ctx;
    ctx.pathname = "videos/a.mp4";
    ctx.part_number = 3;
    ctx.status_code = 503;

    EXPECT_EQ(ctx.to_json(), R"({"pathname":"videos/a.mp4","part_number":3,"status_code":503})");
}

TEST(TransferLogContextTest, ErrorMessageIsMasked) {
    transfer_log_context ctx;
    ctx.error_message = "Bearer abcdefghij refused";
    sensitive_info_masker masker;
    auto json = ctx.to_json(&masker);
    EXPECT_EQ(json.find("efghij"), std::string::npos);
}

// =============================================================================
// Logger
// =============================================================================

class BlobLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level_ = get_logger().get_level();
        get_logger().set_level(log_level::trace);
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_json_callback(nullptr);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_level(previous_level_);
    }

    log_level previous_level_ = log_level::info;
};

TEST_F(BlobLoggerTest, CallbackSeesCategoryAndContext) {
    std::vector<std::string> categories;
    std::vector<std::string> pathnames;
    get_logger().set_callback([&](log_level, std::string_view category, std::string_view,
                                  const transfer_log_context* ctx) {
        categories.emplace_back(category);
        pathnames.push_back(ctx ? ctx->pathname : "");
    });

    transfer_log_context ctx;
    ctx.pathname = "a.txt";
    BLOB_LOG_INFO_CTX(log_category::multipart, "part uploaded", ctx);
    BLOB_LOG_DEBUG(log_category::request, "retrying");

    ASSERT_EQ(categories.size(), 2u);
    EXPECT_EQ(categories[0], "blob.multipart");
    EXPECT_EQ(pathnames[0], "a.txt");
    EXPECT_EQ(categories[1], "blob.request");
    EXPECT_EQ(pathnames[1], "");
}

TEST_F(BlobLoggerTest, LevelFiltersMessages) {
    int count = 0;
    get_logger().set_callback(
        [&](log_level, std::string_view, std::string_view, const transfer_log_context*) {
            ++count;
        });

    get_logger().set_level(log_level::warn);
    BLOB_LOG_INFO(log_category::client, "hidden");
    BLOB_LOG_WARN(log_category::client, "shown");
    EXPECT_EQ(count, 1);
}

TEST_F(BlobLoggerTest, JsonOutputIsMasked) {
    std::string captured;
    get_logger().set_output_format(log_output_format::json);
    get_logger().set_json_callback(
        [&](const structured_log_entry&, const std::string& json) { captured = json; });

    transfer_log_context ctx;
    ctx.error_message = "Bearer abcdefghij expired";
    BLOB_LOG_ERROR_CTX(log_category::request, "request failed", ctx);

    EXPECT_NE(captured.find("\"blob.request\""), std::string::npos);
    EXPECT_EQ(captured.find("efghij"), std::string::npos);
}

}  // namespace kcenon::blob::test
