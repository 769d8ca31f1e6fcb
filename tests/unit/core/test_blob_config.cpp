/**
 * @file test_blob_config.cpp
 * @brief Unit tests for configuration, environment parsing and retry policy
 */

#include <gtest/gtest.h>

#include <kcenon/blob/core/blob_config.h>

#include <cstdlib>
#include <string>
#include <vector>

namespace kcenon::blob::test {

class BlobConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const auto* name : variables_) {
            unsetenv(name);
        }
    }

    void TearDown() override {
        for (const auto* name : variables_) {
            unsetenv(name);
        }
    }

private:
    std::vector<const char*> variables_{
        "VERCEL_BLOB_API_URL",
        "NEXT_PUBLIC_VERCEL_BLOB_API_URL",
        "VERCEL_BLOB_API_VERSION_OVERRIDE",
        "NEXT_PUBLIC_VERCEL_BLOB_API_VERSION_OVERRIDE",
        "VERCEL_BLOB_RETRIES",
        "VERCEL_BLOB_USE_X_CONTENT_LENGTH",
        "VERCEL_BLOB_PROXY_THROUGH_ALTERNATIVE_API",
        "NEXT_PUBLIC_VERCEL_BLOB_PROXY_THROUGH_ALTERNATIVE_API",
    };
};

TEST_F(BlobConfigTest, DefaultsAreValid) {
    blob_config config;
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.api_url, "https://vercel.com/api/blob");
    EXPECT_EQ(config.api_version, "11");
    EXPECT_EQ(config.retry.max_retries, 10u);
    EXPECT_EQ(config.multipart.max_concurrent_parts, 6u);
    EXPECT_FALSE(config.send_content_length);
}

TEST_F(BlobConfigTest, BackoffDoublesAndCaps) {
    retry_policy policy;
    EXPECT_EQ(policy.delay_for(0).count(), 100);
    EXPECT_EQ(policy.delay_for(1).count(), 200);
    EXPECT_EQ(policy.delay_for(2).count(), 400);
    EXPECT_EQ(policy.delay_for(4).count(), 1600);
    EXPECT_EQ(policy.delay_for(5).count(), 2000);
    EXPECT_EQ(policy.delay_for(60).count(), 2000);
}

TEST_F(BlobConfigTest, PartSizeBelowMinimumIsRejected) {
    auto built = blob_config_builder().with_part_size(min_part_size - 1).build();
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);

    EXPECT_TRUE(blob_config_builder().with_part_size(min_part_size).build());
}

TEST_F(BlobConfigTest, ZeroConcurrencyIsRejected) {
    auto built = blob_config_builder().with_max_concurrent_parts(0).build();
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(BlobConfigTest, NonHttpApiUrlIsRejected) {
    auto built = blob_config_builder().with_api_url("ftp://example.com").build();
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(BlobConfigTest, BuilderAppliesEverySetting) {
    auto built = blob_config_builder()
                     .with_api_url("http://localhost:3000/api/blob")
                     .with_api_version("12")
                     .with_max_retries(3)
                     .with_content_length_header(true)
                     .with_alternative_api("1")
                     .with_request_timeout(std::chrono::milliseconds(500))
                     .with_multipart_threshold(1024)
                     .with_upload_deadline(std::chrono::milliseconds(9000))
                     .build();
    ASSERT_TRUE(built);
    const auto& config = built.value();
    EXPECT_EQ(config.api_url, "http://localhost:3000/api/blob");
    EXPECT_EQ(config.api_version, "12");
    EXPECT_EQ(config.retry.max_retries, 3u);
    EXPECT_TRUE(config.send_content_length);
    ASSERT_TRUE(config.proxy_through_alternative_api.has_value());
    EXPECT_EQ(*config.proxy_through_alternative_api, "1");
    EXPECT_EQ(config.request_timeout.count(), 500);
    EXPECT_EQ(config.multipart.threshold, 1024u);
    EXPECT_EQ(config.multipart.deadline.count(), 9000);
}

TEST_F(BlobConfigTest, EnvironmentOverridesDefaults) {
    setenv("VERCEL_BLOB_API_URL", "http://localhost:8080", 1);
    setenv("VERCEL_BLOB_API_VERSION_OVERRIDE", "99", 1);
    setenv("VERCEL_BLOB_RETRIES", "2", 1);
    setenv("VERCEL_BLOB_USE_X_CONTENT_LENGTH", "1", 1);

    auto config = blob_config::from_environment();
    EXPECT_EQ(config.api_url, "http://localhost:8080");
    EXPECT_EQ(config.api_version, "99");
    EXPECT_EQ(config.retry.max_retries, 2u);
    EXPECT_TRUE(config.send_content_length);
}

TEST_F(BlobConfigTest, PublicVariantsAreFallbacks) {
    setenv("NEXT_PUBLIC_VERCEL_BLOB_API_URL", "http://public.example", 1);
    EXPECT_EQ(blob_config::from_environment().api_url, "http://public.example");

    setenv("VERCEL_BLOB_API_URL", "http://private.example", 1);
    EXPECT_EQ(blob_config::from_environment().api_url, "http://private.example");
}

TEST_F(BlobConfigTest, MalformedRetriesKeepDefault) {
    setenv("VERCEL_BLOB_RETRIES", "many", 1);
    EXPECT_EQ(blob_config::from_environment().retry.max_retries, 10u);
}

TEST_F(BlobConfigTest, EmptyProxyValueIsStillForwarded) {
    setenv("VERCEL_BLOB_PROXY_THROUGH_ALTERNATIVE_API", "", 1);
    auto config = blob_config::from_environment();
    ASSERT_TRUE(config.proxy_through_alternative_api.has_value());
    EXPECT_TRUE(config.proxy_through_alternative_api->empty());
}

}  // namespace kcenon::blob::test
