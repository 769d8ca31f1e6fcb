/**
 * @file test_token_provider.cpp
 * @brief Unit tests for token providers
 */

#include <gtest/gtest.h>

#include <kcenon/blob/auth/token_provider.h>

#include <cstdlib>

namespace kcenon::blob::test {

class TokenProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("BLOB_READ_WRITE_TOKEN");
        unsetenv("VERCEL_BLOB_READ_WRITE_TOKEN");
    }
    void TearDown() override { SetUp(); }
};

TEST_F(TokenProviderTest, StaticTokenIsReturned) {
    static_token_provider provider("vercel_blob_rw_a_b");
    auto token = provider.get_token();
    ASSERT_TRUE(token);
    EXPECT_EQ(token.value(), "vercel_blob_rw_a_b");
}

TEST_F(TokenProviderTest, EmptyStaticTokenIsMissing) {
    auto token = static_token_provider("").get_token();
    ASSERT_FALSE(token);
    EXPECT_EQ(token.error().code, error_code::no_token_provided);
}

TEST_F(TokenProviderTest, EnvironmentPrefersPrimaryVariable) {
    setenv("VERCEL_BLOB_READ_WRITE_TOKEN", "secondary", 1);
    EXPECT_EQ(environment_token_provider().get_token().value(), "secondary");

    setenv("BLOB_READ_WRITE_TOKEN", "primary", 1);
    EXPECT_EQ(environment_token_provider().get_token().value(), "primary");
}

TEST_F(TokenProviderTest, EnvironmentWithoutTokenIsMissing) {
    setenv("BLOB_READ_WRITE_TOKEN", "", 1);
    auto token = environment_token_provider().get_token();
    ASSERT_FALSE(token);
    EXPECT_EQ(token.error().code, error_code::no_token_provided);
}

TEST_F(TokenProviderTest, FactoryPicksStaticWhenGiven) {
    setenv("BLOB_READ_WRITE_TOKEN", "from-env", 1);
    EXPECT_EQ(make_token_provider("explicit")->get_token().value(), "explicit");
    EXPECT_EQ(make_token_provider()->get_token().value(), "from-env");
}

}  // namespace kcenon::blob::test
