/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <kcenon/blob/blob.h>

namespace kcenon::blob::test {

TEST(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

TEST(VersionTest, ComponentsMatchString) {
    auto expected = std::to_string(version::major) + "." + std::to_string(version::minor) + "." +
                    std::to_string(version::patch);
    EXPECT_EQ(version::to_string(), expected);
}

}  // namespace kcenon::blob::test
