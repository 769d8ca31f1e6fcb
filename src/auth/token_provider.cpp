/**
 * @file token_provider.cpp
 * @brief Static and environment token providers
 */

#include <kcenon/blob/auth/token_provider.h>

#include <cstdlib>

namespace kcenon::blob {

namespace {

auto missing_token() -> unexpected {
    return unexpected(error{error_code::no_token_provided,
                            "no token found, set BLOB_READ_WRITE_TOKEN or pass a token"});
}

}  // namespace

static_token_provider::static_token_provider(std::string token) : token_(std::move(token)) {}

auto static_token_provider::get_token() const -> result<std::string> {
    if (token_.empty()) {
        return missing_token();
    }
    return token_;
}

auto environment_token_provider::get_token() const -> result<std::string> {
    for (const char* name : {"BLOB_READ_WRITE_TOKEN", "VERCEL_BLOB_READ_WRITE_TOKEN"}) {
        if (const char* value = std::getenv(name); value != nullptr && *value != '\0') {
            return std::string(value);
        }
    }
    return missing_token();
}

auto make_token_provider(const std::string& token) -> std::shared_ptr<token_provider> {
    if (!token.empty()) {
        return std::make_shared<static_token_provider>(token);
    }
    return std::make_shared<environment_token_provider>();
}

}  // namespace kcenon::blob
