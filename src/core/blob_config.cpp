/**
 * @file blob_config.cpp
 * @brief Environment loading and validation for blob_config
 */

#include <kcenon/blob/core/blob_config.h>

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace kcenon::blob {

namespace {

auto read_env(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

auto read_env_non_empty(const char* primary, const char* fallback) -> std::optional<std::string> {
    if (auto value = read_env(primary); value && !value->empty()) {
        return value;
    }
    if (auto value = read_env(fallback); value && !value->empty()) {
        return value;
    }
    return std::nullopt;
}

auto parse_size(std::string_view text) -> std::optional<std::size_t> {
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto blob_config::from_environment() -> blob_config {
    blob_config config;

    if (auto url = read_env_non_empty("VERCEL_BLOB_API_URL", "NEXT_PUBLIC_VERCEL_BLOB_API_URL")) {
        config.api_url = *url;
    }

    if (auto version = read_env_non_empty("VERCEL_BLOB_API_VERSION_OVERRIDE",
                                          "NEXT_PUBLIC_VERCEL_BLOB_API_VERSION_OVERRIDE")) {
        config.api_version = *version;
    }

    if (auto retries = read_env("VERCEL_BLOB_RETRIES")) {
        if (auto parsed = parse_size(*retries)) {
            config.retry.max_retries = *parsed;
        }
    }

    config.send_content_length = read_env("VERCEL_BLOB_USE_X_CONTENT_LENGTH") == "1";

    // An empty value is still forwarded; only an unset variable falls through
    if (auto proxy = read_env("VERCEL_BLOB_PROXY_THROUGH_ALTERNATIVE_API")) {
        config.proxy_through_alternative_api = *proxy;
    } else if (auto next_proxy = read_env("NEXT_PUBLIC_VERCEL_BLOB_PROXY_THROUGH_ALTERNATIVE_API")) {
        config.proxy_through_alternative_api = *next_proxy;
    }

    return config;
}

auto blob_config::validate() const -> result<void> {
    std::string_view url(api_url);
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "api_url must start with http:// or https://"});
    }
    if (api_version.empty()) {
        return unexpected(error{error_code::invalid_configuration, "api_version is empty"});
    }
    if (request_timeout.count() <= 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "request_timeout must be positive"});
    }
    if (download_timeout.count() <= 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "download_timeout must be positive"});
    }
    return multipart.validate();
}

}  // namespace kcenon::blob
