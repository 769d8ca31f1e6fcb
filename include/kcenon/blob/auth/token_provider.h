/**
 * @file token_provider.h
 * @brief Bearer token sources
 */

#ifndef KCENON_BLOB_AUTH_TOKEN_PROVIDER_H
#define KCENON_BLOB_AUTH_TOKEN_PROVIDER_H

#include <kcenon/blob/core/types.h>

#include <memory>
#include <string>

namespace kcenon::blob {

/**
 * @brief Supplies the read-write token sent as the bearer credential
 *
 * get_token() is called once per logical operation, before any network
 * traffic. Implementations must be safe to call from several threads.
 */
class token_provider {
public:
    virtual ~token_provider() = default;

    /**
     * @brief Current token
     * @return error_code::no_token_provided when none is available
     */
    [[nodiscard]] virtual auto get_token() const -> result<std::string> = 0;
};

/**
 * @brief Fixed token given at construction
 */
class static_token_provider : public token_provider {
public:
    explicit static_token_provider(std::string token);

    [[nodiscard]] auto get_token() const -> result<std::string> override;

private:
    std::string token_;
};

/**
 * @brief Reads BLOB_READ_WRITE_TOKEN, then VERCEL_BLOB_READ_WRITE_TOKEN
 *
 * The environment is consulted on every call.
 */
class environment_token_provider : public token_provider {
public:
    [[nodiscard]] auto get_token() const -> result<std::string> override;
};

/**
 * @brief Provider for an explicit token, or the environment when it is empty
 */
[[nodiscard]] auto make_token_provider(const std::string& token = {})
    -> std::shared_ptr<token_provider>;

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_AUTH_TOKEN_PROVIDER_H
