/**
 * @file transport_interface.cpp
 * @brief Request and response helpers shared by all transports
 */

#include <kcenon/blob/transport/transport_interface.h>

#include <kcenon/blob/core/blob_utils.h>

namespace kcenon::blob {

auto http_request::full_url() const -> std::string {
    if (query.empty()) {
        return url;
    }
    auto separator = url.find('?') == std::string::npos ? '?' : '&';
    return url + separator + blob_utils::build_query_string(query);
}

auto http_response::get_header(const std::string& name) const -> std::optional<std::string> {
    auto it = headers.find(blob_utils::to_lower(name));
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

}  // namespace kcenon::blob
