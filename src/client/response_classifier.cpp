/**
 * @file response_classifier.cpp
 * @brief Service error mapping and JSON decoding
 */

#include <kcenon/blob/client/response_classifier.h>

#include <kcenon/blob/core/blob_utils.h>

#include <charconv>
#include <memory>
#include <unordered_map>

namespace kcenon::blob {

auto map_service_code(std::string_view code) -> error_code {
    static const std::unordered_map<std::string_view, error_code> codes = {
        {"forbidden", error_code::access_denied},
        {"not_found", error_code::not_found},
        {"store_not_found", error_code::store_not_found},
        {"store_suspended", error_code::store_suspended},
        {"content_type_not_allowed", error_code::content_type_not_allowed},
        {"client_token_pathname_mismatch", error_code::pathname_mismatch},
        {"client_token_expired", error_code::token_expired},
        {"file_too_large", error_code::file_too_large},
        {"rate_limited", error_code::rate_limited},
        {"service_unavailable", error_code::service_unavailable},
        {"internal_server_error", error_code::internal_server_error},
        {"bad_request", error_code::bad_request},
    };

    auto it = codes.find(code);
    return it != codes.end() ? it->second : error_code::unknown_error;
}

auto map_http_status(int status_code) -> error_code {
    switch (status_code) {
        case 400: return error_code::bad_request;
        case 403: return error_code::access_denied;
        case 404: return error_code::not_found;
        case 429: return error_code::rate_limited;
        case 500: return error_code::internal_server_error;
        case 503: return error_code::service_unavailable;
        default: return error_code::unknown_error;
    }
}

auto parse_retry_after(const std::optional<std::string>& value) -> std::optional<uint32_t> {
    if (!value || value->empty()) {
        return std::nullopt;
    }
    uint32_t seconds = 0;
    const auto* first = value->data();
    const auto* last = value->data() + value->size();
    auto [ptr, ec] = std::from_chars(first, last, seconds);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return seconds;
}

auto classify_response(const http_response& response) -> error {
    std::string service_code;
    std::string message;

    if (auto parsed = parse_json(response.get_body_string()); parsed) {
        const auto& body = parsed.value();
        if (body.isObject() && body.isMember("error") && body["error"].isObject()) {
            const auto& err = body["error"];
            if (err.isMember("code") && err["code"].isString()) {
                service_code = err["code"].asString();
            }
            if (err.isMember("message") && err["message"].isString()) {
                message = err["message"].asString();
            }
        }
    }

    auto code = service_code.empty() ? map_http_status(response.status_code)
                                     : map_service_code(service_code);

    if (message.empty()) {
        message = std::string(to_string(code)) + " (HTTP " +
                  std::to_string(response.status_code) + ")";
    }

    if (code == error_code::rate_limited) {
        return error{code, std::move(message), parse_retry_after(response.get_header("retry-after"))};
    }
    return error{code, std::move(message)};
}

auto parse_json(std::string_view text) -> result<Json::Value> {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return unexpected(error{error_code::invalid_response_json,
                                "invalid JSON in response: " + errors});
    }
    return root;
}

auto write_json(const Json::Value& value) -> std::string {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

auto decode_json_response(const http_response& response) -> result<Json::Value> {
    auto content_type = response.get_header("content-type").value_or("");
    if (!blob_utils::is_json_content_type(content_type)) {
        return unexpected(error{error_code::unexpected_content_type,
                                content_type.empty()
                                    ? std::string("response has no content type")
                                    : "unexpected response content type: " + content_type});
    }
    return parse_json(response.get_body_string());
}

auto decode_any_response(const http_response& response) -> Json::Value {
    auto text = response.get_body_string();
    if (auto parsed = parse_json(text); parsed) {
        return parsed.value();
    }
    return Json::Value(text);
}

}  // namespace kcenon::blob
