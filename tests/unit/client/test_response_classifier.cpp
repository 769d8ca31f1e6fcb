/**
 * @file test_response_classifier.cpp
 * @brief Unit tests for service error mapping and response decoding
 */

#include <gtest/gtest.h>

#include <kcenon/blob/client/response_classifier.h>

#include <string>

namespace kcenon::blob::test {

namespace {

auto make_response(int status, const std::string& body,
                   const std::string& content_type = "application/json") -> http_response {
    http_response response;
    response.status_code = status;
    response.body = to_bytes(body);
    if (!content_type.empty()) {
        response.headers["content-type"] = content_type;
    }
    return response;
}

}  // namespace

TEST(ResponseClassifierTest, ServiceCodesMapToKinds) {
    EXPECT_EQ(map_service_code("forbidden"), error_code::access_denied);
    EXPECT_EQ(map_service_code("not_found"), error_code::not_found);
    EXPECT_EQ(map_service_code("store_not_found"), error_code::store_not_found);
    EXPECT_EQ(map_service_code("store_suspended"), error_code::store_suspended);
    EXPECT_EQ(map_service_code("content_type_not_allowed"), error_code::content_type_not_allowed);
    EXPECT_EQ(map_service_code("client_token_pathname_mismatch"), error_code::pathname_mismatch);
    EXPECT_EQ(map_service_code("client_token_expired"), error_code::token_expired);
    EXPECT_EQ(map_service_code("file_too_large"), error_code::file_too_large);
    EXPECT_EQ(map_service_code("rate_limited"), error_code::rate_limited);
    EXPECT_EQ(map_service_code("service_unavailable"), error_code::service_unavailable);
    EXPECT_EQ(map_service_code("internal_server_error"), error_code::internal_server_error);
    EXPECT_EQ(map_service_code("bad_request"), error_code::bad_request);
    EXPECT_EQ(map_service_code("something_new"), error_code::unknown_error);
}

TEST(ResponseClassifierTest, StatusFallback) {
    EXPECT_EQ(map_http_status(400), error_code::bad_request);
    EXPECT_EQ(map_http_status(403), error_code::access_denied);
    EXPECT_EQ(map_http_status(404), error_code::not_found);
    EXPECT_EQ(map_http_status(429), error_code::rate_limited);
    EXPECT_EQ(map_http_status(500), error_code::internal_server_error);
    EXPECT_EQ(map_http_status(503), error_code::service_unavailable);
    EXPECT_EQ(map_http_status(418), error_code::unknown_error);
}

TEST(ResponseClassifierTest, BodyCodeWinsOverStatus) {
    auto err = classify_response(make_response(
        400, R"({"error":{"code":"client_token_expired","message":"token expired"}})"));
    EXPECT_EQ(err.code, error_code::token_expired);
    EXPECT_EQ(err.message, "token expired");
}

TEST(ResponseClassifierTest, MessageIsNotSniffed) {
    auto err = classify_response(make_response(
        400, R"({"error":{"code":"bad_request","message":"Content type mismatch"}})"));
    EXPECT_EQ(err.code, error_code::bad_request);
}

TEST(ResponseClassifierTest, EmptyBodyUsesStatus) {
    auto err = classify_response(make_response(404, "", ""));
    EXPECT_EQ(err.code, error_code::not_found);
    EXPECT_EQ(err.message, "blob not found (HTTP 404)");
}

TEST(ResponseClassifierTest, RetryAfterOnlyForRateLimit) {
    auto limited = make_response(429, "");
    limited.headers["retry-after"] = "5";
    auto err = classify_response(limited);
    EXPECT_EQ(err.code, error_code::rate_limited);
    ASSERT_TRUE(err.retry_after_seconds.has_value());
    EXPECT_EQ(*err.retry_after_seconds, 5u);

    auto unavailable = make_response(503, "");
    unavailable.headers["retry-after"] = "5";
    EXPECT_FALSE(classify_response(unavailable).retry_after_seconds.has_value());
}

TEST(ResponseClassifierTest, RetryAfterParsing) {
    EXPECT_EQ(parse_retry_after(std::string("30")).value_or(0), 30u);
    EXPECT_FALSE(parse_retry_after(std::string("soon")).has_value());
    EXPECT_FALSE(parse_retry_after(std::string("")).has_value());
    EXPECT_FALSE(parse_retry_after(std::nullopt).has_value());
}

TEST(ResponseClassifierTest, JsonDecodingRequiresJsonMediaType) {
    auto ok = decode_json_response(make_response(200, R"({"a":1})", "application/json"));
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value()["a"].asInt(), 1);

    auto html = decode_json_response(make_response(200, "<html/>", "text/html"));
    ASSERT_FALSE(html);
    EXPECT_EQ(html.error().code, error_code::unexpected_content_type);

    auto broken = decode_json_response(make_response(200, "{oops", "application/json"));
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().code, error_code::invalid_response_json);
}

TEST(ResponseClassifierTest, AnyDecodingFallsBackToText) {
    EXPECT_EQ(decode_any_response(make_response(200, "plain", "")).asString(), "plain");
    EXPECT_TRUE(decode_any_response(make_response(200, R"({"x":true})", "")).isObject());
}

TEST(ResponseClassifierTest, WriteJsonIsCompact) {
    Json::Value value(Json::objectValue);
    value["partNumber"] = 1;
    EXPECT_EQ(write_json(value), R"({"partNumber":1})");
}

}  // namespace kcenon::blob::test
