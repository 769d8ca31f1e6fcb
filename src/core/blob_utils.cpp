/**
 * @file blob_utils.cpp
 * @brief Common helpers for building and decoding blob API calls
 */

#include <kcenon/blob/core/blob_utils.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <locale>
#include <random>
#include <sstream>

namespace kcenon::blob::blob_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

auto url_encode(std::string_view value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto build_query_string(const std::vector<std::pair<std::string, std::string>>& params)
    -> std::string {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += url_encode(key);
        query += '=';
        query += url_encode(value);
    }
    return query;
}

auto set_query_param(const std::string& url, const std::string& key, const std::string& value)
    -> std::string {
    std::string base = url;
    std::string fragment;
    if (auto hash = base.find('#'); hash != std::string::npos) {
        fragment = base.substr(hash);
        base.erase(hash);
    }

    std::string path = base;
    std::string query;
    if (auto q = base.find('?'); q != std::string::npos) {
        path = base.substr(0, q);
        query = base.substr(q + 1);
    }

    std::string kept;
    std::istringstream parts(query);
    std::string part;
    while (std::getline(parts, part, '&')) {
        if (part.empty()) continue;
        auto name = part.substr(0, part.find('='));
        if (name == url_encode(key)) continue;
        if (!kept.empty()) kept += '&';
        kept += part;
    }

    if (!kept.empty()) kept += '&';
    kept += url_encode(key) + "=" + url_encode(value);

    return path + "?" + kept + fragment;
}

auto to_lower(std::string_view value) -> std::string {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

// ============================================================================
// Identifier Utilities
// ============================================================================

auto generate_random_hex(std::size_t byte_count) -> std::string {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dis(0, 255);

    std::ostringstream oss;
    for (std::size_t i = 0; i < byte_count; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << dis(gen);
    }
    return oss.str();
}

auto get_unix_timestamp_ms() -> int64_t {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

auto extract_store_id(std::string_view token) -> std::string {
    std::size_t segment = 0;
    std::size_t start = 0;
    while (start <= token.size()) {
        auto end = token.find('_', start);
        if (end == std::string_view::npos) {
            end = token.size();
        }
        if (segment == 3) {
            return std::string(token.substr(start, end - start));
        }
        if (end == token.size()) {
            break;
        }
        ++segment;
        start = end + 1;
    }
    return {};
}

auto make_request_id(std::string_view store_id) -> std::string {
    std::ostringstream oss;
    oss << store_id << ':' << get_unix_timestamp_ms() << ':' << generate_random_hex(4);
    return oss.str();
}

// ============================================================================
// Time Utilities
// ============================================================================

namespace {

auto utc_to_time_t(std::tm* tm) -> std::time_t {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

}  // namespace

auto parse_timestamp(std::string_view value)
    -> std::optional<std::chrono::system_clock::time_point> {
    if (value.empty()) {
        return std::nullopt;
    }

    std::tm tm = {};
    std::istringstream ss{std::string(value)};
    ss.imbue(std::locale::classic());
    long offset_seconds = 0;

    if (value.find(',') != std::string_view::npos) {
        ss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
        if (ss.fail()) {
            return std::nullopt;
        }
    } else {
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            return std::nullopt;
        }
        if (ss.peek() == '.') {
            ss.get();
            while (std::isdigit(ss.peek())) {
                ss.get();
            }
        }
        auto zone = ss.get();
        if (zone == '+' || zone == '-') {
            int hours = 0;
            int minutes = 0;
            char colon = 0;
            ss >> hours >> colon >> minutes;
            if (ss.fail() || colon != ':') {
                return std::nullopt;
            }
            offset_seconds = (zone == '+' ? 1 : -1) * (hours * 3600L + minutes * 60L);
        } else if (zone != 'Z' && zone != std::char_traits<char>::eof()) {
            return std::nullopt;
        }
    }

    auto seconds = utc_to_time_t(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds - offset_seconds);
}

// ============================================================================
// Validation Utilities
// ============================================================================

auto validate_pathname(std::string_view pathname) -> result<void> {
    if (pathname.empty()) {
        return unexpected(error{error_code::invalid_argument, "pathname is required"});
    }
    if (pathname.size() > max_pathname_length) {
        return unexpected(error{error_code::invalid_argument,
                                "pathname is too long, maximum length is 950"});
    }
    if (pathname.find("//") != std::string_view::npos) {
        return unexpected(error{error_code::invalid_argument,
                                "pathname cannot contain \"//\", please encode it if needed"});
    }
    return {};
}

auto is_json_content_type(std::string_view content_type) -> bool {
    auto media = content_type.substr(0, content_type.find(';'));
    while (!media.empty() && std::isspace(static_cast<unsigned char>(media.front()))) {
        media.remove_prefix(1);
    }
    while (!media.empty() && std::isspace(static_cast<unsigned char>(media.back()))) {
        media.remove_suffix(1);
    }
    auto lowered = to_lower(media);
    constexpr std::string_view json_suffix = "+json";
    return lowered == "application/json" ||
           (lowered.size() >= json_suffix.size() &&
            lowered.compare(lowered.size() - json_suffix.size(), json_suffix.size(),
                            json_suffix) == 0);
}

auto is_url(std::string_view value) -> bool {
    return value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0;
}

}  // namespace kcenon::blob::blob_utils
