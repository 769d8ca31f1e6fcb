// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <kcenon/blob/config/feature_flags.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#if BLOB_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::blob {

/**
 * @brief Log categories for the blob upload system
 */
struct log_category {
    static constexpr std::string_view client = "blob.client";
    static constexpr std::string_view request = "blob.request";
    static constexpr std::string_view transport = "blob.transport";
    static constexpr std::string_view multipart = "blob.multipart";
    static constexpr std::string_view scheduler = "blob.scheduler";
    static constexpr std::string_view telemetry = "blob.telemetry";
    static constexpr std::string_view file = "blob.file";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief What the masker hides
 *
 * Bearer tokens are masked by default; upload ids are masked only on request
 * since they are needed when debugging a session.
 */
struct masking_config {
    bool mask_tokens = true;
    bool mask_upload_ids = false;
    size_t visible_chars = 4;

    static masking_config all_masked() { return {true, true, 4}; }
    static masking_config none() { return {false, false, 4}; }
};

/**
 * @brief Masks credentials and session identifiers in log output
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(config) {}

    /**
     * @brief Mask bearer tokens and raw read-write tokens in free text
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_tokens) {
            return input;
        }

        static const std::regex token_pattern(
            R"((Bearer\s+|vercel_blob_rw_)([A-Za-z0-9_\-.]+))");

        std::string result;
        size_t last_pos = 0;
        for (std::sregex_iterator it(input.begin(), input.end(), token_pattern), end; it != end;
             ++it) {
            const auto& match = *it;
            result += input.substr(last_pos, match.position() - last_pos);
            result += match[1].str();
            result += mask_value(match[2].str());
            last_pos = match.position() + match.length();
        }
        result += input.substr(last_pos);
        return result;
    }

    [[nodiscard]] auto mask_value(const std::string& value) const -> std::string {
        if (value.size() <= config_.visible_chars) {
            return std::string(value.size(), '*');
        }
        return value.substr(0, config_.visible_chars) +
               std::string(value.size() - config_.visible_chars, '*');
    }

    [[nodiscard]] auto mask_upload_id(const std::string& id) const -> std::string {
        if (!config_.mask_upload_ids || id.empty()) {
            return id;
        }
        return mask_value(id);
    }

private:
    masking_config config_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

// ISO 8601 UTC for JSON entries, local wall time for stderr lines
inline auto timestamp(bool utc) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#if defined(_WIN32)
    if (utc) {
        gmtime_s(&tm_buf, &time_t_val);
    } else {
        localtime_s(&tm_buf, &time_t_val);
    }
#else
    if (utc) {
        gmtime_r(&time_t_val, &tm_buf);
    } else {
        localtime_r(&time_t_val, &tm_buf);
    }
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    if (utc) {
        oss << 'Z';
    }
    return oss.str();
}

}  // namespace detail

/**
 * @brief Structured log context for blob requests and uploads
 */
struct transfer_log_context {
    std::string request_id;
    std::string pathname;
    std::optional<std::string> upload_id;
    std::optional<uint32_t> part_number;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> bytes;
    std::optional<uint64_t> total_bytes;
    std::optional<int> status_code;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    /**
     * @brief Render set fields as a JSON object, masked when masker is given
     */
    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!request_id.empty()) add_field("request_id", request_id);
        if (!pathname.empty()) add_field("pathname", pathname);
        if (upload_id) {
            add_field("upload_id", masker ? masker->mask_upload_id(*upload_id) : *upload_id);
        }
        if (part_number) add_int("part_number", *part_number);
        if (attempt) add_int("attempt", *attempt);
        if (bytes) add_int("bytes", static_cast<int64_t>(*bytes));
        if (total_bytes) add_int("total_bytes", static_cast<int64_t>(*total_bytes));
        if (status_code) add_int("status_code", *status_code);
        if (duration_ms) add_int("duration_ms", static_cast<int64_t>(*duration_ms));
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief One log line in JSON output mode
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;

    [[nodiscard]] auto to_json(const sensitive_info_masker& masker) const -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json_string(masker.mask(message)) << "\"";

        if (context) {
            std::string ctx_json = context->to_json(&masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        oss << "}";
        return oss.str();
    }
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Blob upload system logger
 *
 * Routes to logger_system when it is linked and initialize() has run;
 * writes to stderr otherwise. Tokens are masked in every output.
 */
class blob_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    blob_logger() = default;

    blob_logger(const blob_logger&) = delete;
    blob_logger& operator=(const blob_logger&) = delete;

    /**
     * @brief Start the logger_system backend
     *
     * Safe to call multiple times. Called when a blob_client is created.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if BLOB_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            std::lock_guard<std::mutex> lock(config_mutex_);
            logger_ = std::move(result.value());
        }
#endif
    }

    void set_level(log_level level) {
        min_level_.store(level);
#if BLOB_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(config_mutex_);
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    /**
     * @brief Observe every enabled message before it is written
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Observe every entry written in JSON mode, already masked
     */
    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
        }

        std::string text;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = detail::timestamp(true);
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) {
                entry.context = *context;
            }
            text = entry.to_json(masker_);

            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, text);
            }
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << masker_.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json(&masker_);
            }
            text = oss.str();
        }

        write(level, text, format == log_output_format::text, file, line, function);
    }

private:
    void write(log_level level,
               const std::string& text,
               bool prefixed,
               [[maybe_unused]] const char* file,
               [[maybe_unused]] int line,
               [[maybe_unused]] const char* function) {
#if BLOB_USE_LOGGER_SYSTEM
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            if (logger_) {
                if (file && line > 0 && function) {
                    logger_->log(to_logger_level(level), text, file, line, function);
                } else {
                    logger_->log(to_logger_level(level), text);
                }
                return;
            }
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        if (prefixed) {
            std::cerr << detail::timestamp(false) << " [" << log_level_to_string(level) << "] ";
        }
        std::cerr << text << "\n";
    }

#if BLOB_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};

    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    const sensitive_info_masker masker_;
    std::mutex config_mutex_;
};

inline blob_logger& get_logger() {
    static blob_logger instance;
    return instance;
}

#define BLOB_LOG(level, category, message) \
    kcenon::blob::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define BLOB_LOG_CTX(level, category, message, context) \
    kcenon::blob::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define BLOB_LOG_TRACE(category, message) \
    BLOB_LOG(kcenon::blob::log_level::trace, category, message)

#define BLOB_LOG_DEBUG(category, message) \
    BLOB_LOG(kcenon::blob::log_level::debug, category, message)

#define BLOB_LOG_INFO(category, message) \
    BLOB_LOG(kcenon::blob::log_level::info, category, message)

#define BLOB_LOG_WARN(category, message) \
    BLOB_LOG(kcenon::blob::log_level::warn, category, message)

#define BLOB_LOG_ERROR(category, message) \
    BLOB_LOG(kcenon::blob::log_level::error, category, message)

#define BLOB_LOG_DEBUG_CTX(category, message, ctx) \
    BLOB_LOG_CTX(kcenon::blob::log_level::debug, category, message, ctx)

#define BLOB_LOG_INFO_CTX(category, message, ctx) \
    BLOB_LOG_CTX(kcenon::blob::log_level::info, category, message, ctx)

#define BLOB_LOG_WARN_CTX(category, message, ctx) \
    BLOB_LOG_CTX(kcenon::blob::log_level::warn, category, message, ctx)

#define BLOB_LOG_ERROR_CTX(category, message, ctx) \
    BLOB_LOG_CTX(kcenon::blob::log_level::error, category, message, ctx)

}  // namespace kcenon::blob
