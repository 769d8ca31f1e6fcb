/**
 * @file telemetry_sink.cpp
 * @brief Telemetry delivery
 */

#include <kcenon/blob/telemetry/telemetry_sink.h>

#include <kcenon/blob/core/logging.h>

#include <exception>
#include <sstream>

namespace kcenon::blob {

void logging_telemetry_sink::record(const telemetry_event& event) {
    std::ostringstream oss;
    oss << "{\"event\":\"" << detail::escape_json_string(event.name) << "\"";
    for (const auto& [key, value] : event.attributes) {
        oss << ",\"" << detail::escape_json_string(key) << "\":\""
            << detail::escape_json_string(value) << "\"";
    }
    oss << "}";
    BLOB_LOG_INFO(log_category::telemetry, oss.str());
}

void emit_telemetry(telemetry_sink* sink, const telemetry_event& event) noexcept {
    if (sink == nullptr) {
        return;
    }
    try {
        sink->record(event);
    } catch (const std::exception& e) {
        try {
            BLOB_LOG_DEBUG(log_category::telemetry,
                           "telemetry event " + event.name + " dropped: " + e.what());
        } catch (const std::exception&) {
            // Logging itself failed; the event is already lost
        }
    }
}

}  // namespace kcenon::blob
