/**
 * @file telemetry_sink.h
 * @brief Fire-and-forget usage events
 */

#ifndef KCENON_BLOB_TELEMETRY_TELEMETRY_SINK_H
#define KCENON_BLOB_TELEMETRY_TELEMETRY_SINK_H

#include <map>
#include <memory>
#include <string>

namespace kcenon::blob {

/**
 * @brief One usage event, e.g. "blob_put" with its attributes
 *
 * Attributes never carry the token.
 */
struct telemetry_event {
    std::string name;
    std::map<std::string, std::string> attributes;
};

/**
 * @brief Receives usage events
 *
 * record() is called on the thread that finished the operation and must not
 * block. A sink that throws is logged and otherwise ignored.
 */
class telemetry_sink {
public:
    virtual ~telemetry_sink() = default;

    virtual void record(const telemetry_event& event) = 0;
};

/**
 * @brief Discards every event
 */
class null_telemetry_sink : public telemetry_sink {
public:
    void record(const telemetry_event&) override {}
};

/**
 * @brief Writes events to the blob logger under the telemetry category
 */
class logging_telemetry_sink : public telemetry_sink {
public:
    void record(const telemetry_event& event) override;
};

/**
 * @brief Deliver an event; failures of the sink never reach the caller
 * @param sink May be null
 */
void emit_telemetry(telemetry_sink* sink, const telemetry_event& event) noexcept;

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_TELEMETRY_TELEMETRY_SINK_H
