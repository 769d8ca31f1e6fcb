/**
 * @file progress.h
 * @brief Upload and download progress reporting types
 */

#ifndef KCENON_BLOB_CORE_PROGRESS_H
#define KCENON_BLOB_CORE_PROGRESS_H

#include <cmath>
#include <cstdint>
#include <functional>
#include <optional>

namespace kcenon::blob {

/**
 * @brief Progress snapshot delivered to upload callbacks
 *
 * `total` is 0 when the body length cannot be determined ahead of time;
 * `percentage` is then 0 until the final 100% event.
 */
struct upload_progress_event {
    uint64_t loaded = 0;
    uint64_t total = 0;
    double percentage = 0.0;

    [[nodiscard]] auto operator==(const upload_progress_event& other) const -> bool = default;
};

/**
 * @brief Percentage of loaded over total, rounded to two decimals
 */
[[nodiscard]] inline auto compute_percentage(uint64_t loaded, uint64_t total) -> double {
    if (total == 0) return 0.0;
    double pct = static_cast<double>(loaded) / static_cast<double>(total) * 100.0;
    if (pct > 100.0) pct = 100.0;
    return std::round(pct * 100.0) / 100.0;
}

[[nodiscard]] inline auto make_progress_event(uint64_t loaded, uint64_t total)
    -> upload_progress_event {
    return upload_progress_event{loaded, total, compute_percentage(loaded, total)};
}

/**
 * @brief Callback receiving upload progress
 */
using upload_progress_callback = std::function<void(const upload_progress_event&)>;

/**
 * @brief Callback receiving download progress (bytes written, expected size if known)
 */
using download_progress_callback =
    std::function<void(uint64_t loaded, std::optional<uint64_t> total)>;

}  // namespace kcenon::blob

#endif  // KCENON_BLOB_CORE_PROGRESS_H
