#ifndef TVLINK_LATENCY_TRACKER_H
#define TVLINK_LATENCY_TRACKER_H

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "device.h"

namespace tvlink {

struct CommandLatencySample {
    std::string command_key;
    int64_t latency_ms = 0;
    bool succeeded = false;
    bool timed_out = false;
    SystemTime captured_at;
};

struct LatencyStats {
    size_t samples = 0;
    size_t successes = 0;
    size_t timeouts = 0;
    std::optional<std::string> last_command_key;
    std::optional<int64_t> last_latency_ms;
    std::optional<bool> last_succeeded;
    std::optional<bool> last_timed_out;
    std::optional<int64_t> average_ms;
    std::optional<int64_t> p50_ms;
    std::optional<int64_t> p95_ms;
};

void to_json(nlohmann::json& j, const LatencyStats& stats);

// Bounded ring of recent command latencies; diagnostics only.
class LatencyTracker {
public:
    explicit LatencyTracker(size_t capacity = 0);  // 0 = session.latency_window from config

    void record(const std::string& command_key, std::chrono::milliseconds latency,
                bool succeeded, bool timed_out);
    LatencyStats stats() const;
    size_t capacity() const { return m_capacity; }
    void clear();

    // Nearest-rank on a sorted sample: index round((n - 1) * p).
    static int64_t percentile(const std::deque<int64_t>& sorted, double p);

private:
    size_t m_capacity;
    mutable std::mutex m_mutex;
    std::deque<CommandLatencySample> m_samples;
};

} // namespace tvlink

#endif // TVLINK_LATENCY_TRACKER_H
