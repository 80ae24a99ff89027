#include "latency_tracker.h"
#include "config_manager.h"

#include <algorithm>
#include <cmath>

namespace tvlink {

LatencyTracker::LatencyTracker(size_t capacity)
    : m_capacity(capacity > 0 ? capacity
                              : static_cast<size_t>(std::max(1, ConfigManager::getInstance().getLatencyWindowSize()))) {}

void LatencyTracker::record(const std::string& command_key, std::chrono::milliseconds latency,
                            bool succeeded, bool timed_out) {
    CommandLatencySample sample;
    sample.command_key = command_key;
    sample.latency_ms = std::max<int64_t>(0, latency.count());
    sample.succeeded = succeeded;
    sample.timed_out = timed_out;
    sample.captured_at = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_samples.push_back(std::move(sample));
    while (m_samples.size() > m_capacity) {
        m_samples.pop_front();
    }
}

int64_t LatencyTracker::percentile(const std::deque<int64_t>& sorted, double p) {
    if (sorted.empty()) {
        return 0;
    }
    const double clamped = std::min(1.0, std::max(0.0, p));
    const auto index = static_cast<size_t>(std::lround(static_cast<double>(sorted.size() - 1) * clamped));
    return sorted[std::min(index, sorted.size() - 1)];
}

LatencyStats LatencyTracker::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    LatencyStats out;
    out.samples = m_samples.size();
    if (m_samples.empty()) {
        return out;
    }

    std::deque<int64_t> values;
    int64_t total = 0;
    for (const auto& sample : m_samples) {
        if (sample.succeeded) ++out.successes;
        if (sample.timed_out) ++out.timeouts;
        values.push_back(sample.latency_ms);
        total += sample.latency_ms;
    }
    std::sort(values.begin(), values.end());

    const auto& last = m_samples.back();
    out.last_command_key = last.command_key;
    out.last_latency_ms = last.latency_ms;
    out.last_succeeded = last.succeeded;
    out.last_timed_out = last.timed_out;
    out.average_ms = std::llround(static_cast<double>(total) / static_cast<double>(values.size()));
    out.p50_ms = percentile(values, 0.50);
    out.p95_ms = percentile(values, 0.95);
    return out;
}

void LatencyTracker::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_samples.clear();
}

void to_json(nlohmann::json& j, const LatencyStats& stats) {
    j = nlohmann::json{
        {"samples", stats.samples},
        {"successes", stats.successes},
        {"timeouts", stats.timeouts},
    };
    auto put = [&j](const char* key, const auto& value) {
        j[key] = value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    };
    put("lastCommand", stats.last_command_key);
    put("lastLatencyMs", stats.last_latency_ms);
    put("lastSucceeded", stats.last_succeeded);
    put("lastTimedOut", stats.last_timed_out);
    put("averageMs", stats.average_ms);
    put("p50Ms", stats.p50_ms);
    put("p95Ms", stats.p95_ms);
}

} // namespace tvlink
