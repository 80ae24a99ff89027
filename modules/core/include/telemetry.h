#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace tvlink {

// Local-only telemetry (no network export).
// - Counters: monotonically increasing
// - Gauges: last-set values
// - Histograms: count/sum/min/max in milliseconds
class Telemetry final {
public:
    struct Config {
        bool enabled = true;
        bool log_json = true;
        int flush_interval_ms = 30000;
    };

    static Telemetry& getInstance();

    void initialize(const std::string& client_id, const Config& cfg);
    bool is_enabled() const { return m_enabled.load(std::memory_order_acquire); }

    // Flushes to the log when the interval elapsed.
    void tick();
    void flush(const std::string& reason);

    nlohmann::json snapshot(const std::string& reason = "snapshot");
    std::string snapshot_json(const std::string& reason = "snapshot");

    void inc_counter(const std::string& name, int64_t delta = 1);
    void set_gauge(const std::string& name, int64_t value);
    void observe_hist_ms(const std::string& name, int64_t ms);

    int64_t counter_value(const std::string& name);

    // Zeroes every metric; used between test cases.
    void clear();

private:
    Telemetry() = default;
    ~Telemetry() = default;
    Telemetry(const Telemetry&) = delete;
    Telemetry& operator=(const Telemetry&) = delete;

    struct Counter { std::atomic<int64_t> v{0}; };
    struct Gauge { std::atomic<int64_t> v{0}; };
    struct Hist {
        std::atomic<int64_t> count{0};
        std::atomic<int64_t> sum{0};
        std::atomic<int64_t> min{INT64_MAX};
        std::atomic<int64_t> max{INT64_MIN};
    };

    Counter* get_or_create_counter_(const std::string& name);
    Gauge* get_or_create_gauge_(const std::string& name);
    Hist* get_or_create_hist_(const std::string& name);

    std::atomic<bool> m_enabled{true};
    std::atomic<bool> m_log_json{true};
    std::atomic<int> m_flush_interval_ms{30000};
    std::atomic<int64_t> m_start_ms{0};
    std::atomic<int64_t> m_last_flush_ms{0};

    mutable std::mutex m_mu;
    std::string m_client_id;

    // std::unordered_map keeps element addresses stable across rehash.
    std::unordered_map<std::string, Counter> m_counters;
    std::unordered_map<std::string, Gauge> m_gauges;
    std::unordered_map<std::string, Hist> m_hists;
};

} // namespace tvlink
