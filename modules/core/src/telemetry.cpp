#include "telemetry.h"

#include "logger.h"

#include <chrono>

namespace tvlink {

namespace {
int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

template <typename T>
void atomic_update_min(std::atomic<T>& a, T v) {
    T cur = a.load(std::memory_order_relaxed);
    while (v < cur && !a.compare_exchange_weak(cur, v, std::memory_order_relaxed)) {}
}

template <typename T>
void atomic_update_max(std::atomic<T>& a, T v) {
    T cur = a.load(std::memory_order_relaxed);
    while (v > cur && !a.compare_exchange_weak(cur, v, std::memory_order_relaxed)) {}
}
} // namespace

Telemetry& Telemetry::getInstance() {
    static Telemetry t;
    return t;
}

void Telemetry::initialize(const std::string& client_id, const Config& cfg) {
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_client_id = client_id;
    }
    m_enabled.store(cfg.enabled, std::memory_order_release);
    m_log_json.store(cfg.log_json, std::memory_order_release);
    m_flush_interval_ms.store(cfg.flush_interval_ms, std::memory_order_release);

    const int64_t t = now_ms();
    int64_t expected = 0;
    m_start_ms.compare_exchange_strong(expected, t, std::memory_order_acq_rel);
    expected = 0;
    m_last_flush_ms.compare_exchange_strong(expected, t, std::memory_order_acq_rel);
}

void Telemetry::tick() {
    if (!is_enabled()) return;
    const int64_t t = now_ms();
    int64_t last = m_last_flush_ms.load(std::memory_order_acquire);
    const int interval = m_flush_interval_ms.load(std::memory_order_acquire);
    if (interval <= 0) return;
    if ((t - last) >= interval &&
        m_last_flush_ms.compare_exchange_strong(last, t, std::memory_order_acq_rel)) {
        flush("periodic");
    }
}

void Telemetry::flush(const std::string& reason) {
    if (!is_enabled()) return;
    if (m_log_json.load(std::memory_order_acquire)) {
        LOG_INFO("TELEMETRY " + snapshot_json(reason));
    }
}

Telemetry::Counter* Telemetry::get_or_create_counter_(const std::string& name) {
    std::lock_guard<std::mutex> lk(m_mu);
    return &m_counters[name];
}

Telemetry::Gauge* Telemetry::get_or_create_gauge_(const std::string& name) {
    std::lock_guard<std::mutex> lk(m_mu);
    return &m_gauges[name];
}

Telemetry::Hist* Telemetry::get_or_create_hist_(const std::string& name) {
    std::lock_guard<std::mutex> lk(m_mu);
    return &m_hists[name];
}

void Telemetry::inc_counter(const std::string& name, int64_t delta) {
    if (!is_enabled()) return;
    get_or_create_counter_(name)->v.fetch_add(delta, std::memory_order_relaxed);
}

void Telemetry::set_gauge(const std::string& name, int64_t value) {
    if (!is_enabled()) return;
    get_or_create_gauge_(name)->v.store(value, std::memory_order_relaxed);
}

void Telemetry::observe_hist_ms(const std::string& name, int64_t ms) {
    if (!is_enabled()) return;
    auto* h = get_or_create_hist_(name);
    h->count.fetch_add(1, std::memory_order_relaxed);
    h->sum.fetch_add(ms, std::memory_order_relaxed);
    atomic_update_min(h->min, ms);
    atomic_update_max(h->max, ms);
}

int64_t Telemetry::counter_value(const std::string& name) {
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_counters.find(name);
    return it == m_counters.end() ? 0 : it->second.v.load(std::memory_order_relaxed);
}

void Telemetry::clear() {
    std::lock_guard<std::mutex> lk(m_mu);
    for (auto& kv : m_counters) kv.second.v.store(0, std::memory_order_relaxed);
    for (auto& kv : m_gauges) kv.second.v.store(0, std::memory_order_relaxed);
    for (auto& kv : m_hists) {
        kv.second.count.store(0, std::memory_order_relaxed);
        kv.second.sum.store(0, std::memory_order_relaxed);
        kv.second.min.store(INT64_MAX, std::memory_order_relaxed);
        kv.second.max.store(INT64_MIN, std::memory_order_relaxed);
    }
}

nlohmann::json Telemetry::snapshot(const std::string& reason) {
    const int64_t t = now_ms();
    const int64_t start = m_start_ms.load(std::memory_order_acquire);

    nlohmann::json out;
    out["ts_ms"] = t;
    out["uptime_ms"] = start > 0 ? (t - start) : 0;
    out["reason"] = reason;

    nlohmann::json counters = nlohmann::json::object();
    nlohmann::json gauges = nlohmann::json::object();
    nlohmann::json hists = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lk(m_mu);
        out["client_id"] = m_client_id;
        for (auto& kv : m_counters) {
            counters[kv.first] = kv.second.v.load(std::memory_order_relaxed);
        }
        for (auto& kv : m_gauges) {
            gauges[kv.first] = kv.second.v.load(std::memory_order_relaxed);
        }
        for (auto& kv : m_hists) {
            const int64_t count = kv.second.count.load(std::memory_order_relaxed);
            const int64_t sum = kv.second.sum.load(std::memory_order_relaxed);
            nlohmann::json h;
            h["count"] = count;
            h["sum"] = sum;
            h["min"] = count == 0 ? 0 : kv.second.min.load(std::memory_order_relaxed);
            h["max"] = count == 0 ? 0 : kv.second.max.load(std::memory_order_relaxed);
            h["avg"] = count == 0 ? 0 : sum / count;
            hists[kv.first] = std::move(h);
        }
    }
    out["counters"] = std::move(counters);
    out["gauges"] = std::move(gauges);
    out["hists_ms"] = std::move(hists);
    return out;
}

std::string Telemetry::snapshot_json(const std::string& reason) {
    if (!is_enabled()) return "{}";
    return snapshot(reason).dump();
}

} // namespace tvlink
