#include "reconnect_supervisor.h"
#include "config_manager.h"
#include "logger.h"
#include "telemetry.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace tvlink {

namespace {
double random_unit() {
    static thread_local std::mt19937 engine(std::random_device{}());
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine);
}
} // namespace

BackoffPolicy BackoffPolicy::from_config() {
    const auto& config = ConfigManager::getInstance();
    BackoffPolicy policy;
    policy.initial_delay = std::chrono::milliseconds(config.getReconnectInitialDelayMs());
    policy.base_seconds = config.getReconnectBaseSeconds();
    policy.factor = config.getReconnectFactor();
    policy.cap_seconds = config.getReconnectCapSeconds();
    policy.jitter_seconds = config.getReconnectJitterSeconds();
    policy.max_exponent = config.getReconnectMaxExponent();
    return policy;
}

std::chrono::milliseconds BackoffPolicy::delay_for(int attempt, double jitter_fraction) const {
    if (attempt <= 0) {
        return initial_delay;
    }
    const int exponent = std::min(attempt - 1, max_exponent);
    const double backoff = std::min(base_seconds * std::pow(factor, exponent), cap_seconds);
    const double jitter = jitter_seconds * std::min(1.0, std::max(0.0, jitter_fraction));
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround((backoff + jitter) * 1000.0)));
}

ReconnectSupervisor::ReconnectSupervisor(BackoffPolicy policy) : m_policy(policy) {}

ReconnectSupervisor::~ReconnectSupervisor() {
    shutdown();
}

bool ReconnectSupervisor::update_reachability(bool reachable) {
    const bool was_reachable = m_reachable.exchange(reachable);
    if (!reachable) {
        if (was_reachable) {
            LOG_INFO("[Reconnect] Network unreachable, suspending reconnects");
        }
        m_reconnect.cancel();
        return false;
    }
    if (!was_reachable) {
        LOG_INFO("[Reconnect] Network reachable again");
        return true;
    }
    return false;
}

std::chrono::milliseconds ReconnectSupervisor::next_backoff_delay() {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto delay = m_policy.delay_for(m_attempts, m_attempts == 0 ? 0.0 : random_unit());
    ++m_attempts;
    return delay;
}

int ReconnectSupervisor::attempts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_attempts;
}

void ReconnectSupervisor::reset_attempts() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_attempts = 0;
}

void ReconnectSupervisor::schedule(std::chrono::milliseconds delay, ReconnectAction action) {
    LOG_INFO("[Reconnect] Next attempt in " + std::to_string(delay.count()) + "ms");
    m_reconnect.start([delay, action = std::move(action)](CancellationToken token) {
        if (!token.wait_for(delay)) {
            LOG_DEBUG("[Reconnect] Pending attempt cancelled");
            return;
        }
        action(token);
    });
}

void ReconnectSupervisor::cancel_pending() {
    if (m_reconnect.on_worker_thread()) {
        return;
    }
    m_reconnect.cancel();
}

void ReconnectSupervisor::start_keepalive(KeepaliveProbe probe, KeepaliveExhausted on_exhausted) {
    m_keepalive_streak.store(0);
    m_keepalive.start([this, probe = std::move(probe), on_exhausted = std::move(on_exhausted)](CancellationToken token) {
        keepalive_loop(token, probe, on_exhausted);
    });
}

void ReconnectSupervisor::stop_keepalive() {
    m_keepalive.cancel();
    m_keepalive_streak.store(0);
}

void ReconnectSupervisor::keepalive_loop(CancellationToken token, KeepaliveProbe probe,
                                         KeepaliveExhausted on_exhausted) {
    const auto& config = ConfigManager::getInstance();
    const auto interval = std::chrono::milliseconds(config.getKeepaliveIntervalMs());
    const int threshold = std::max(1, config.getKeepaliveFailureThreshold());

    while (token.wait_for(interval)) {
        switch (probe(token)) {
            case KeepaliveOutcome::Idle:
            case KeepaliveOutcome::Healthy:
                m_keepalive_streak.store(0);
                break;
            case KeepaliveOutcome::Skipped:
                break;
            case KeepaliveOutcome::Failed: {
                const int streak = m_keepalive_streak.fetch_add(1) + 1;
                Telemetry::getInstance().inc_counter("session.keepalive_failures");
                LOG_WARN("[Keepalive] Ping failed (" + std::to_string(streak) + "/" + std::to_string(threshold) + ")");
                if (streak >= threshold) {
                    m_keepalive_streak.store(0);
                    on_exhausted();
                }
                break;
            }
        }
    }
}

void ReconnectSupervisor::shutdown() {
    m_reconnect.shutdown();
    m_keepalive.shutdown();
}

} // namespace tvlink
