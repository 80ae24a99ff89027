#include "rate_limiter.h"
#include "config_manager.h"
#include "logger.h"

namespace tvlink {

std::chrono::milliseconds RateLimiter::min_interval(const std::string& command_class) {
    return std::chrono::milliseconds(ConfigManager::getInstance().getRateLimitMs(command_class));
}

std::chrono::milliseconds RateLimiter::required_wait(const Command& command) const {
    const std::string key = rate_limit_key(command);
    const auto interval = min_interval(rate_limit_class(command));

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_last_sent.find(key);
    if (it == m_last_sent.end()) {
        return std::chrono::milliseconds(0);
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - it->second);
    return elapsed >= interval ? std::chrono::milliseconds(0) : interval - elapsed;
}

std::chrono::milliseconds RateLimiter::wait(const Command& command, CancellationToken token) {
    const auto delay = required_wait(command);
    if (delay.count() > 0) {
        LOG_DEBUG("[Session] Rate limit " + rate_limit_key(command) + " waiting " + std::to_string(delay.count()) + "ms");
        if (!token.wait_for(delay)) {
            token.throw_if_cancelled();
        }
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last_sent[rate_limit_key(command)] = Clock::now();
    return delay;
}

std::optional<RateLimiter::Clock::time_point> RateLimiter::last_sent(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_last_sent.find(key);
    if (it == m_last_sent.end()) {
        return std::nullopt;
    }
    return it->second;
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last_sent.clear();
}

} // namespace tvlink
