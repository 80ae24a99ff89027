#ifndef TVLINK_RATE_LIMITER_H
#define TVLINK_RATE_LIMITER_H

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "cancellation.h"
#include "command.h"

namespace tvlink {

// Minimum spacing between two sends of the same command key. Intervals come
// from the rate_limits config section, by command class.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    // Suspends for max(0, interval - elapsed) then stamps the key.
    // Returns the time actually waited. Throws TvLinkError(Cancelled).
    std::chrono::milliseconds wait(const Command& command, CancellationToken token = CancellationToken());

    std::chrono::milliseconds required_wait(const Command& command) const;
    std::optional<Clock::time_point> last_sent(const std::string& key) const;

    static std::chrono::milliseconds min_interval(const std::string& command_class);

    void reset();

private:
    mutable std::mutex m_mutex;
    std::map<std::string, Clock::time_point> m_last_sent;
};

} // namespace tvlink

#endif // TVLINK_RATE_LIMITER_H
