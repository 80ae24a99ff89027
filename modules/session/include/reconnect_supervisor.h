#ifndef TVLINK_RECONNECT_SUPERVISOR_H
#define TVLINK_RECONNECT_SUPERVISOR_H

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>

#include "cancellation.h"

namespace tvlink {

// Exponential backoff with a hard cap and additive jitter.
// Attempt 0 uses the initial delay; attempt n waits
// min(base * factor^min(n-1, max_exponent), cap) + jitter.
struct BackoffPolicy {
    std::chrono::milliseconds initial_delay{50};
    double base_seconds = 0.30;
    double factor = 1.70;
    double cap_seconds = 6.5;
    double jitter_seconds = 0.12;
    int max_exponent = 6;

    static BackoffPolicy from_config();

    // jitter_fraction in [0, 1] scales jitter_seconds.
    std::chrono::milliseconds delay_for(int attempt, double jitter_fraction) const;
};

enum class KeepaliveOutcome {
    Idle,       // nothing connected; resets the failure streak
    Skipped,    // recent traffic already proved liveness
    Healthy,
    Failed
};

/**
 * @brief Reconnect scheduling and the silent keepalive for one session.
 *
 * Holds the attempt counter, the reachability flag and the auto-recovery
 * marker. Reconnect attempts and the keepalive loop each run in their own
 * TaskSlot; the supervisor never calls back into its owner except through the
 * actions handed to it.
 */
class ReconnectSupervisor {
public:
    using ReconnectAction = std::function<void(CancellationToken token)>;
    using KeepaliveProbe = std::function<KeepaliveOutcome(CancellationToken token)>;
    using KeepaliveExhausted = std::function<void()>;

    explicit ReconnectSupervisor(BackoffPolicy policy = BackoffPolicy::from_config());
    ~ReconnectSupervisor();

    ReconnectSupervisor(const ReconnectSupervisor&) = delete;
    ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

    // Returns true on an unreachable -> reachable transition. Going unreachable
    // cancels the pending reconnect.
    bool update_reachability(bool reachable);
    bool is_reachable() const { return m_reachable.load(); }

    // Delay for the current attempt; advances the counter.
    std::chrono::milliseconds next_backoff_delay();
    int attempts() const;
    void reset_attempts();

    // Replaces any pending reconnect. The action runs after `delay` unless cancelled.
    void schedule(std::chrono::milliseconds delay, ReconnectAction action);
    // No-op when called from the reconnect worker itself.
    void cancel_pending();
    bool reconnect_pending() const { return m_reconnect.is_running(); }
    bool on_reconnect_thread() const { return m_reconnect.on_worker_thread(); }

    void start_keepalive(KeepaliveProbe probe, KeepaliveExhausted on_exhausted);
    void stop_keepalive();
    int keepalive_streak() const { return m_keepalive_streak.load(); }
    void reset_keepalive_streak() { m_keepalive_streak.store(0); }

    void mark_next_as_auto_recovery(bool mark) { m_auto_recovery.store(mark); }
    bool next_is_auto_recovery() const { return m_auto_recovery.load(); }
    // Returns the marker and clears it.
    bool take_auto_recovery_mark() { return m_auto_recovery.exchange(false); }

    const BackoffPolicy& policy() const { return m_policy; }

    void shutdown();

private:
    void keepalive_loop(CancellationToken token, KeepaliveProbe probe, KeepaliveExhausted on_exhausted);

    BackoffPolicy m_policy;
    mutable std::mutex m_mutex;
    int m_attempts = 0;
    std::atomic<bool> m_reachable{true};
    std::atomic<bool> m_auto_recovery{false};
    std::atomic<int> m_keepalive_streak{0};

    TaskSlot m_reconnect;
    TaskSlot m_keepalive;
};

} // namespace tvlink

#endif // TVLINK_RECONNECT_SUPERVISOR_H
