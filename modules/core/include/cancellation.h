#ifndef TVLINK_CANCELLATION_H
#define TVLINK_CANCELLATION_H

#include <chrono>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace tvlink {

class CancellationSource;

// Copyable view of a cancellation flag. A default-constructed token is never cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const;

    // Sleeps for up to `duration`. Returns false if cancelled before the duration elapsed.
    bool wait_for(std::chrono::milliseconds duration) const;

    // Throws TvLinkError(Cancelled).
    void throw_if_cancelled() const;

private:
    friend class CancellationSource;

    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const { return CancellationToken(state_); }
    void cancel();
    bool is_cancelled() const;

private:
    std::shared_ptr<CancellationToken::State> state_;
};

// One background worker at a time. start() cancels the previous worker without
// waiting for it; retired threads are joined once they finish, or on shutdown().
// A worker may restart or cancel its own slot.
class TaskSlot {
public:
    using Work = std::function<void(CancellationToken token)>;

    TaskSlot() = default;
    ~TaskSlot();

    TaskSlot(const TaskSlot&) = delete;
    TaskSlot& operator=(const TaskSlot&) = delete;

    void start(Work work);
    void cancel();
    // Cancels everything and joins every thread except the calling one.
    void shutdown();

    bool is_running() const;
    bool on_worker_thread() const;

private:
    struct Worker {
        std::thread thread;
        CancellationSource source;
        std::shared_ptr<std::atomic<bool>> done = std::make_shared<std::atomic<bool>>(false);
    };

    void reap_locked();

    mutable std::mutex m_mutex;
    std::unique_ptr<Worker> m_current;
    std::vector<std::unique_ptr<Worker>> m_retired;
};

} // namespace tvlink

#endif // TVLINK_CANCELLATION_H
