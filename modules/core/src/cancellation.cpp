#include "cancellation.h"
#include "logger.h"
#include "tvlink_error.h"

#include <thread>

namespace tvlink {

bool CancellationToken::is_cancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return true;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return !state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw TvLinkError(ErrorCode::Cancelled);
    }
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {}

void CancellationSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationSource::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

TaskSlot::~TaskSlot() {
    shutdown();
}

void TaskSlot::start(Work work) {
    auto worker = std::make_unique<Worker>();
    CancellationToken token = worker->source.token();
    auto done = worker->done;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current) {
        m_current->source.cancel();
        m_retired.push_back(std::move(m_current));
    }
    reap_locked();
    worker->thread = std::thread([work = std::move(work), token, done] {
        try {
            work(token);
        } catch (const TvLinkError& e) {
            if (e.code() == ErrorCode::Cancelled) {
                LOG_DEBUG("[Task] Worker cancelled");
            } else {
                LOG_WARN("[Task] Worker ended with error: " + std::string(e.what()));
            }
        } catch (const std::exception& e) {
            LOG_WARN("[Task] Worker ended with exception: " + std::string(e.what()));
        }
        done->store(true);
    });
    m_current = std::move(worker);
}

void TaskSlot::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current) {
        m_current->source.cancel();
        m_retired.push_back(std::move(m_current));
    }
    reap_locked();
}

void TaskSlot::shutdown() {
    std::vector<std::unique_ptr<Worker>> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_current) {
            m_retired.push_back(std::move(m_current));
        }
        workers.swap(m_retired);
    }
    for (auto& worker : workers) {
        worker->source.cancel();
    }
    for (auto& worker : workers) {
        if (!worker->thread.joinable()) {
            continue;
        }
        if (worker->thread.get_id() == std::this_thread::get_id()) {
            worker->thread.detach();
        } else {
            worker->thread.join();
        }
    }
}

bool TaskSlot::is_running() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current && !m_current->done->load();
}

bool TaskSlot::on_worker_thread() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current && m_current->thread.get_id() == std::this_thread::get_id();
}

void TaskSlot::reap_locked() {
    for (auto it = m_retired.begin(); it != m_retired.end();) {
        auto& worker = *it;
        if (worker->done->load() && worker->thread.get_id() != std::this_thread::get_id()) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
            it = m_retired.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace tvlink
