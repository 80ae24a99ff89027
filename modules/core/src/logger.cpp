#include "logger.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <random>
#include <sstream>
#include <thread>

namespace tvlink {

namespace {

std::string g_sessionId = "tvlink";
std::mutex g_logMutex;
std::atomic<LogLevel> g_log_level(LogLevel::INFO);
std::function<void(const std::string&)> g_log_callback;

std::atomic<bool> g_async_logging_enabled(false);
std::queue<std::string> g_log_queue;
std::mutex g_log_queue_mutex;
std::condition_variable g_log_queue_cv;
std::atomic<bool> g_log_thread_running(false);
std::unique_ptr<std::thread> g_log_thread;

std::string timestamp_prefix() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

// Caller must hold g_logMutex.
void emit_locked(const std::string& line) {
    if (g_log_callback) {
        g_log_callback(line);
    } else {
        std::cerr << line << std::endl;
    }
}

void async_log_worker() {
    for (;;) {
        std::unique_lock<std::mutex> lock(g_log_queue_mutex);
        g_log_queue_cv.wait(lock, [] { return !g_log_queue.empty() || !g_log_thread_running; });

        if (g_log_queue.empty()) {
            if (!g_log_thread_running) {
                return;
            }
            continue;
        }

        auto msg = std::move(g_log_queue.front());
        g_log_queue.pop();
        lock.unlock();

        std::lock_guard<std::mutex> out_lock(g_logMutex);
        emit_locked(msg);
    }
}

} // namespace

std::string generate_session_id(size_t len) {
    static const char alphanum[] =
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz";
    std::string tmp_s;
    tmp_s.reserve(len);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> distrib(0, sizeof(alphanum) - 2);

    for (size_t i = 0; i < len; ++i) {
        tmp_s += alphanum[distrib(gen)];
    }
    return tmp_s;
}

void setSessionId(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sessionId = session_id;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_callback = std::move(callback);
}

void set_log_level(LogLevel level) {
    g_log_level.store(level);
}

LogLevel get_log_level() {
    return g_log_level.load();
}

LogLevel parse_log_level(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "none" || v == "off") return LogLevel::NONE;
    return LogLevel::INFO;
}

void enable_async_logging() {
    if (g_async_logging_enabled.exchange(true)) return;
    g_log_thread_running = true;
    g_log_thread = std::make_unique<std::thread>(async_log_worker);
}

/**
 * @brief Disables async logging. Messages still queued are written before the worker exits.
 */
void disable_async_logging() {
    if (!g_async_logging_enabled) return;

    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        g_log_thread_running = false;
    }
    g_log_queue_cv.notify_all();

    if (g_log_thread && g_log_thread->joinable()) {
        g_log_thread->join();
    }
    g_log_thread.reset();
    g_async_logging_enabled = false;
}

bool is_async_logging_enabled() {
    return g_async_logging_enabled.load();
}

void nativeLog(const std::string& message) {
    std::string session;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        session = g_sessionId;
    }
    std::string log_message = timestamp_prefix() + " [" + session + "] " + message;

    if (is_async_logging_enabled()) {
        {
            std::lock_guard<std::mutex> lock(g_log_queue_mutex);
            g_log_queue.push(std::move(log_message));
        }
        g_log_queue_cv.notify_one();
    } else {
        std::lock_guard<std::mutex> lock(g_logMutex);
        emit_locked(log_message);
    }
}

} // namespace tvlink
