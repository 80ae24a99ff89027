/**
 * fake_tv_channel.h - Scripted in-process stand-in for a webOS TV socket.
 *
 * Every channel created by a FakeTv shares its script. Replies are delivered on
 * a per-channel thread, never on the caller's thread, like a real socket.
 */

#ifndef TVLINK_TESTS_FAKE_TV_CHANNEL_H
#define TVLINK_TESTS_FAKE_TV_CHANNEL_H

#include "frame_channel.h"
#include "tvlink_error.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace tvlink {
namespace testing {

using json = nlohmann::json;

class FakeTvChannel;

struct FakeTvScript {
    std::mutex mu;

    // Connection behaviour
    std::set<int> failing_ports;
    std::vector<int> opened_ports;
    int fail_pings_remaining = 0;
    int pings = 0;

    // Registration behaviour
    bool show_prompt = false;
    std::string issued_key = "client-key-1";
    std::set<std::string> rejected_keys;
    std::string registration_error;
    int registrations = 0;
    int unanswered_registrations = 0;           // next registrations never answered
    std::vector<std::optional<std::string>> registration_keys;

    // Request behaviour
    bool manual_replies = false;
    std::map<std::string, json> payloads;          // uri -> response payload
    std::map<std::string, std::string> errors;     // uri -> "error" frame text
    std::map<std::string, int> error_limits;       // uri -> error replies left; absent is unlimited
    std::set<std::string> silent_uris;             // never answered
    std::vector<json> requests;                    // every request envelope, in order
    std::vector<std::string> pointer_frames;

    std::set<FakeTvChannel*> live;

    int count_requests(const std::string& uri) {
        std::lock_guard<std::mutex> lock(mu);
        int n = 0;
        for (const auto& r : requests) {
            if (r.value("uri", std::string()) == uri) {
                ++n;
            }
        }
        return n;
    }
};

class FakeTvChannel : public FrameChannel {
public:
    explicit FakeTvChannel(std::shared_ptr<FakeTvScript> script)
        : m_script(std::move(script)), m_mailbox(std::make_shared<Mailbox>()) {}

    ~FakeTvChannel() override {
        close();
    }

    void open(const Endpoint& endpoint, std::chrono::milliseconds,
              FrameHandler on_frame, CloseHandler on_close) override {
        m_pointer = endpoint.path != "/";
        {
            std::lock_guard<std::mutex> lock(m_script->mu);
            m_script->opened_ports.push_back(endpoint.port);
            if (m_script->failing_ports.count(endpoint.port) != 0) {
                throw TvLinkError(ErrorCode::NetworkFailure, "Connection refused");
            }
        }
        m_on_frame = std::move(on_frame);
        m_on_close = std::move(on_close);
        m_open = true;
        std::shared_ptr<Mailbox> mailbox = m_mailbox;
        m_thread = std::thread([mailbox] { mailbox->run(); });

        std::lock_guard<std::mutex> lock(m_script->mu);
        m_script->live.insert(this);
    }

    void send_text(const std::string& text) override {
        if (!m_open) {
            throw TvLinkError(ErrorCode::NotConnected);
        }
        if (m_pointer) {
            std::lock_guard<std::mutex> lock(m_script->mu);
            m_script->pointer_frames.push_back(text);
            return;
        }
        const json message = json::parse(text);
        const std::string id = message.value("id", std::string());
        const std::string type = message.value("type", std::string());
        if (type == "register") {
            handle_register(id, message);
        } else if (type == "request") {
            handle_request(id, message);
        }
    }

    bool ping(std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(m_script->mu);
        ++m_script->pings;
        if (m_script->fail_pings_remaining > 0) {
            --m_script->fail_pings_remaining;
            return false;
        }
        return m_open;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(m_script->mu);
            m_script->live.erase(this);
        }
        m_open = false;
        m_mailbox->stop();
        if (m_thread.joinable()) {
            if (m_thread.get_id() == std::this_thread::get_id()) {
                m_thread.detach();
            } else {
                m_thread.join();
            }
        }
    }

    bool is_open() const override { return m_open; }

    // Delivers a raw frame to the transport.
    void deliver(const json& frame) {
        FrameHandler handler = m_on_frame;
        const std::string text = frame.dump();
        m_mailbox->post([handler, text] { handler(text); });
    }

    // Simulates the TV closing the socket.
    void drop(const std::string& reason) {
        CloseHandler handler = m_on_close;
        m_open = false;
        m_mailbox->post([handler, reason] { handler(reason); });
    }

    bool is_pointer() const { return m_pointer; }

private:
    struct Mailbox {
        std::mutex mu;
        std::condition_variable cv;
        std::deque<std::function<void()>> tasks;
        bool stopped = false;

        void post(std::function<void()> task) {
            {
                std::lock_guard<std::mutex> lock(mu);
                if (stopped) {
                    return;
                }
                tasks.push_back(std::move(task));
            }
            cv.notify_one();
        }

        void stop() {
            {
                std::lock_guard<std::mutex> lock(mu);
                stopped = true;
                tasks.clear();
            }
            cv.notify_all();
        }

        void run() {
            for (;;) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(mu);
                    cv.wait(lock, [this] { return stopped || !tasks.empty(); });
                    if (stopped) {
                        return;
                    }
                    task = std::move(tasks.front());
                    tasks.pop_front();
                }
                task();
            }
        }
    };

    void handle_register(const std::string& id, const json& message) {
        std::optional<std::string> key;
        const json payload = message.value("payload", json::object());
        if (payload.contains("client-key")) {
            key = payload.at("client-key").get<std::string>();
        }

        std::string error;
        bool prompt = false;
        std::string issued;
        {
            std::lock_guard<std::mutex> lock(m_script->mu);
            ++m_script->registrations;
            m_script->registration_keys.push_back(key);
            if (m_script->unanswered_registrations > 0) {
                --m_script->unanswered_registrations;
                return;
            }
            if (!m_script->registration_error.empty()) {
                error = m_script->registration_error;
            } else if (key && m_script->rejected_keys.count(*key) != 0) {
                error = "401 insufficient permissions: invalid client-key";
            }
            prompt = m_script->show_prompt && !key;
            issued = m_script->issued_key;
        }

        if (!error.empty()) {
            deliver(json{{"type", "error"}, {"id", id}, {"error", error}});
            return;
        }
        if (prompt) {
            deliver(json{{"type", "response"}, {"id", id},
                         {"payload", {{"pairingType", "PROMPT"}, {"returnValue", true}}}});
            // A real TV repeats the prompt response; only the first is announced.
            deliver(json{{"type", "response"}, {"id", id},
                         {"payload", {{"pairingType", "PROMPT"}, {"returnValue", true}}}});
        }
        deliver(json{{"type", "registered"}, {"id", id}, {"payload", {{"client-key", issued}}}});
    }

    void handle_request(const std::string& id, const json& message) {
        const std::string uri = message.value("uri", std::string());
        json payload = {{"returnValue", true}};
        std::string error;
        bool silent = false;
        {
            std::lock_guard<std::mutex> lock(m_script->mu);
            m_script->requests.push_back(message);
            if (m_script->manual_replies || m_script->silent_uris.count(uri) != 0) {
                silent = true;
            } else if (m_script->errors.count(uri) != 0 && m_script->error_limits.count(uri) == 0) {
                error = m_script->errors[uri];
            } else if (m_script->errors.count(uri) != 0 && m_script->error_limits[uri] > 0) {
                --m_script->error_limits[uri];
                error = m_script->errors[uri];
            } else if (m_script->payloads.count(uri) != 0) {
                payload = m_script->payloads[uri];
            }
        }
        if (silent) {
            return;
        }
        if (!error.empty()) {
            deliver(json{{"type", "error"}, {"id", id}, {"error", error}});
            return;
        }
        deliver(json{{"type", "response"}, {"id", id}, {"payload", payload}});
    }

    std::shared_ptr<FakeTvScript> m_script;
    std::shared_ptr<Mailbox> m_mailbox;
    std::thread m_thread;
    FrameHandler m_on_frame;
    CloseHandler m_on_close;
    std::atomic<bool> m_open{false};
    bool m_pointer = false;
};

// Owns the script and hands out channels bound to it.
class FakeTv {
public:
    FakeTv() : script(std::make_shared<FakeTvScript>()) {
        std::lock_guard<std::mutex> lock(script->mu);
        script->payloads["ssap://com.webos.service.networkinput/getPointerInputSocket"] =
            json{{"returnValue", true}, {"socketPath", "ws://127.0.0.1:3000/resources/pointer/netinput"}};
    }

    FrameChannelFactory factory() {
        std::shared_ptr<FakeTvScript> s = script;
        return [s]() -> std::unique_ptr<FrameChannel> { return std::make_unique<FakeTvChannel>(s); };
    }

    // Replies to a request by id on the open control channel.
    void reply(const std::string& id, const json& payload) {
        std::lock_guard<std::mutex> lock(script->mu);
        for (FakeTvChannel* channel : script->live) {
            if (!channel->is_pointer()) {
                channel->deliver(json{{"type", "response"}, {"id", id}, {"payload", payload}});
            }
        }
    }

    void drop_control_connections(const std::string& reason) {
        std::lock_guard<std::mutex> lock(script->mu);
        for (FakeTvChannel* channel : script->live) {
            if (!channel->is_pointer()) {
                channel->drop(reason);
            }
        }
    }

    std::shared_ptr<FakeTvScript> script;
};

} // namespace testing
} // namespace tvlink

#endif // TVLINK_TESTS_FAKE_TV_CHANNEL_H
