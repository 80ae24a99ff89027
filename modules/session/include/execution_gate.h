#ifndef TVLINK_EXECUTION_GATE_H
#define TVLINK_EXECUTION_GATE_H

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

namespace tvlink {

// Single-slot gate; callers run one at a time in arrival order.
class ExecutionGate {
public:
    template <typename Fn>
    auto run(Fn&& fn) -> decltype(fn()) {
        Ticket ticket(*this);
        return fn();
    }

    // Callers queued or running.
    uint64_t occupancy() const;

private:
    class Ticket {
    public:
        explicit Ticket(ExecutionGate& gate);
        ~Ticket();

    private:
        ExecutionGate& m_gate;
    };

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    uint64_t m_next_ticket = 0;
    uint64_t m_serving = 0;
};

} // namespace tvlink

#endif // TVLINK_EXECUTION_GATE_H
