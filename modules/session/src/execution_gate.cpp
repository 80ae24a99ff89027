#include "execution_gate.h"

namespace tvlink {

ExecutionGate::Ticket::Ticket(ExecutionGate& gate) : m_gate(gate) {
    std::unique_lock<std::mutex> lock(m_gate.m_mutex);
    const uint64_t mine = m_gate.m_next_ticket++;
    m_gate.m_cv.wait(lock, [this, mine] { return m_gate.m_serving == mine; });
}

ExecutionGate::Ticket::~Ticket() {
    {
        std::lock_guard<std::mutex> lock(m_gate.m_mutex);
        ++m_gate.m_serving;
    }
    m_gate.m_cv.notify_all();
}

uint64_t ExecutionGate::occupancy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_next_ticket - m_serving;
}

} // namespace tvlink
