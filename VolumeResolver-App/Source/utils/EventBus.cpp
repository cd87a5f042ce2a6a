#include "utils/EventBus.hpp"

uint64_t EventBus::publish(const Json& ev) {
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lk(m_mx);
        seq = ++m_seq;
        m_q.push_back(Item{ seq, ev });
        if (m_q.size() > kMax) m_q.pop_front();
    }
    m_cv.notify_all();
    return seq;
}

uint64_t EventBus::head() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_seq;
}

bool EventBus::waitNext(uint64_t& cursor, Json& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_mx);
    if (!m_cv.wait_for(lk, timeout, [&] { return m_closed || m_seq > cursor; })) return false;
    if (m_q.empty() || m_seq <= cursor) return false;

    // i seq nel deque sono contigui
    const uint64_t oldest = m_q.front().seq;
    const uint64_t next = cursor + 1 < oldest ? oldest : cursor + 1;
    const Item& it = m_q[static_cast<size_t>(next - oldest)];
    out = it.ev;
    cursor = it.seq;
    return true;
}

void EventBus::close() {
    {
        std::lock_guard<std::mutex> lk(m_mx);
        m_closed = true;
    }
    m_cv.notify_all();
}

bool EventBus::closed() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_closed;
}

size_t EventBus::size() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_q.size();
}
