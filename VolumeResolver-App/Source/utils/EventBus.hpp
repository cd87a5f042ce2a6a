#pragma once
#include <nlohmann/json.hpp>
#include <mutex>
#include <deque>
#include <condition_variable>
#include <chrono>
#include <cstdint>

// Bus broadcast degli eventi di stato (SSE).
// Ogni lettore tiene il proprio cursore: più client ricevono gli stessi eventi.
class EventBus {
public:
    using Json = nlohmann::json;

    // Pubblica un evento (thread-safe). Mantiene al max kMax eventi.
    // Ritorna il numero di sequenza assegnato (da 1).
    uint64_t publish(const Json& ev);

    // Cursore da cui un nuovo lettore riceve solo gli eventi futuri
    [[nodiscard]] uint64_t head() const;

    // Prossimo evento con seq > cursor; avanza il cursore. false su timeout.
    // Se il lettore è rimasto indietro oltre la finestra, salta al più vecchio disponibile.
    bool waitNext(uint64_t& cursor, Json& out, std::chrono::milliseconds timeout);

    // Sveglia tutti i lettori in attesa (shutdown)
    void close();
    [[nodiscard]] bool closed() const;

    [[nodiscard]] size_t size() const;

    static constexpr size_t kMax = 256;

private:
    struct Item {
        uint64_t seq;
        Json ev;
    };

    mutable std::mutex m_mx;
    std::condition_variable m_cv;
    std::deque<Item> m_q;
    uint64_t m_seq = 0;
    bool m_closed = false;
};
