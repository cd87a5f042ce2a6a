#pragma once
#include <chrono>
#include <functional>
#include <thread>

// Politica di retry limitata condivisa dai transport DDC/CI
struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds delay{ 10 };  // pausa tra un tentativo e l'altro
    bool delayBeforeFirst = false;          // pausa anche prima del primo tentativo
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper DefaultSleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

// Esegue attempt(i) finché ritorna true o finiscono i tentativi.
// Ritorna true al primo successo.
inline bool RunWithRetry(const RetryPolicy& p, const Sleeper& sleep, const std::function<bool(int)>& attempt) {
    for (int i = 0; i < p.maxAttempts; ++i) {
        if ((i > 0 || p.delayBeforeFirst) && sleep && p.delay.count() > 0) sleep(p.delay);
        if (attempt(i)) return true;
    }
    return false;
}
