#pragma once
#include <functional>
#include <vector>

// Prova le sorgenti di porta in ordine: la prima che apre un servizio vince.
// open() riceve la proprietà della porta (anche quando fallisce).
template <typename Port, typename Service>
Service OpenFirstService(const std::vector<std::function<Port()>>& lookups, const std::function<Service(Port)>& open) {
    for (const auto& lookup : lookups) {
        if (!lookup) continue;
        const Port port = lookup();
        if (!port) continue;
        if (Service svc = open(port)) return svc;
    }
    return Service{};
}
