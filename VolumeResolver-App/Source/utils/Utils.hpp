#pragma once
#include <string>
#include <chrono>
#include <ctime>
#include <algorithm>
#include <cctype>

// minuscole
static inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

// "2024-05-01T10:00:00Z"
static inline std::string IsoUtc(std::chrono::system_clock::time_point tp) {
    const auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    return buf;
}

static inline std::string NowIsoUtc() {
    return IsoUtc(std::chrono::system_clock::now());
}
