// Core/Log.hpp
#pragma once
#include <fmt/core.h>
#include <string>

#if defined(__APPLE__)
#include <os/log.h>
#else
#include <cstdio>
#endif

inline void LogDebugString(const std::string& s) {
#if defined(__APPLE__)
    os_log(OS_LOG_DEFAULT, "%{public}s", s.c_str());
#else
    std::fputs(s.c_str(), stderr);
    std::fputs("\n", stderr);
#endif
}

#if !defined(NDEBUG)
#define LOGF(...) do { fmt::print(__VA_ARGS__); fmt::print("\n"); } while(0)
#else
#define LOGF(...) do { auto _s = fmt::format(__VA_ARGS__); LogDebugString(_s); } while(0)
#endif
