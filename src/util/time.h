// Copyright (c) 2025 The Dilithion Core developers
#ifndef PLOTCHAIN_UTIL_TIME_H
#define PLOTCHAIN_UTIL_TIME_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>

/** Mock time for tests; 0 means use the system clock */
extern std::atomic<int64_t> g_mock_time;

inline int64_t GetTime() {
    int64_t mock = g_mock_time.load();
    if (mock != 0) {
        return mock;
    }
    return static_cast<int64_t>(time(nullptr));
}

inline void SetMockTime(int64_t t) {
    g_mock_time.store(t);
}

inline int64_t GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

#endif
