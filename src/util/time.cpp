// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <util/time.h>

std::atomic<int64_t> g_mock_time{0};
