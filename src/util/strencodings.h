// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_UTIL_STRENCODINGS_H
#define PLOTCHAIN_UTIL_STRENCODINGS_H

#include <string>
#include <cstdarg>
#include <cstdio>
#include <cstdint>

inline std::string strprintf(const char* format, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    return std::string(buffer);
}

/** Little-endian fixed-width helpers used by the hashing preimages */
inline void WriteLE64(uint8_t* out, uint64_t value) {
    for (int i = 0; i < 8; i++) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

inline void WriteBE64(uint8_t* out, uint64_t value) {
    for (int i = 0; i < 8; i++) {
        out[7 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

inline uint64_t ReadBE64(const uint8_t* in) {
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value = (value << 8) | in[i];
    }
    return value;
}

#endif // PLOTCHAIN_UTIL_STRENCODINGS_H
