// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_SUPPORT_CLEANSE_H
#define PLOTCHAIN_SUPPORT_CLEANSE_H

#include <openssl/crypto.h>

#include <cstddef>

/** Overwrite secret material so the compiler cannot elide the write */
inline void memory_cleanse(void* ptr, size_t len)
{
    OPENSSL_cleanse(ptr, len);
}

#endif // PLOTCHAIN_SUPPORT_CLEANSE_H
