// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <sloth/sloth.h>

#include <crypto/sha3.h>
#include <util/strencodings.h>

#include <gmp.h>

#include <algorithm>
#include <chrono>
#include <cstring>

namespace {

/** RAII holder for a GMP integer */
class ScopedMpz {
public:
    ScopedMpz() { mpz_init(m_value); }
    ~ScopedMpz() { mpz_clear(m_value); }

    ScopedMpz(const ScopedMpz&) = delete;
    ScopedMpz& operator=(const ScopedMpz&) = delete;

    mpz_ptr get() { return m_value; }
    mpz_srcptr get() const { return m_value; }

private:
    mpz_t m_value;
};

/**
 * Field parameters, computed once.
 *
 * p is the largest prime below 2^PRIME_BITS with p = 3 (mod 4), so that
 * x^((p+1)/4) is a square root of every quadratic residue x.
 */
struct FieldParams {
    ScopedMpz prime;
    ScopedMpz exponent;   // (p + 1) / 4

    FieldParams() {
        mpz_ptr p = prime.get();
        mpz_ui_pow_ui(p, 2, sloth::PRIME_BITS);
        mpz_sub_ui(p, p, 1);
        // Largest value below 2^bits that is 3 mod 4
        while (mpz_fdiv_ui(p, 4) != 3) {
            mpz_sub_ui(p, p, 1);
        }
        while (mpz_probab_prime_p(p, 50) == 0) {
            mpz_sub_ui(p, p, 4);
        }

        mpz_add_ui(exponent.get(), p, 1);
        mpz_fdiv_q_2exp(exponent.get(), exponent.get(), 2);
    }
};

const FieldParams& Field() {
    static const FieldParams params;
    return params;
}

void ImportBlock(mpz_ptr out, const uint8_t* block) {
    // Least significant byte first
    mpz_import(out, sloth::BLOCK_SIZE, -1, 1, 0, 0, block);
}

void ExportBlock(uint8_t* block, mpz_srcptr value) {
    memset(block, 0, sloth::BLOCK_SIZE);
    size_t count = 0;
    mpz_export(block, &count, -1, 1, 0, 0, value);
}

void XorBlock(uint8_t* dst, const uint8_t* src) {
    for (size_t i = 0; i < sloth::BLOCK_SIZE; i++) {
        dst[i] ^= src[i];
    }
}

/**
 * Square-root permutation of [0, p).
 *
 * Quadratic residues map to their even root; non-residues x map to the odd
 * root of p - x (a residue, since -1 is a non-residue when p = 3 mod 4).
 * Zero is a fixed point.
 */
void SqrtPermutation(mpz_ptr x, mpz_ptr scratch) {
    const FieldParams& field = Field();
    if (mpz_sgn(x) == 0) {
        return;
    }

    bool residue = mpz_jacobi(x, field.prime.get()) == 1;
    if (!residue) {
        mpz_sub(x, field.prime.get(), x);
    }
    mpz_powm_sec(scratch, x, field.exponent.get(), field.prime.get());

    bool odd = mpz_odd_p(scratch);
    if (residue == odd) {
        mpz_sub(x, field.prime.get(), scratch);
    } else {
        mpz_set(x, scratch);
    }
}

/** Inverse of SqrtPermutation: square, then negate odd roots */
void InversePermutation(mpz_ptr y, mpz_ptr scratch) {
    const FieldParams& field = Field();
    bool odd = mpz_odd_p(y);
    mpz_mul(scratch, y, y);
    mpz_mod(y, scratch, field.prime.get());
    if (odd && mpz_sgn(y) != 0) {
        mpz_sub(y, field.prime.get(), y);
    }
}

bool InField(mpz_srcptr value) {
    return mpz_cmp(value, Field().prime.get()) < 0;
}

void CheckLength(size_t len, const char* what) {
    if (len != PIECE_SIZE) {
        throw sloth::SlothError(sloth::ErrorCode::INVALID_INPUT_SIZE,
            strprintf("%s is %zu bytes, expected %zu", what, len, PIECE_SIZE));
    }
}

} // anonymous namespace

namespace sloth {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_INPUT_SIZE: return "InvalidInputSize";
        case ErrorCode::DECODE_MISMATCH: return "DecodeMismatch";
    }
    return "Unknown";
}

uint256 expand_iv(const uint256& farmerId, uint64_t index) {
    uint8_t input[40];
    memcpy(input, farmerId.data, 32);
    WriteLE64(input + 32, index);
    return Hash256(input, sizeof(input));
}

std::vector<uint8_t> encode(const Piece& piece, const uint256& farmerId,
                            uint64_t index, uint32_t layers) {
    CheckLength(piece.size(), "piece");

    std::vector<uint8_t> out(piece);
    uint256 iv = expand_iv(farmerId, index);

    ScopedMpz x, scratch;
    uint8_t feedback[BLOCK_SIZE];
    memcpy(feedback, iv.data, BLOCK_SIZE);

    for (uint32_t layer = 0; layer < layers; layer++) {
        for (size_t i = 0; i < BLOCKS_PER_PIECE; i++) {
            uint8_t* block = out.data() + i * BLOCK_SIZE;
            XorBlock(block, feedback);
            ImportBlock(x.get(), block);
            if (!InField(x.get())) {
                throw SlothError(ErrorCode::INVALID_INPUT_SIZE,
                    strprintf("block %zu of piece %llu is outside the prime field",
                              i, static_cast<unsigned long long>(index)));
            }
            SqrtPermutation(x.get(), scratch.get());
            ExportBlock(block, x.get());
            memcpy(feedback, block, BLOCK_SIZE);
        }
    }

    return out;
}

Piece decode(const std::vector<uint8_t>& encoded, const uint256& farmerId,
             uint64_t index, uint32_t layers) {
    CheckLength(encoded.size(), "encoding");

    Piece out(encoded);
    uint256 iv = expand_iv(farmerId, index);

    ScopedMpz y, scratch;

    // Undo a single block step in place: block = inverse(block) ^ feedback
    auto undo = [&](size_t i, const uint8_t* feedback, uint32_t layer) {
        uint8_t* block = out.data() + i * BLOCK_SIZE;
        ImportBlock(y.get(), block);
        if (!InField(y.get())) {
            throw SlothError(ErrorCode::DECODE_MISMATCH,
                strprintf("piece %llu: block %zu of layer %u is not a field element",
                          static_cast<unsigned long long>(index), i, layer));
        }
        InversePermutation(y.get(), scratch.get());
        ExportBlock(block, y.get());
        XorBlock(block, feedback);
    };

    for (uint32_t layer = layers; layer-- > 0;) {
        for (size_t i = BLOCKS_PER_PIECE - 1; i > 0; i--) {
            undo(i, out.data() + (i - 1) * BLOCK_SIZE, layer);
        }
        // Block 0 was fed by the IV on the first pass and by the last
        // block of the previous pass afterwards (already decoded above)
        uint8_t feedback[BLOCK_SIZE];
        if (layer == 0) {
            memcpy(feedback, iv.data, BLOCK_SIZE);
        } else {
            memcpy(feedback, out.data() + (BLOCKS_PER_PIECE - 1) * BLOCK_SIZE, BLOCK_SIZE);
        }
        undo(0, feedback, layer);
    }

    return out;
}

void verify(const Piece& piece, const std::vector<uint8_t>& encoded,
            const uint256& farmerId, uint64_t index, uint32_t layers) {
    CheckLength(piece.size(), "piece");
    Piece decoded = decode(encoded, farmerId, index, layers);
    if (decoded != piece) {
        throw SlothError(ErrorCode::DECODE_MISMATCH,
            strprintf("encoding does not decode to piece %llu",
                      static_cast<unsigned long long>(index)));
    }
}

std::string prime_hex() {
    char* str = mpz_get_str(nullptr, 16, Field().prime.get());
    std::string hex(str);
    void (*freefunc)(void*, size_t);
    mp_get_memory_functions(nullptr, nullptr, &freefunc);
    freefunc(str, strlen(str) + 1);
    return hex;
}

uint64_t benchmark(uint64_t sample_roots) {
    if (sample_roots == 0) {
        sample_roots = 1;
    }

    uint8_t seed[32] = {0x42};
    uint256 value = Hash256(seed, sizeof(seed));

    ScopedMpz x, scratch;
    ImportBlock(x.get(), value.data);
    mpz_mod(x.get(), x.get(), Field().prime.get());

    auto start = std::chrono::steady_clock::now();
    for (uint64_t i = 0; i < sample_roots; i++) {
        SqrtPermutation(x.get(), scratch.get());
        mpz_add_ui(x.get(), x.get(), 1);
        mpz_mod(x.get(), x.get(), Field().prime.get());
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (elapsed <= 0) return sample_roots * 1'000'000;  // Avoid div by zero
    return (sample_roots * 1'000'000) / static_cast<uint64_t>(elapsed);
}

uint32_t calculate_layers(double target_seconds, uint64_t measured_rps) {
    if (target_seconds <= 0.0 || measured_rps == 0) {
        return 1;
    }
    double roots = target_seconds * static_cast<double>(measured_rps);
    double layers = roots / static_cast<double>(BLOCKS_PER_PIECE);
    if (layers < 1.0) {
        return 1;
    }
    if (layers > 1e9) {
        return 1000000000u;
    }
    return static_cast<uint32_t>(layers + 0.5);
}

} // namespace sloth
