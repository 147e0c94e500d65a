// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

/**
 * Sloth codec tests
 *
 * decode must invert encode exactly for every (farmer, index, layers), and
 * every malformed input must surface as a typed SlothError.
 */

#include <boost/test/unit_test.hpp>

#include <plot/piece_set.h>
#include <sloth/sloth.h>

#include <array>
#include <cstring>
#include <random>

namespace {

uint256 FarmerId(uint8_t tag) {
    uint8_t seed[4] = {'f', 'a', 'r', tag};
    return Hash256(seed, sizeof(seed));
}

Piece TestPiece(uint64_t index) {
    uint8_t seed[5] = {'p', 'i', 'e', 'c', 'e'};
    return CChainPieceSet::ExpandPiece(Hash256(seed, sizeof(seed)), index);
}

typedef std::array<uint8_t, sloth::BLOCK_SIZE> FieldBlock;

/** Little-endian field element with a small value */
FieldBlock SmallValue(uint8_t value) {
    FieldBlock block{};
    block[0] = value;
    return block;
}

/** Little-endian p - k, for k below 0x43 */
FieldBlock PrimeMinus(uint8_t k) {
    FieldBlock block;
    block.fill(0xff);
    block[0] = static_cast<uint8_t>(0x43 - k);
    return block;
}

/** Piece whose first block enters the field as value on the first pass */
Piece PieceWithFirstInput(const FieldBlock& value, const uint256& farmer, uint64_t index) {
    Piece piece = TestPiece(index);
    uint256 iv = sloth::expand_iv(farmer, index);
    for (size_t i = 0; i < sloth::BLOCK_SIZE; i++) {
        piece[i] = value[i] ^ iv.data[i];
    }
    return piece;
}

FieldBlock FirstBlock(const std::vector<uint8_t>& encoded) {
    FieldBlock block;
    memcpy(block.data(), encoded.data(), block.size());
    return block;
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(sloth_tests)

BOOST_AUTO_TEST_CASE(prime_is_fixed) {
    // 2^256 - 189
    BOOST_CHECK_EQUAL(sloth::prime_hex(),
                      "ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff43");
    BOOST_CHECK_EQUAL(sloth::BLOCKS_PER_PIECE, 128u);
}

BOOST_AUTO_TEST_CASE(decode_inverts_encode) {
    for (uint32_t layers : {1u, 2u, 5u}) {
        for (uint64_t index : {0ull, 1ull, 77ull}) {
            Piece piece = TestPiece(index);
            uint256 farmer = FarmerId(1);

            std::vector<uint8_t> encoded = sloth::encode(piece, farmer, index, layers);
            BOOST_CHECK_EQUAL(encoded.size(), PIECE_SIZE);
            BOOST_CHECK(encoded != piece);

            Piece decoded = sloth::decode(encoded, farmer, index, layers);
            BOOST_CHECK(decoded == piece);
            BOOST_CHECK_NO_THROW(sloth::verify(piece, encoded, farmer, index, layers));
        }
    }
}

BOOST_AUTO_TEST_CASE(encoding_is_deterministic) {
    Piece piece = TestPiece(3);
    BOOST_CHECK(sloth::encode(piece, FarmerId(1), 3, 2) == sloth::encode(piece, FarmerId(1), 3, 2));
}

BOOST_AUTO_TEST_CASE(encoding_binds_farmer_index_and_layers) {
    Piece piece = TestPiece(9);
    std::vector<uint8_t> base = sloth::encode(piece, FarmerId(1), 9, 2);

    BOOST_CHECK(base != sloth::encode(piece, FarmerId(2), 9, 2));
    BOOST_CHECK(base != sloth::encode(piece, FarmerId(1), 10, 2));
    BOOST_CHECK(base != sloth::encode(piece, FarmerId(1), 9, 3));

    // Another farmer's replica does not verify as ours
    std::vector<uint8_t> other = sloth::encode(piece, FarmerId(2), 9, 2);
    BOOST_CHECK_THROW(sloth::verify(piece, other, FarmerId(1), 9, 2), sloth::SlothError);
}

BOOST_AUTO_TEST_CASE(wrong_sizes_rejected) {
    Piece shortPiece(PIECE_SIZE - 1, 0x11);
    try {
        sloth::encode(shortPiece, FarmerId(1), 0, 1);
        BOOST_FAIL("short piece encoded");
    } catch (const sloth::SlothError& e) {
        BOOST_CHECK(e.code() == sloth::ErrorCode::INVALID_INPUT_SIZE);
    }

    std::vector<uint8_t> longEncoding(PIECE_SIZE + 32, 0x22);
    try {
        sloth::decode(longEncoding, FarmerId(1), 0, 1);
        BOOST_FAIL("long encoding decoded");
    } catch (const sloth::SlothError& e) {
        BOOST_CHECK(e.code() == sloth::ErrorCode::INVALID_INPUT_SIZE);
    }
}

BOOST_AUTO_TEST_CASE(block_outside_field_rejected) {
    uint256 farmer = FarmerId(1);
    const uint64_t index = 4;

    // First block XOR IV lands exactly on the prime
    uint8_t prime[32];
    memset(prime, 0xff, sizeof(prime));
    prime[0] = 0x43;

    Piece piece = TestPiece(index);
    uint256 iv = sloth::expand_iv(farmer, index);
    for (size_t i = 0; i < 32; i++) {
        piece[i] = prime[i] ^ iv.data[i];
    }

    try {
        sloth::encode(piece, farmer, index, 1);
        BOOST_FAIL("out-of-field block encoded");
    } catch (const sloth::SlothError& e) {
        BOOST_CHECK(e.code() == sloth::ErrorCode::INVALID_INPUT_SIZE);
    }
}

BOOST_AUTO_TEST_CASE(tampered_encoding_detected) {
    Piece piece = TestPiece(5);
    uint256 farmer = FarmerId(3);
    std::vector<uint8_t> encoded = sloth::encode(piece, farmer, 5, 2);

    std::vector<uint8_t> flipped = encoded;
    flipped[100] ^= 0x01;
    try {
        sloth::verify(piece, flipped, farmer, 5, 2);
        BOOST_FAIL("tampered encoding verified");
    } catch (const sloth::SlothError& e) {
        BOOST_CHECK(e.code() == sloth::ErrorCode::DECODE_MISMATCH);
    }

    // A block of all ones is not a field element
    std::vector<uint8_t> outside = encoded;
    memset(outside.data() + 64, 0xff, 32);
    try {
        sloth::decode(outside, farmer, 5, 2);
        BOOST_FAIL("out-of-field encoding decoded");
    } catch (const sloth::SlothError& e) {
        BOOST_CHECK(e.code() == sloth::ErrorCode::DECODE_MISMATCH);
    }
}

BOOST_AUTO_TEST_CASE(square_root_branches) {
    uint256 farmer = FarmerId(4);
    const uint64_t index = 12;

    // Residues map to their even root, non-residues x to the odd root of -x.
    // p = 3 (mod 8), so 2 is a non-residue and sqrt(4) = p - 2 before the
    // parity fix.
    struct Case {
        FieldBlock input;
        FieldBlock output;
    };
    const Case cases[] = {
        {SmallValue(0), SmallValue(0)},      // zero is fixed
        {SmallValue(1), PrimeMinus(1)},      // residue, roots 1 and p-1
        {SmallValue(4), SmallValue(2)},      // residue, roots 2 and p-2
        {PrimeMinus(4), PrimeMinus(2)},      // non-residue -4
        {PrimeMinus(1), SmallValue(1)},      // non-residue -1, the largest element
    };

    for (const Case& c : cases) {
        Piece piece = PieceWithFirstInput(c.input, farmer, index);
        std::vector<uint8_t> encoded = sloth::encode(piece, farmer, index, 1);
        BOOST_CHECK(FirstBlock(encoded) == c.output);
        BOOST_CHECK(sloth::decode(encoded, farmer, index, 1) == piece);

        // Same input under several layers still inverts
        std::vector<uint8_t> deeper = sloth::encode(piece, farmer, index, 3);
        BOOST_CHECK(sloth::decode(deeper, farmer, index, 3) == piece);
    }
}

BOOST_AUTO_TEST_CASE(zero_feedback_chain) {
    uint256 farmer = FarmerId(5);
    const uint64_t index = 2;

    // First block cancels the IV and the rest are zero: every step sees 0
    Piece piece(PIECE_SIZE, 0);
    uint256 iv = sloth::expand_iv(farmer, index);
    memcpy(piece.data(), iv.data, sloth::BLOCK_SIZE);

    for (uint32_t layers : {1u, 4u}) {
        std::vector<uint8_t> encoded = sloth::encode(piece, farmer, index, layers);
        BOOST_CHECK(encoded == std::vector<uint8_t>(PIECE_SIZE, 0));
        BOOST_CHECK(sloth::decode(encoded, farmer, index, layers) == piece);
    }
}

BOOST_AUTO_TEST_CASE(all_zero_piece) {
    Piece zeros(PIECE_SIZE, 0);
    for (uint32_t layers : {1u, 2u}) {
        std::vector<uint8_t> encoded = sloth::encode(zeros, FarmerId(6), 0, layers);
        BOOST_CHECK(encoded != zeros);
        BOOST_CHECK(sloth::decode(encoded, FarmerId(6), 0, layers) == zeros);
        BOOST_CHECK_NO_THROW(sloth::verify(zeros, encoded, FarmerId(6), 0, layers));
    }
}

BOOST_AUTO_TEST_CASE(random_pieces_invert) {
    std::mt19937_64 rng(20250101);
    for (int round = 0; round < 24; round++) {
        uint8_t tag = static_cast<uint8_t>(rng());
        uint256 farmer = FarmerId(tag);
        uint64_t index = rng() % 1000000;
        uint32_t layers = 1 + static_cast<uint32_t>(rng() % 3);

        Piece piece(PIECE_SIZE);
        for (uint8_t& b : piece) {
            b = static_cast<uint8_t>(rng());
        }

        std::vector<uint8_t> encoded;
        try {
            encoded = sloth::encode(piece, farmer, index, layers);
        } catch (const sloth::SlothError& e) {
            BOOST_FAIL("random piece rejected: " << e.what());
        }
        BOOST_CHECK_MESSAGE(sloth::decode(encoded, farmer, index, layers) == piece,
                            "round " << round << " index " << index << " layers " << layers);
    }
}

BOOST_AUTO_TEST_CASE(layer_calibration) {
    BOOST_CHECK_EQUAL(sloth::calculate_layers(0.0, 1000), 1u);
    BOOST_CHECK_EQUAL(sloth::calculate_layers(1.0, 0), 1u);
    // 128 roots per layer
    BOOST_CHECK_EQUAL(sloth::calculate_layers(1.0, 128 * 50), 50u);
    BOOST_CHECK_EQUAL(sloth::calculate_layers(0.5, 128 * 50), 25u);

    uint64_t rps = sloth::benchmark(256);
    BOOST_CHECK(rps > 0);
    BOOST_CHECK(sloth::calculate_layers(1.0, rps) >= 1u);
}

BOOST_AUTO_TEST_SUITE_END()
