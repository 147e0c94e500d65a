// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <plot/piece_set.h>

#include <util/logging.h>
#include <util/strencodings.h>

#include <mutex>

const char* PieceSetResultToString(PieceSetResult result) {
    switch (result) {
        case PieceSetResult::OK: return "OK";
        case PieceSetResult::NOT_FOUND: return "NotFound";
        case PieceSetResult::MALFORMED_PIECE_SET: return "MalformedPieceSet";
    }
    return "Unknown";
}

Piece CChainPieceSet::ExpandPiece(const uint256& seed, uint64_t index) {
    Piece piece(PIECE_SIZE);
    uint8_t input[32 + 8 + 4];
    memcpy(input, seed.data, 32);
    WriteLE64(input + 32, index);

    for (uint32_t j = 0; j < PIECE_SIZE / 32; j++) {
        input[40] = static_cast<uint8_t>(j);
        input[41] = static_cast<uint8_t>(j >> 8);
        input[42] = static_cast<uint8_t>(j >> 16);
        input[43] = static_cast<uint8_t>(j >> 24);
        uint256 block = Hash256(input, sizeof(input));
        memcpy(piece.data() + j * 32, block.data, 32);
    }
    return piece;
}

bool CChainPieceSet::InitGenesis(const uint256& seed, uint64_t count) {
    std::unique_lock<std::shared_mutex> lock(cs_pieces);
    if (!m_pieces.empty()) {
        return false;
    }

    m_pieces.reserve(count);
    for (uint64_t i = 0; i < count; i++) {
        m_pieces.push_back(ExpandPiece(seed, i));
    }
    m_version++;

    LogPrintPlot(INFO, "Piece set initialised with %llu genesis pieces",
                 static_cast<unsigned long long>(count));
    return true;
}

PieceSetResult CChainPieceSet::Append(const Piece& piece) {
    if (piece.size() != PIECE_SIZE) {
        LogPrintPlot(ERROR, "Rejecting appended piece of %zu bytes", piece.size());
        return PieceSetResult::MALFORMED_PIECE_SET;
    }

    std::unique_lock<std::shared_mutex> lock(cs_pieces);
    m_pieces.push_back(piece);
    m_version++;
    return PieceSetResult::OK;
}

PieceSetResult CChainPieceSet::AppendFromBlock(const uint256& blockHash) {
    std::unique_lock<std::shared_mutex> lock(cs_pieces);
    uint64_t index = m_pieces.size();
    m_pieces.push_back(ExpandPiece(blockHash, index));
    m_version++;

    LogPrintPlot(DEBUG, "Appended piece %llu from block %s",
                 static_cast<unsigned long long>(index), blockHash.GetHex().substr(0, 16).c_str());
    return PieceSetResult::OK;
}

uint64_t CChainPieceSet::Size() const {
    std::shared_lock<std::shared_mutex> lock(cs_pieces);
    return m_pieces.size();
}

PieceSetResult CChainPieceSet::GetPiece(uint64_t index, Piece& piece) const {
    std::shared_lock<std::shared_mutex> lock(cs_pieces);
    if (index >= m_pieces.size()) {
        return PieceSetResult::NOT_FOUND;
    }
    piece = m_pieces[index];
    return PieceSetResult::OK;
}
