// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <plot/plot_store.h>

#include <crypto/sha3.h>
#include <db/db_errors.h>
#include <primitives/piece.h>
#include <sloth/sloth.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <leveldb/iterator.h>
#include <leveldb/options.h>
#include <leveldb/write_batch.h>

#include <filesystem>
#include <iostream>

namespace {

const uint32_t PLOT_RECORD_VERSION = 1;
const size_t RECORD_HEADER_SIZE = 4 + 1 + 4;
const size_t CHECKSUM_SIZE = 32;

void AppendLE32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; i++) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
    }
}

uint32_t ReadLE32(const char* p) {
    const uint8_t* u = reinterpret_cast<const uint8_t*>(p);
    return static_cast<uint32_t>(u[0]) | (static_cast<uint32_t>(u[1]) << 8) |
           (static_cast<uint32_t>(u[2]) << 16) | (static_cast<uint32_t>(u[3]) << 24);
}

uint256 RecordChecksum(uint64_t index, uint8_t complete, const uint8_t* data, size_t len) {
    std::vector<uint8_t> preimage(8 + 1 + len);
    WriteBE64(preimage.data(), index);
    preimage[8] = complete;
    if (len > 0) {
        memcpy(preimage.data() + 9, data, len);
    }
    return Hash256(preimage);
}

} // anonymous namespace

const char* PlotStoreResultToString(PlotStoreResult result) {
    switch (result) {
        case PlotStoreResult::OK: return "OK";
        case PlotStoreResult::NOT_FOUND: return "NotFound";
        case PlotStoreResult::CORRUPT_ENTRY: return "CorruptEntry";
        case PlotStoreResult::IO_FAILURE: return "IOFailure";
    }
    return "Unknown";
}

CPlotStore::CPlotStore() = default;

CPlotStore::~CPlotStore() {
    Close();
}

std::string CPlotStore::MakeKey(const uint256& farmerId, uint64_t index) {
    std::string key;
    key.reserve(1 + 32 + 8);
    key.push_back('p');
    key.append(reinterpret_cast<const char*>(farmerId.begin()), 32);
    uint8_t be[8];
    WriteBE64(be, index);
    key.append(reinterpret_cast<const char*>(be), 8);
    return key;
}

std::string CPlotStore::MakeMetaKey(const uint256& farmerId) {
    std::string key;
    key.push_back('m');
    key.append(reinterpret_cast<const char*>(farmerId.begin()), 32);
    return key;
}

bool CPlotStore::Open(const std::string& path, const uint256& farmerId, uint32_t layers, std::string& error) {
    if (db != nullptr) {
        error = "plot store already open";
        return false;
    }
    if (layers == 0) {
        error = "encoding layers must be at least 1";
        return false;
    }

    try {
        std::filesystem::create_directories(path);
    } catch (const std::filesystem::filesystem_error& e) {
        error = std::string("cannot create plot directory: ") + e.what();
        return false;
    }

    leveldb::Options options;
    options.create_if_missing = true;
    // Encodings are uniformly random, compression only costs CPU
    options.compression = leveldb::kNoCompression;
    options.max_open_files = 100;
    options.write_buffer_size = 32 * 1024 * 1024;

    leveldb::DB* raw_db = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path, &raw_db);
    if (!status.ok()) {
        error = GetDBErrorMessage(status);
        LogPrintPlot(ERROR, "Failed to open plot database %s: %s", path.c_str(), error.c_str());
        return false;
    }

    db.reset(raw_db);
    m_farmerId = farmerId;
    m_layers = layers;

    if (!CheckMetadata(error) || !LoadCompletion(error)) {
        db.reset();
        return false;
    }

    std::cout << "[PlotStore] Opened " << path << " for farmer "
              << farmerId.GetHex().substr(0, 16) << " (" << m_completedCount
              << " pieces plotted)" << std::endl;
    return true;
}

void CPlotStore::Close() {
    db.reset();
    std::unique_lock<std::shared_mutex> lock(cs_completion);
    m_completed.clear();
    m_completedCount = 0;
    m_contiguousEnd = 0;
}

bool CPlotStore::CheckMetadata(std::string& error) {
    // [layers u32][prime bits u32]
    std::string key = MakeMetaKey(m_farmerId);
    std::string value;
    leveldb::Status status = db->Get(leveldb::ReadOptions(), key, &value);

    if (status.IsNotFound()) {
        std::string meta;
        AppendLE32(meta, m_layers);
        AppendLE32(meta, sloth::PRIME_BITS);
        leveldb::WriteOptions wopts;
        wopts.sync = true;
        status = db->Put(wopts, key, meta);
        if (!status.ok()) {
            error = GetDBErrorMessage(status);
            return false;
        }
        return true;
    }

    if (!status.ok()) {
        error = GetDBErrorMessage(status);
        return false;
    }

    if (value.size() != 8) {
        error = "plot metadata record is corrupt";
        return false;
    }

    uint32_t storedLayers = ReadLE32(value.data());
    uint32_t storedBits = ReadLE32(value.data() + 4);
    if (storedLayers != m_layers || storedBits != sloth::PRIME_BITS) {
        error = strprintf("plot was built with %u layers / %u-bit prime, node is configured for %u / %u",
                          storedLayers, storedBits, m_layers, sloth::PRIME_BITS);
        return false;
    }
    return true;
}

bool CPlotStore::LoadCompletion(std::string& error) {
    std::string prefix = MakeKey(m_farmerId, 0).substr(0, 33);

    std::unique_ptr<leveldb::Iterator> it(db->NewIterator(leveldb::ReadOptions()));
    std::unique_lock<std::shared_mutex> lock(cs_completion);
    m_completed.clear();
    m_completedCount = 0;
    m_contiguousEnd = 0;

    for (it->Seek(prefix); it->Valid(); it->Next()) {
        leveldb::Slice key = it->key();
        if (key.size() != prefix.size() + 8 || memcmp(key.data(), prefix.data(), prefix.size()) != 0) {
            break;
        }

        leveldb::Slice value = it->value();
        // Only the layout is checked here; the checksum is verified on Get
        if (value.size() < RECORD_HEADER_SIZE + CHECKSUM_SIZE ||
            ReadLE32(value.data()) != PLOT_RECORD_VERSION ||
            value.data()[4] != 1) {
            continue;
        }

        uint64_t index = ReadBE64(reinterpret_cast<const uint8_t*>(key.data()) + prefix.size());
        if (index >= m_completed.size()) {
            m_completed.resize(index + 1, false);
        }
        if (!m_completed[index]) {
            m_completed[index] = true;
            m_completedCount++;
        }
    }

    if (!it->status().ok()) {
        error = GetDBErrorMessage(it->status());
        return false;
    }

    while (m_contiguousEnd < m_completed.size() && m_completed[m_contiguousEnd]) {
        m_contiguousEnd++;
    }
    return true;
}

void CPlotStore::MarkComplete(uint64_t index) {
    std::unique_lock<std::shared_mutex> lock(cs_completion);
    if (index >= m_completed.size()) {
        m_completed.resize(index + 1, false);
    }
    if (m_completed[index]) {
        return;
    }
    m_completed[index] = true;
    m_completedCount++;
    while (m_contiguousEnd < m_completed.size() && m_completed[m_contiguousEnd]) {
        m_contiguousEnd++;
    }
}

PlotStoreResult CPlotStore::Put(uint64_t index, const std::vector<uint8_t>& encoded) {
    if (db == nullptr) {
        return PlotStoreResult::IO_FAILURE;
    }
    if (encoded.size() != PIECE_SIZE) {
        LogPrintPlot(ERROR, "Refusing to store piece %llu: %zu bytes, expected %zu",
                     static_cast<unsigned long long>(index), encoded.size(), PIECE_SIZE);
        return PlotStoreResult::CORRUPT_ENTRY;
    }

    const uint8_t complete = 1;
    std::string value;
    value.reserve(RECORD_HEADER_SIZE + encoded.size() + CHECKSUM_SIZE);
    AppendLE32(value, PLOT_RECORD_VERSION);
    value.push_back(static_cast<char>(complete));
    AppendLE32(value, static_cast<uint32_t>(encoded.size()));
    value.append(reinterpret_cast<const char*>(encoded.data()), encoded.size());
    uint256 checksum = RecordChecksum(index, complete, encoded.data(), encoded.size());
    value.append(reinterpret_cast<const char*>(checksum.begin()), CHECKSUM_SIZE);

    leveldb::WriteOptions options;
    options.sync = m_syncWrites;
    leveldb::Status status = db->Put(options, MakeKey(m_farmerId, index), value);
    if (!status.ok()) {
        LogPrintPlot(WARN, "Put of piece %llu failed: %s",
                     static_cast<unsigned long long>(index), GetDBErrorMessage(status).c_str());
        return PlotStoreResult::IO_FAILURE;
    }

    MarkComplete(index);
    return PlotStoreResult::OK;
}

PlotStoreResult CPlotStore::Get(uint64_t index, std::vector<uint8_t>& encoded) const {
    if (db == nullptr) {
        return PlotStoreResult::IO_FAILURE;
    }

    std::string value;
    leveldb::Status status = db->Get(leveldb::ReadOptions(), MakeKey(m_farmerId, index), &value);
    if (status.IsNotFound()) {
        return PlotStoreResult::NOT_FOUND;
    }
    if (!status.ok()) {
        DBErrorType error_type = ClassifyDBError(status);
        LogPrintPlot(ERROR, "Get of piece %llu failed: %s",
                     static_cast<unsigned long long>(index),
                     GetDBErrorMessage(status, error_type).c_str());
        return error_type == DBErrorType::CORRUPTION ? PlotStoreResult::CORRUPT_ENTRY
                                                     : PlotStoreResult::IO_FAILURE;
    }

    if (value.size() < RECORD_HEADER_SIZE + CHECKSUM_SIZE) {
        return PlotStoreResult::CORRUPT_ENTRY;
    }

    uint32_t version = ReadLE32(value.data());
    uint8_t complete = static_cast<uint8_t>(value[4]);
    uint32_t length = ReadLE32(value.data() + 5);
    if (version != PLOT_RECORD_VERSION || length != PIECE_SIZE ||
        value.size() != RECORD_HEADER_SIZE + length + CHECKSUM_SIZE) {
        return PlotStoreResult::CORRUPT_ENTRY;
    }

    const uint8_t* data = reinterpret_cast<const uint8_t*>(value.data()) + RECORD_HEADER_SIZE;
    uint256 expected = RecordChecksum(index, complete, data, length);
    if (memcmp(expected.begin(), data + length, CHECKSUM_SIZE) != 0) {
        LogPrintPlot(ERROR, "Checksum mismatch on plotted piece %llu",
                     static_cast<unsigned long long>(index));
        return PlotStoreResult::CORRUPT_ENTRY;
    }

    if (complete != 1) {
        return PlotStoreResult::NOT_FOUND;
    }

    encoded.assign(data, data + length);
    return PlotStoreResult::OK;
}

bool CPlotStore::Has(uint64_t index) const {
    std::shared_lock<std::shared_mutex> lock(cs_completion);
    return index < m_completed.size() && m_completed[index];
}

CPlotRange CPlotStore::CompletedRange() const {
    std::shared_lock<std::shared_mutex> lock(cs_completion);
    CPlotRange range;
    range.begin = 0;
    range.end = m_contiguousEnd;
    return range;
}

uint64_t CPlotStore::CompletedCount() const {
    std::shared_lock<std::shared_mutex> lock(cs_completion);
    return m_completedCount;
}

double CPlotStore::CompletionPercent(uint64_t pieceCount) const {
    if (pieceCount == 0) {
        return 100.0;
    }
    std::shared_lock<std::shared_mutex> lock(cs_completion);
    uint64_t done = 0;
    uint64_t limit = std::min<uint64_t>(pieceCount, m_completed.size());
    if (m_completedCount == m_completed.size()) {
        done = limit;
    } else {
        for (uint64_t i = 0; i < limit; i++) {
            if (m_completed[i]) done++;
        }
    }
    return 100.0 * static_cast<double>(done) / static_cast<double>(pieceCount);
}

PlotStoreResult CPlotStore::Clear() {
    if (db == nullptr) {
        return PlotStoreResult::IO_FAILURE;
    }

    std::string prefix = MakeKey(m_farmerId, 0).substr(0, 33);
    leveldb::WriteBatch batch;
    {
        std::unique_ptr<leveldb::Iterator> it(db->NewIterator(leveldb::ReadOptions()));
        for (it->Seek(prefix); it->Valid(); it->Next()) {
            if (!it->key().starts_with(prefix)) {
                break;
            }
            batch.Delete(it->key());
        }
        if (!it->status().ok()) {
            return PlotStoreResult::IO_FAILURE;
        }
    }

    leveldb::WriteOptions options;
    options.sync = true;
    leveldb::Status status = db->Write(options, &batch);
    if (!status.ok()) {
        LogPrintPlot(ERROR, "Clear failed: %s", GetDBErrorMessage(status).c_str());
        return PlotStoreResult::IO_FAILURE;
    }

    std::unique_lock<std::shared_mutex> lock(cs_completion);
    m_completed.clear();
    m_completedCount = 0;
    m_contiguousEnd = 0;
    return PlotStoreResult::OK;
}
