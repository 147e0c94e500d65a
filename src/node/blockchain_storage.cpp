// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <node/blockchain_storage.h>

#include <util/logging.h>

#include <leveldb/iterator.h>
#include <leveldb/options.h>

#include <filesystem>
#include <iostream>
#include <limits>

namespace {

const uint32_t SERIALIZATION_VERSION = 1;
const size_t RECORD_OVERHEAD = 4 + 4 + 32;
const char BEST_BLOCK_KEY[] = "B";

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

} // anonymous namespace

CBlockchainDB::CBlockchainDB() = default;

CBlockchainDB::~CBlockchainDB() {
    Close();
}

std::string CBlockchainDB::BlockKey(const uint256& hash) {
    std::string key("b");
    key.append(reinterpret_cast<const char*>(hash.begin()), 32);
    return key;
}

bool CBlockchainDB::Open(const std::string& path, std::string& error) {
    std::lock_guard<std::mutex> lock(cs_db);

    if (db != nullptr) {
        return true;
    }

    try {
        std::filesystem::create_directories(path);
    } catch (const std::filesystem::filesystem_error& e) {
        error = std::string("cannot create block directory: ") + e.what();
        return false;
    }

    leveldb::Options options;
    options.create_if_missing = true;
    options.max_open_files = 64;

    leveldb::DB* raw_db = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path, &raw_db);
    if (!status.ok()) {
        error = GetDBErrorMessage(status);
        LogPrintf(DB, ERROR, "Failed to open block database %s: %s", path.c_str(), error.c_str());
        return false;
    }

    db.reset(raw_db);
    datadir = path;
    std::cout << "[DB] Block database opened at " << path << std::endl;
    return true;
}

void CBlockchainDB::Close() {
    std::lock_guard<std::mutex> lock(cs_db);
    db.reset();
}

bool CBlockchainDB::IsOpen() const {
    std::lock_guard<std::mutex> lock(cs_db);
    return db != nullptr;
}

bool CBlockchainDB::WriteBlock(const CBlock& block) {
    std::vector<uint8_t> data = block.ToBytes();
    if (data.size() > std::numeric_limits<uint32_t>::max()) {
        LogPrintf(DB, ERROR, "Block too large to store (%zu bytes)", data.size());
        return false;
    }

    std::string value;
    value.reserve(RECORD_OVERHEAD + data.size());
    AppendLE32(value, SERIALIZATION_VERSION);
    AppendLE32(value, static_cast<uint32_t>(data.size()));
    value.append(reinterpret_cast<const char*>(data.data()), data.size());
    uint256 checksum = Hash256(data);
    value.append(reinterpret_cast<const char*>(checksum.begin()), 32);

    std::lock_guard<std::mutex> lock(cs_db);
    if (db == nullptr) {
        return false;
    }

    leveldb::WriteOptions options;
    options.sync = true;
    leveldb::Status status = db->Put(options, BlockKey(block.GetHash()), value);
    if (!status.ok()) {
        LogPrintf(DB, ERROR, "WriteBlock failed: %s",
                  GetDBErrorMessage(status).c_str());
        return false;
    }
    return true;
}

bool CBlockchainDB::DecodeRecord(const std::string& value, const uint256* expectedHash,
                                 CBlock& block, std::string& error) const {
    if (value.size() < RECORD_OVERHEAD) {
        error = "record too small";
        return false;
    }
    uint32_t version = ReadLE32(value.data());
    if (version != SERIALIZATION_VERSION) {
        error = "unsupported record version " + std::to_string(version);
        return false;
    }
    uint32_t length = ReadLE32(value.data() + 4);
    if (value.size() != RECORD_OVERHEAD + length) {
        error = "record length mismatch";
        return false;
    }

    std::vector<uint8_t> data(value.begin() + 8, value.begin() + 8 + length);
    uint256 checksum = Hash256(data);
    if (memcmp(checksum.begin(), value.data() + 8 + length, 32) != 0) {
        error = "checksum mismatch";
        return false;
    }

    if (!CBlock::FromBytes(data, block, error)) {
        return false;
    }
    if (expectedHash != nullptr && block.GetHash() != *expectedHash) {
        error = "stored block does not match its key";
        return false;
    }
    return true;
}

bool CBlockchainDB::ReadBlock(const uint256& hash, CBlock& block, std::string& error) const {
    std::lock_guard<std::mutex> lock(cs_db);
    if (db == nullptr) {
        error = "database not open";
        return false;
    }

    std::string value;
    leveldb::Status status = db->Get(leveldb::ReadOptions(), BlockKey(hash), &value);
    if (!status.ok()) {
        error = GetDBErrorMessage(status);
        return false;
    }
    return DecodeRecord(value, &hash, block, error);
}

bool CBlockchainDB::BlockExists(const uint256& hash) const {
    std::lock_guard<std::mutex> lock(cs_db);
    if (db == nullptr) {
        return false;
    }
    std::string value;
    return db->Get(leveldb::ReadOptions(), BlockKey(hash), &value).ok();
}

bool CBlockchainDB::WriteBestBlock(const uint256& hash) {
    std::lock_guard<std::mutex> lock(cs_db);
    if (db == nullptr) {
        return false;
    }

    leveldb::WriteOptions options;
    options.sync = true;
    leveldb::Status status = db->Put(options, BEST_BLOCK_KEY,
                                     leveldb::Slice(reinterpret_cast<const char*>(hash.begin()), 32));
    if (!status.ok()) {
        LogPrintf(DB, ERROR, "WriteBestBlock failed: %s",
                  GetDBErrorMessage(status).c_str());
        return false;
    }
    return true;
}

bool CBlockchainDB::ReadBestBlock(uint256& hash) const {
    std::lock_guard<std::mutex> lock(cs_db);
    if (db == nullptr) {
        return false;
    }

    std::string value;
    leveldb::Status status = db->Get(leveldb::ReadOptions(), BEST_BLOCK_KEY, &value);
    if (!status.ok() || value.size() != 32) {
        return false;
    }
    memcpy(hash.begin(), value.data(), 32);
    return true;
}

bool CBlockchainDB::LoadAllBlocks(std::vector<CBlock>& blocks, size_t& nCorrupt, std::string& error) const {
    std::lock_guard<std::mutex> lock(cs_db);
    blocks.clear();
    nCorrupt = 0;
    if (db == nullptr) {
        error = "database not open";
        return false;
    }

    std::unique_ptr<leveldb::Iterator> it(db->NewIterator(leveldb::ReadOptions()));
    for (it->Seek("b"); it->Valid(); it->Next()) {
        leveldb::Slice key = it->key();
        if (key.size() != 33 || key[0] != 'b') {
            break;
        }

        uint256 hash;
        memcpy(hash.begin(), key.data() + 1, 32);

        CBlock block;
        std::string recordError;
        if (!DecodeRecord(it->value().ToString(), &hash, block, recordError)) {
            LogPrintf(DB, WARN, "Skipping stored block %s: %s",
                      hash.GetHex().c_str(), recordError.c_str());
            nCorrupt++;
            continue;
        }
        blocks.push_back(std::move(block));
    }

    if (!it->status().ok()) {
        error = GetDBErrorMessage(it->status());
        return false;
    }
    return true;
}
