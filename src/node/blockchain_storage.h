// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_NODE_BLOCKCHAIN_STORAGE_H
#define PLOTCHAIN_NODE_BLOCKCHAIN_STORAGE_H

#include <db/db_errors.h>
#include <primitives/block.h>

#include <leveldb/db.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * Block database
 *
 * Every accepted block (canonical or not) is stored under 'b' || hash as
 *
 *   [VERSION u32][DATA_LENGTH u32][DATA][SHA3-256(DATA)]
 *
 * where DATA is the serialized block including its declared cumulative
 * weight. The canonical tip hash lives under 'B'. Writes are synced.
 */
class CBlockchainDB
{
private:
    std::unique_ptr<leveldb::DB> db;
    mutable std::mutex cs_db;
    std::string datadir;

    static std::string BlockKey(const uint256& hash);
    bool DecodeRecord(const std::string& value, const uint256* expectedHash,
                      CBlock& block, std::string& error) const;

public:
    CBlockchainDB();
    ~CBlockchainDB();

    CBlockchainDB(const CBlockchainDB&) = delete;
    CBlockchainDB& operator=(const CBlockchainDB&) = delete;

    bool Open(const std::string& path, std::string& error);
    void Close();
    bool IsOpen() const;

    bool WriteBlock(const CBlock& block);
    bool ReadBlock(const uint256& hash, CBlock& block, std::string& error) const;
    bool BlockExists(const uint256& hash) const;

    bool WriteBestBlock(const uint256& hash);

    /** @return false if no tip was ever written or it cannot be read */
    bool ReadBestBlock(uint256& hash) const;

    /**
     * Read every stored block.
     *
     * Records that fail their checksum are skipped and counted; an iterator
     * error fails the whole load.
     */
    bool LoadAllBlocks(std::vector<CBlock>& blocks, size_t& nCorrupt, std::string& error) const;
};

#endif // PLOTCHAIN_NODE_BLOCKCHAIN_STORAGE_H
