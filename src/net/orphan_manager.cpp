// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <net/orphan_manager.h>

#include <util/logging.h>

#include <iostream>

constexpr size_t COrphanManager::MAX_ORPHAN_BLOCKS;
constexpr size_t COrphanManager::MAX_ORPHAN_BYTES;
constexpr size_t COrphanManager::MAX_ORPHANS_PER_SOURCE;

COrphanManager::COrphanManager()
    : nOrphanBytes(0), nNextSequence(0)
{
}

bool COrphanManager::AddOrphanBlock(SourceId source, const CBlock& block)
{
    std::lock_guard<std::mutex> lock(cs_orphans);

    uint256 hash = block.GetHash();
    if (mapOrphanBlocks.count(hash) > 0) {
        return true;
    }

    auto itSource = mapOrphanBlocksBySource.find(source);
    if (itSource != mapOrphanBlocksBySource.end() && itSource->second.size() >= MAX_ORPHANS_PER_SOURCE) {
        LogPrintNet(WARN, "Source %d exceeded orphan limit (%zu)", source, MAX_ORPHANS_PER_SOURCE);
        return false;
    }

    size_t blockSize = block.GetSerializedSize();
    if (blockSize > MAX_ORPHAN_BYTES) {
        return false;
    }

    mapOrphanBlocks.emplace(
        std::piecewise_construct,
        std::forward_as_tuple(hash),
        std::forward_as_tuple(block, source, blockSize, nNextSequence++)
    );
    mapOrphanBlocksByPrev.emplace(block.hashPrevBlock, hash);
    mapOrphanBlocksBySource[source].insert(hash);
    nOrphanBytes += blockSize;

    LimitOrphans();
    return true;
}

bool COrphanManager::HaveOrphanBlock(const uint256& hash) const
{
    std::lock_guard<std::mutex> lock(cs_orphans);
    return mapOrphanBlocks.count(hash) > 0;
}

bool COrphanManager::GetOrphanBlock(const uint256& hash, CBlock& block) const
{
    std::lock_guard<std::mutex> lock(cs_orphans);
    auto it = mapOrphanBlocks.find(hash);
    if (it == mapOrphanBlocks.end()) {
        return false;
    }
    block = it->second.block;
    return true;
}

bool COrphanManager::EraseOrphanBlock(const uint256& hash)
{
    std::lock_guard<std::mutex> lock(cs_orphans);
    auto it = mapOrphanBlocks.find(hash);
    if (it == mapOrphanBlocks.end()) {
        return false;
    }
    EraseOrphanInternal(it);
    return true;
}

std::vector<uint256> COrphanManager::GetOrphanChildren(const uint256& parentHash) const
{
    std::lock_guard<std::mutex> lock(cs_orphans);
    std::vector<uint256> children;
    auto range = mapOrphanBlocksByPrev.equal_range(parentHash);
    for (auto it = range.first; it != range.second; ++it) {
        children.push_back(it->second);
    }
    return children;
}

size_t COrphanManager::EraseOrphansForSource(SourceId source)
{
    std::lock_guard<std::mutex> lock(cs_orphans);

    auto it = mapOrphanBlocksBySource.find(source);
    if (it == mapOrphanBlocksBySource.end()) {
        return 0;
    }

    // Copy: EraseOrphanInternal edits the source index
    std::set<uint256> orphansToErase = it->second;
    size_t count = 0;
    for (const uint256& hash : orphansToErase) {
        auto orphanIt = mapOrphanBlocks.find(hash);
        if (orphanIt != mapOrphanBlocks.end()) {
            EraseOrphanInternal(orphanIt);
            count++;
        }
    }
    return count;
}

size_t COrphanManager::GetOrphanCountForSource(SourceId source) const
{
    std::lock_guard<std::mutex> lock(cs_orphans);
    auto it = mapOrphanBlocksBySource.find(source);
    return it == mapOrphanBlocksBySource.end() ? 0 : it->second.size();
}

size_t COrphanManager::EraseExpiredOrphans(std::chrono::seconds maxAge)
{
    return EraseExpiredOrphans(maxAge, Clock::now());
}

size_t COrphanManager::EraseExpiredOrphans(std::chrono::seconds maxAge, Clock::time_point now)
{
    std::lock_guard<std::mutex> lock(cs_orphans);

    size_t count = 0;
    for (auto it = mapOrphanBlocks.begin(); it != mapOrphanBlocks.end(); ) {
        auto next = std::next(it);
        if (now - it->second.timeReceived > maxAge) {
            EraseOrphanInternal(it);
            count++;
        }
        it = next;
    }

    if (count > 0) {
        LogPrintNet(INFO, "Dropped %zu orphan block(s) whose parent never arrived", count);
    }
    return count;
}

size_t COrphanManager::GetOrphanCount() const
{
    std::lock_guard<std::mutex> lock(cs_orphans);
    return mapOrphanBlocks.size();
}

size_t COrphanManager::GetOrphanBytes() const
{
    std::lock_guard<std::mutex> lock(cs_orphans);
    return nOrphanBytes;
}

void COrphanManager::Clear()
{
    std::lock_guard<std::mutex> lock(cs_orphans);
    mapOrphanBlocks.clear();
    mapOrphanBlocksByPrev.clear();
    mapOrphanBlocksBySource.clear();
    nOrphanBytes = 0;
}

void COrphanManager::LimitOrphans()
{
    while (!mapOrphanBlocks.empty() &&
           (mapOrphanBlocks.size() > MAX_ORPHAN_BLOCKS || nOrphanBytes > MAX_ORPHAN_BYTES)) {
        auto victim = SelectOrphanForEviction();
        std::cout << "[OrphanManager] Evicting oldest orphan "
                  << victim->first.GetHex().substr(0, 16) << std::endl;
        EraseOrphanInternal(victim);
    }
}

std::map<uint256, COrphanManager::COrphanBlock>::iterator COrphanManager::SelectOrphanForEviction()
{
    auto oldest = mapOrphanBlocks.begin();
    for (auto it = mapOrphanBlocks.begin(); it != mapOrphanBlocks.end(); ++it) {
        if (it->second.nSequence < oldest->second.nSequence) {
            oldest = it;
        }
    }
    return oldest;
}

void COrphanManager::EraseOrphanInternal(std::map<uint256, COrphanBlock>::iterator it)
{
    const uint256 hash = it->first;
    const COrphanBlock& orphan = it->second;

    auto range = mapOrphanBlocksByPrev.equal_range(orphan.block.hashPrevBlock);
    for (auto prevIt = range.first; prevIt != range.second; ) {
        if (prevIt->second == hash) {
            prevIt = mapOrphanBlocksByPrev.erase(prevIt);
        } else {
            ++prevIt;
        }
    }

    auto sourceIt = mapOrphanBlocksBySource.find(orphan.source);
    if (sourceIt != mapOrphanBlocksBySource.end()) {
        sourceIt->second.erase(hash);
        if (sourceIt->second.empty()) {
            mapOrphanBlocksBySource.erase(sourceIt);
        }
    }

    nOrphanBytes -= orphan.nBlockSize;
    mapOrphanBlocks.erase(it);
}
