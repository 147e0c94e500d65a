// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_NET_SERIALIZE_H
#define PLOTCHAIN_NET_SERIALIZE_H

#include <primitives/block.h>
#include <vector>
#include <cstring>
#include <stdexcept>

/**
 * CDataStream - Binary serialization buffer
 *
 * Integers are little-endian, hashes are written as their raw 32 bytes and
 * byte vectors carry a CompactSize length prefix. The same encoding is used
 * for gossip payloads, block hashes and block records in the block database.
 *
 * Reads past the end, and byte vectors longer than the caller allows, throw
 * std::runtime_error.
 */
class CDataStream {
private:
    std::vector<uint8_t> data;
    size_t read_pos;

    void WriteLE(uint64_t value, size_t nBytes) {
        for (size_t i = 0; i < nBytes; i++) {
            data.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }

    uint64_t ReadLE(size_t nBytes) {
        Require(nBytes);
        uint64_t value = 0;
        for (size_t i = 0; i < nBytes; i++) {
            value |= static_cast<uint64_t>(data[read_pos + i]) << (8 * i);
        }
        read_pos += nBytes;
        return value;
    }

    void Require(size_t len) const {
        if (len > data.size() - read_pos) {
            throw std::runtime_error("CDataStream: read past end");
        }
    }

public:
    CDataStream() : read_pos(0) {}

    explicit CDataStream(const std::vector<uint8_t>& data_in)
        : data(data_in), read_pos(0) {}

    size_t size() const { return data.size(); }
    bool eof() const { return read_pos >= data.size(); }
    const std::vector<uint8_t>& GetData() const { return data; }

    // --- Write Operations ---

    void write(const uint8_t* src, size_t len) {
        data.insert(data.end(), src, src + len);
    }

    void WriteUint8(uint8_t value) { data.push_back(value); }
    void WriteUint32(uint32_t value) { WriteLE(value, 4); }
    void WriteUint64(uint64_t value) { WriteLE(value, 8); }
    void WriteInt32(int32_t value) { WriteLE(static_cast<uint32_t>(value), 4); }
    void WriteUint256(const uint256& hash) { write(hash.data, 32); }

    // Bitcoin-style CompactSize: 1, 3, 5 or 9 bytes
    void WriteCompactSize(uint64_t value) {
        if (value < 253) {
            WriteUint8(static_cast<uint8_t>(value));
        } else if (value <= 0xFFFF) {
            WriteUint8(253);
            WriteLE(value, 2);
        } else if (value <= 0xFFFFFFFF) {
            WriteUint8(254);
            WriteLE(value, 4);
        } else {
            WriteUint8(255);
            WriteLE(value, 8);
        }
    }

    void WriteBytes(const std::vector<uint8_t>& bytes) {
        WriteCompactSize(bytes.size());
        write(bytes.data(), bytes.size());
    }

    // --- Read Operations ---

    void read(uint8_t* dst, size_t len) {
        Require(len);
        memcpy(dst, data.data() + read_pos, len);
        read_pos += len;
    }

    uint8_t ReadUint8() { return static_cast<uint8_t>(ReadLE(1)); }
    uint32_t ReadUint32() { return static_cast<uint32_t>(ReadLE(4)); }
    uint64_t ReadUint64() { return ReadLE(8); }
    int32_t ReadInt32() { return static_cast<int32_t>(ReadUint32()); }

    uint256 ReadUint256() {
        uint256 result;
        read(result.data, 32);
        return result;
    }

    uint64_t ReadCompactSize() {
        uint8_t first = ReadUint8();
        if (first < 253) {
            return first;
        } else if (first == 253) {
            return ReadLE(2);
        } else if (first == 254) {
            return ReadLE(4);
        }
        return ReadLE(8);
    }

    // Read a CompactSize-prefixed byte vector, rejecting lengths above max_len
    std::vector<uint8_t> ReadBytes(size_t max_len) {
        uint64_t len = ReadCompactSize();
        if (len > max_len) {
            throw std::runtime_error("CDataStream: byte vector too large");
        }
        Require(static_cast<size_t>(len));
        std::vector<uint8_t> result(data.begin() + read_pos, data.begin() + read_pos + len);
        read_pos += len;
        return result;
    }
};

#endif // PLOTCHAIN_NET_SERIALIZE_H
