// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <db/db_errors.h>

DBErrorType ClassifyDBError(const leveldb::Status& status) {
    if (status.ok()) {
        return DBErrorType::OK;
    }
    if (status.IsNotFound()) {
        return DBErrorType::NOT_FOUND;
    }
    if (status.IsCorruption()) {
        return DBErrorType::CORRUPTION;
    }
    if (status.IsIOError()) {
        return DBErrorType::IO_ERROR;
    }
    if (status.IsInvalidArgument()) {
        return DBErrorType::INVALID_ARGUMENT;
    }
    if (status.IsNotSupportedError()) {
        return DBErrorType::NOT_SUPPORTED;
    }
    return DBErrorType::UNKNOWN;
}

std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type) {
    std::string detail = status.ToString();
    switch (error_type) {
        case DBErrorType::OK:
            return "ok";
        case DBErrorType::NOT_FOUND:
            return "not found";
        case DBErrorType::CORRUPTION:
            // Both databases can be rebuilt: blocks from peers, encodings by re-plotting
            return detail + " (delete the database directory to rebuild it)";
        case DBErrorType::IO_ERROR:
            return detail + " (is another node using this datadir?)";
        case DBErrorType::INVALID_ARGUMENT:
        case DBErrorType::NOT_SUPPORTED:
        case DBErrorType::UNKNOWN:
            break;
    }
    return detail;
}
