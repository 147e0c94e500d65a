// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_DB_DB_ERRORS_H
#define PLOTCHAIN_DB_DB_ERRORS_H

#include <leveldb/status.h>
#include <string>

/**
 * LevelDB status classification shared by the plot store and the block
 * database. Callers map the class onto their own result codes; the plot
 * store, for one, reports CORRUPTION as a corrupt entry to be re-plotted.
 */
enum class DBErrorType {
    OK,
    CORRUPTION,            // on-disk data failed LevelDB's own checks
    IO_ERROR,              // disk full, permission denied, lock held...
    NOT_FOUND,
    INVALID_ARGUMENT,
    NOT_SUPPORTED,
    UNKNOWN
};

DBErrorType ClassifyDBError(const leveldb::Status& status);

/** Human-readable message including a recovery hint */
std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type);

inline std::string GetDBErrorMessage(const leveldb::Status& status) {
    return GetDBErrorMessage(status, ClassifyDBError(status));
}

#endif // PLOTCHAIN_DB_DB_ERRORS_H
