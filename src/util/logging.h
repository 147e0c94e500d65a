// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_UTIL_LOGGING_H
#define PLOTCHAIN_UTIL_LOGGING_H

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <memory>
#include <cstdint>

/**
 * Node-wide logging
 *
 * Every message carries a category and a level. Messages pass when their
 * category is enabled and their level is at or below the configured level.
 * Output goes to the console and, once Initialize() has run with a log file
 * configured, to a size-rotated log file (debug.log, debug.log.1, ...).
 */

/**
 * Log categories (Bitcoin Core style)
 */
enum class LogCategory : uint32_t {
    NONE = 0,
    NET = (1 << 0),           // Gossip relay and transports
    PLOT = (1 << 1),          // Plotter and plot store
    FARMING = (1 << 2),       // Evaluation loop
    CONSENSUS = (1 << 3),     // Fork choice, reorgs, confirmation
    VALIDATION = (1 << 4),    // Block and proof validation
    DB = (1 << 5),            // LevelDB storage
    ALL = 0xFFFFFFFF
};

/**
 * Log levels
 * Note: Using LVL_ prefix to avoid conflicts with the ERROR macro some
 * platform headers define
 */
enum class LogLevel {
    LVL_ERROR = 0,
    LVL_WARN = 1,
    LVL_INFO = 2,
    LVL_DEBUG = 3
};

/**
 * Logging configuration (process-wide)
 */
class CLoggingConfig {
public:
    static CLoggingConfig& GetInstance();

    void SetCategories(uint32_t mask) { m_enabledCategories.store(mask); }
    uint32_t GetCategories() const { return m_enabledCategories.load(); }
    bool IsCategoryEnabled(LogCategory category) const;

    void SetLogLevel(LogLevel level) { m_logLevel.store(level); }
    LogLevel GetLogLevel() const { return m_logLevel.load(); }

    // An empty path disables file logging
    void SetLogFile(const std::string& path);
    std::string GetLogFile() const;

    void SetConsoleLogging(bool enable) { m_consoleLogging.store(enable); }
    bool IsConsoleLoggingEnabled() const { return m_consoleLogging.load(); }

    // Rotation: the file is rotated once it reaches nMaxSize bytes and at
    // most nMaxFiles rotated copies are kept
    void SetRotation(size_t nMaxSize, size_t nMaxFiles);
    size_t GetMaxLogSize() const;
    size_t GetMaxLogFiles() const;

private:
    CLoggingConfig() = default;

    std::atomic<uint32_t> m_enabledCategories{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<LogLevel> m_logLevel{LogLevel::LVL_INFO};
    std::atomic<bool> m_consoleLogging{true};

    mutable std::mutex m_configMutex;
    std::string m_logFile;
    size_t m_maxLogSize{10 * 1024 * 1024};
    size_t m_maxLogFiles{5};
};

/**
 * Main logging class
 */
class CLogger {
public:
    static CLogger& GetInstance();

    /**
     * Open the configured log file. Relative log file paths are resolved
     * against datadir. Returns false if the file cannot be opened; console
     * logging continues either way.
     */
    bool Initialize(const std::string& datadir);

    /** Flush and close the log file */
    void Shutdown();

    void Log(LogCategory category, LogLevel level, const std::string& message);

    void LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...)
        __attribute__((format(printf, 4, 5)));

private:
    CLogger() = default;
    ~CLogger();

    void RotateLogIfNeeded();
    void WriteToFile(const std::string& line);

    std::mutex m_logMutex;
    std::unique_ptr<std::ofstream> m_logFile;
    std::string m_logPath;
    size_t m_currentLogSize{0};
};

#define LogPrintf(category, level, format, ...) \
    CLogger::GetInstance().LogPrintFormat(LogCategory::category, LogLevel::LVL_##level, format, ##__VA_ARGS__)

#define LogPrintNet(level, format, ...) LogPrintf(NET, level, format, ##__VA_ARGS__)
#define LogPrintPlot(level, format, ...) LogPrintf(PLOT, level, format, ##__VA_ARGS__)
#define LogPrintFarming(level, format, ...) LogPrintf(FARMING, level, format, ##__VA_ARGS__)
#define LogPrintConsensus(level, format, ...) LogPrintf(CONSENSUS, level, format, ##__VA_ARGS__)
#define LogPrintValidation(level, format, ...) LogPrintf(VALIDATION, level, format, ##__VA_ARGS__)

/** Parse "error", "warn", "info" or "debug" (case-insensitive). Returns false on anything else. */
bool ParseLogLevel(const std::string& str, LogLevel& level);

/**
 * Parse a comma-separated category list such as "net,plot". "all" and
 * "none" are accepted; unknown names make the whole list invalid.
 */
bool ParseLogCategories(const std::string& str, uint32_t& mask);

/** Category name as it appears in log lines, empty for NONE and ALL */
const char* GetLogCategoryName(LogCategory category);

/** "2025-01-01 12:00:00 [INFO] [PLOT] message" */
std::string FormatLogLine(LogCategory category, LogLevel level, const std::string& message);

#endif // PLOTCHAIN_UTIL_LOGGING_H
