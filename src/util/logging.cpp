// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <util/logging.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

struct CategoryName {
    LogCategory category;
    const char* name;
};

const CategoryName CATEGORY_NAMES[] = {
    {LogCategory::NET, "NET"},
    {LogCategory::PLOT, "PLOT"},
    {LogCategory::FARMING, "FARMING"},
    {LogCategory::CONSENSUS, "CONSENSUS"},
    {LogCategory::VALIDATION, "VALIDATION"},
    {LogCategory::DB, "DB"},
};

const char* GetLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::LVL_ERROR: return "ERROR";
        case LogLevel::LVL_WARN: return "WARN";
        case LogLevel::LVL_INFO: return "INFO";
        case LogLevel::LVL_DEBUG: return "DEBUG";
    }
    return "";
}

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string Trim(const std::string& str) {
    size_t begin = str.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t");
    return str.substr(begin, end - begin + 1);
}

} // anonymous namespace

// CLoggingConfig implementation
CLoggingConfig& CLoggingConfig::GetInstance() {
    static CLoggingConfig instance;
    return instance;
}

bool CLoggingConfig::IsCategoryEnabled(LogCategory category) const {
    // ALL messages are node-level and bypass category filtering
    if (category == LogCategory::ALL) {
        return true;
    }
    return (m_enabledCategories.load() & static_cast<uint32_t>(category)) != 0;
}

void CLoggingConfig::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_logFile = path;
}

std::string CLoggingConfig::GetLogFile() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_logFile;
}

void CLoggingConfig::SetRotation(size_t nMaxSize, size_t nMaxFiles) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_maxLogSize = nMaxSize;
    m_maxLogFiles = std::max<size_t>(nMaxFiles, 1);
}

size_t CLoggingConfig::GetMaxLogSize() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_maxLogSize;
}

size_t CLoggingConfig::GetMaxLogFiles() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_maxLogFiles;
}

// CLogger implementation
CLogger& CLogger::GetInstance() {
    static CLogger instance;
    return instance;
}

CLogger::~CLogger() {
    Shutdown();
}

bool CLogger::Initialize(const std::string& datadir) {
    std::string path = CLoggingConfig::GetInstance().GetLogFile();

    std::lock_guard<std::mutex> lock(m_logMutex);
    if (m_logFile) {
        return true;
    }
    if (path.empty()) {
        return true;
    }
    if (path[0] != '/' && !datadir.empty()) {
        path = datadir + "/" + path;
    }

    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "[Logger] Failed to open log file " << path << std::endl;
        return false;
    }
    file->seekp(0, std::ios::end);
    std::streamoff size = file->tellp();
    m_currentLogSize = size > 0 ? static_cast<size_t>(size) : 0;
    m_logFile = std::move(file);
    m_logPath = path;
    return true;
}

void CLogger::Shutdown() {
    std::lock_guard<std::mutex> lock(m_logMutex);
    if (m_logFile) {
        m_logFile->flush();
        m_logFile.reset();
    }
    m_logPath.clear();
    m_currentLogSize = 0;
}

void CLogger::Log(LogCategory category, LogLevel level, const std::string& message) {
    CLoggingConfig& config = CLoggingConfig::GetInstance();
    if (level > config.GetLogLevel() || !config.IsCategoryEnabled(category)) {
        return;
    }

    std::string line = FormatLogLine(category, level, message);

    std::lock_guard<std::mutex> lock(m_logMutex);
    if (config.IsConsoleLoggingEnabled()) {
        std::ostream& stream = (level == LogLevel::LVL_ERROR) ? std::cerr : std::cout;
        stream << line << std::endl;
    }
    if (m_logFile) {
        WriteToFile(line);
    }
}

void CLogger::LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...) {
    char buffer[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(category, level, std::string(buffer));
}

void CLogger::RotateLogIfNeeded() {
    CLoggingConfig& config = CLoggingConfig::GetInstance();
    if (m_currentLogSize < config.GetMaxLogSize()) {
        return;
    }

    m_logFile->flush();
    m_logFile.reset();

    // debug.log.N-1 -> debug.log.N, ..., debug.log -> debug.log.1
    size_t nMaxFiles = config.GetMaxLogFiles();
    for (size_t i = nMaxFiles; i > 0; i--) {
        std::string from = i == 1 ? m_logPath : m_logPath + "." + std::to_string(i - 1);
        std::string to = m_logPath + "." + std::to_string(i);
        if (std::rename(from.c_str(), to.c_str()) != 0 && errno != ENOENT) {
            std::cerr << "[Logger] Failed to rotate " << from << " (" << strerror(errno) << ")" << std::endl;
        }
    }

    m_logFile = std::make_unique<std::ofstream>(m_logPath, std::ios::trunc);
    m_currentLogSize = 0;
    if (!m_logFile->is_open()) {
        std::cerr << "[Logger] Cannot reopen " << m_logPath << " after rotation" << std::endl;
        m_logFile.reset();
    }
}

void CLogger::WriteToFile(const std::string& line) {
    RotateLogIfNeeded();
    if (!m_logFile) {
        return;
    }
    *m_logFile << line << '\n';
    m_logFile->flush();
    m_currentLogSize += line.size() + 1;
}

bool ParseLogLevel(const std::string& str, LogLevel& level) {
    std::string lower = ToLower(str);

    if (lower == "error") {
        level = LogLevel::LVL_ERROR;
    } else if (lower == "warn" || lower == "warning") {
        level = LogLevel::LVL_WARN;
    } else if (lower == "info") {
        level = LogLevel::LVL_INFO;
    } else if (lower == "debug") {
        level = LogLevel::LVL_DEBUG;
    } else {
        return false;
    }
    return true;
}

bool ParseLogCategories(const std::string& str, uint32_t& mask) {
    uint32_t result = 0;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        std::string name = ToLower(Trim(item));
        if (name.empty()) {
            continue;
        }
        if (name == "all") {
            result = static_cast<uint32_t>(LogCategory::ALL);
            continue;
        }
        if (name == "none") {
            continue;
        }
        bool fFound = false;
        for (const CategoryName& entry : CATEGORY_NAMES) {
            if (name == ToLower(entry.name)) {
                result |= static_cast<uint32_t>(entry.category);
                fFound = true;
                break;
            }
        }
        if (!fFound) {
            return false;
        }
    }
    mask = result;
    return true;
}

const char* GetLogCategoryName(LogCategory category) {
    for (const CategoryName& entry : CATEGORY_NAMES) {
        if (entry.category == category) {
            return entry.name;
        }
    }
    return "";
}

std::string FormatLogLine(LogCategory category, LogLevel level, const std::string& message) {
    std::ostringstream oss;

    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");

    oss << " [" << GetLevelName(level) << "]";

    const char* name = GetLogCategoryName(category);
    if (name[0] != '\0') {
        oss << " [" << name << "]";
    }

    oss << " " << message;
    return oss.str();
}
