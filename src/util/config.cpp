// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <util/config.h>
#include <util/logging.h>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

#ifndef _WIN32
    #include <unistd.h>
    #include <pwd.h>
    #include <sys/stat.h>
#endif

CConfigParser::CConfigParser() : m_loaded(false) {
}

std::string CConfigParser::Trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string CConfigParser::ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool CConfigParser::ParseLine(const std::string& line, std::string& current_section,
                              std::string& key, std::string& value) {
    std::string clean_line = line;
    size_t comment_pos = clean_line.find_first_of("#;");
    if (comment_pos != std::string::npos) {
        clean_line = clean_line.substr(0, comment_pos);
    }

    clean_line = Trim(clean_line);
    if (clean_line.empty()) {
        return false;
    }

    if (clean_line[0] == '[' && clean_line.back() == ']') {
        current_section = ToLower(Trim(clean_line.substr(1, clean_line.size() - 2)));
        // [main] is the same as no section
        if (current_section == "main") {
            current_section.clear();
        }
        return false;
    }

    size_t eq_pos = clean_line.find('=');
    if (eq_pos == std::string::npos) {
        LogPrintf(ALL, WARN, "Config: ignoring line without '=': %s", clean_line.c_str());
        return false;
    }

    key = ToLower(Trim(clean_line.substr(0, eq_pos)));
    value = Trim(clean_line.substr(eq_pos + 1));

    if (value.length() >= 2 && value[0] == '"' && value.back() == '"') {
        value = value.substr(1, value.length() - 2);
    }

    if (!current_section.empty()) {
        key = current_section + "." + key;
    }

    return !key.empty();
}

std::optional<std::string> CConfigParser::GetEnv(const std::string& name) {
    const char* env_value = std::getenv(name.c_str());
    if (env_value == nullptr) {
        return std::nullopt;
    }
    return std::string(env_value);
}

const std::vector<std::string>* CConfigParser::Find(const std::string& key_lower) const {
    if (!m_active_section.empty()) {
        auto it = m_settings.find(m_active_section + "." + key_lower);
        if (it != m_settings.end() && !it->second.empty()) {
            return &it->second;
        }
    }
    auto it = m_settings.find(key_lower);
    if (it != m_settings.end() && !it->second.empty()) {
        return &it->second;
    }
    return nullptr;
}

void CConfigParser::LoadConfigString(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    std::string section;
    while (std::getline(stream, line)) {
        std::string key, value;
        if (ParseLine(line, section, key, value)) {
            m_settings[key].push_back(value);
            LogPrintf(ALL, DEBUG, "Config: %s = %s", key.c_str(), value.c_str());
        }
    }
    m_loaded = true;
}

bool CConfigParser::LoadConfigFile(const std::string& file_path) {
    m_config_file_path = file_path;
    m_settings.clear();
    m_loaded = false;

#ifndef _WIN32
    struct stat file_stat;
    if (stat(file_path.c_str(), &file_stat) == 0 && !S_ISREG(file_stat.st_mode)) {
        LogPrintf(ALL, ERROR, "Config path %s is not a regular file", file_path.c_str());
        return false;
    }
#endif

    std::ifstream file(file_path);
    if (!file.is_open()) {
        LogPrintf(ALL, DEBUG, "Config file not found: %s (using defaults)", file_path.c_str());
        m_loaded = true;
        return true;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        LogPrintf(ALL, ERROR, "Failed to read config file %s", file_path.c_str());
        return false;
    }

    LoadConfigString(buffer.str());
    if (!m_settings.empty()) {
        LogPrintf(ALL, INFO, "Loaded configuration from %s (%zu keys)",
                  file_path.c_str(), m_settings.size());
    }
    return true;
}

std::string CConfigParser::GetString(const std::string& key, const std::string& default_value) const {
    std::string env_key = "PLOTCHAIN_" + key;
    std::transform(env_key.begin(), env_key.end(), env_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    auto env_value = GetEnv(env_key);
    if (env_value.has_value()) {
        LogPrintf(ALL, DEBUG, "Config: %s = %s (from environment)",
                  key.c_str(), env_value->c_str());
        return *env_value;
    }

    const std::vector<std::string>* values = Find(ToLower(key));
    if (values != nullptr) {
        return values->back();
    }

    return default_value;
}

int64_t CConfigParser::GetInt64(const std::string& key, int64_t default_value) const {
    std::string value = GetString(key, "");
    if (value.empty()) {
        return default_value;
    }

    try {
        size_t consumed = 0;
        int64_t parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        LogPrintf(ALL, WARN, "Config: Invalid integer value for %s: %s (using default: %lld)",
                  key.c_str(), value.c_str(), static_cast<long long>(default_value));
        return default_value;
    }
}

bool CConfigParser::GetBool(const std::string& key, bool default_value) const {
    std::string value = ToLower(GetString(key, ""));
    if (value.empty()) {
        return default_value;
    }

    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }

    LogPrintf(ALL, WARN, "Config: Invalid boolean value for %s: %s (using default: %s)",
              key.c_str(), value.c_str(), default_value ? "true" : "false");
    return default_value;
}

std::vector<std::string> CConfigParser::GetList(const std::string& key) const {
    std::vector<std::string> result;

    std::string env_key = "PLOTCHAIN_" + key;
    std::transform(env_key.begin(), env_key.end(), env_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    auto env_value = GetEnv(env_key);
    if (env_value.has_value()) {
        std::stringstream ss(*env_value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
        return result;
    }

    const std::vector<std::string>* values = Find(ToLower(key));
    if (values != nullptr) {
        result = *values;
    }
    return result;
}

std::string GetDefaultDataDir(const std::string& network) {
    std::string suffix = (network.empty() || network == "main") ? "" : "-" + network;

    const char* home = std::getenv("HOME");
#ifndef _WIN32
    if (home == nullptr) {
        struct passwd* pwd = getpwuid(getuid());
        if (pwd != nullptr) {
            home = pwd->pw_dir;
        }
    }
#endif

    if (home != nullptr) {
        return std::string(home) + "/.plotchain" + suffix;
    }
    return ".plotchain" + suffix;
}

std::string GetConfigFilePath(const std::string& datadir) {
    std::string dir = datadir.empty() ? GetDefaultDataDir() : datadir;
    return dir + "/plotchain.conf";
}
