// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

/**
 * Configuration file and environment variable support.
 * Reads plotchain.conf and allows PLOTCHAIN_* environment overrides.
 */

#ifndef PLOTCHAIN_UTIL_CONFIG_H
#define PLOTCHAIN_UTIL_CONFIG_H

#include <cstdint>
#include <string>
#include <map>
#include <vector>
#include <optional>

/**
 * Configuration file parser
 *
 * Supports:
 * - Key=value pairs (keys are case-insensitive)
 * - Comments (# and ;)
 * - Network sections: keys under [testnet] or [regtest] only apply when
 *   that section is active (see SetActiveSection)
 * - Repeated keys, returned in file order by GetList
 * - Environment variable overrides (PLOTCHAIN_<KEY>)
 */
class CConfigParser {
private:
    // key (or "section.key") -> values in file order
    std::map<std::string, std::vector<std::string>> m_settings;
    std::string m_config_file_path;
    std::string m_active_section;
    bool m_loaded;

    static std::string Trim(const std::string& str);
    static std::string ToLower(std::string str);

    // Parses one line. Section headers update current_section and return false.
    bool ParseLine(const std::string& line, std::string& current_section,
                   std::string& key, std::string& value);

    static std::optional<std::string> GetEnv(const std::string& name);

    // Looks up the section-qualified key first, then the plain key
    const std::vector<std::string>* Find(const std::string& key_lower) const;

public:
    CConfigParser();

    /**
     * Load configuration from file
     * @param file_path Path to plotchain.conf
     * @return true if loaded successfully (or file doesn't exist), false on error
     */
    bool LoadConfigFile(const std::string& file_path);

    /**
     * Parse configuration text directly (same syntax as the file)
     */
    void LoadConfigString(const std::string& text);

    /** Select the network section ("", "testnet", "regtest") whose keys take priority */
    void SetActiveSection(const std::string& section) { m_active_section = ToLower(section); }

    /**
     * Get string value
     * Priority: Environment variable > Active section > Config file > Default
     * For repeated keys the last value wins.
     */
    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    /**
     * Get boolean value
     * Supports: 1, 0, true, false, yes, no, on, off
     */
    bool GetBool(const std::string& key, bool default_value = false) const;

    /**
     * Get every value of a repeated key. A PLOTCHAIN_<KEY> environment
     * variable is split on commas and replaces the file values.
     */
    std::vector<std::string> GetList(const std::string& key) const;

    bool IsLoaded() const { return m_loaded; }

    std::string GetConfigFilePath() const { return m_config_file_path; }
};

/**
 * Get default config file path
 * @param datadir Data directory (if empty, uses default)
 * @return Path to plotchain.conf
 */
std::string GetConfigFilePath(const std::string& datadir = "");

/**
 * Get default data directory
 * @param network "main", "testnet" or "regtest"
 */
std::string GetDefaultDataDir(const std::string& network = "main");

#endif // PLOTCHAIN_UTIL_CONFIG_H
