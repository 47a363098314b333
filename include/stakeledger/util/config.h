// StakeLedger - Configuration File Parser
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Parses INI-style configuration files and command-line options.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef STAKELEDGER_UTIL_CONFIG_H
#define STAKELEDGER_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stakeledger {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".stakeledger";

/// Default config file name (inside the data directory)
constexpr const char* DEFAULT_CONFIG_FILENAME = "stakeledger.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or "<command-line>"
    int lineNumber{0};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Manages configuration from files and command-line arguments.
 *
 * Command-line options take priority over the config file unless the
 * file is parsed with overwrite set.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file (~ and ${VAR} are expanded)
     * @param overwrite If false, keys already set from a non-default source are kept
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    /**
     * Parse command-line arguments.
     *
     * Options are "-key=value", "--key=value", "-key" (true) or "-nokey"
     * (false). Everything else is kept, in order, as a positional argument.
     */
    ConfigParseResult ParseCommandLine(int argc, char* argv[]);

    /// Positional (non-option) command-line arguments
    const std::vector<std::string>& GetArgs() const { return args_; }

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                             const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value; nullopt if missing or not a whole number
    std::optional<int64_t> TryGetInt(const std::string& key,
                                      const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                    const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Path value with ~ expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    /// Comma separated value, items trimmed, empty items dropped
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    // ========================================================================
    // Validation
    // ========================================================================

    /// Register an allowed key
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Warnings for keys that were never registered with AllowKey()
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    /// Data directory ("datadir" key, else the default)
    std::string GetDataDir() const;

    /// $HOME/.stakeledger
    static std::string GetDefaultDataDir();

    /// Expand ${VAR} and $VAR
    static std::string ExpandEnvVars(const std::string& value);

    /// Expand leading ~ to the home directory
    static std::string ExpandTilde(const std::string& path);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& stream, const std::string& source,
                                  bool overwrite);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, bool overwrite,
                   ConfigParseResult& result);

    void Store(const ConfigEntry& entry, bool overwrite);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
    std::vector<std::string> args_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* ADMIN = "admin";
    constexpr const char* LEDGERADDRESS = "ledgeraddress";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* LOGCATEGORIES = "logcategories";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* MOCKTIME = "mocktime";
}

} // namespace util
} // namespace stakeledger

#endif // STAKELEDGER_UTIL_CONFIG_H
