// QUORUM - Configuration File Parser
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// INI-style configuration for the quorum tools.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare key is a true flag; "nokey" is a false flag
//
// Command line: -key=value, --key=value, -flag, -noflag. Anything not
// starting with '-' is collected as a positional argument.

#ifndef QUORUM_UTIL_CONFIG_H
#define QUORUM_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quorum {
namespace util {

/// Data directory name under $HOME
constexpr const char* DEFAULT_DATADIR_NAME = ".quorum";

/// Config file name inside the data directory
constexpr const char* DEFAULT_CONFIG_FILENAME = "quorum.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<command-line>" or "<default>"
    int lineNumber{0};
    bool isDefault{false};
};

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

    /// "file:line: message"
    std::string ToString() const;
};

/**
 * Configuration from files, the command line and built-in defaults.
 *
 * Priority (highest first): command line, config file, SetDefault values.
 * A file parsed with overwrite=false never replaces a value that already
 * came from the command line.
 */
class ConfigManager {
public:
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /// Positional (non-option) command-line arguments, in order
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

    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// nullopt for missing, negative or malformed values
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Value with a leading ~ expanded to $HOME
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Only takes effect if the key has no value yet
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    std::vector<std::string> GetKeys(const std::string& section = "") const;

    void Clear();
    size_t Size() const { return entries_.size(); }

    /// -datadir if given, otherwise $HOME/.quorum
    std::string GetDataDir() const;

    static std::string GetDefaultDataDir();
    static std::string ExpandTilde(const std::string& path);

    /// key=value lines (section-qualified keys as section.key)
    std::string Dump() const;

private:
    static std::string MakeKey(const std::string& key, const std::string& section);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    ConfigParseResult ParseStream(std::istream& in, const std::string& source, bool overwrite);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   bool overwrite, std::string& currentSection, ConfigParseResult& result);

    void Store(ConfigEntry entry, bool overwrite);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> args_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* MOCKTIME = "mocktime";

    // Governance
    constexpr const char* VOTINGWINDOW = "votingwindow";
    constexpr const char* MAJORITY = "majority";
    constexpr const char* OWNER = "owner";

    // Ledger
    constexpr const char* VAULT = "vault";
    constexpr const char* REGISTRATIONREWARD = "registrationreward";
}

} // namespace util
} // namespace quorum

#endif // QUORUM_UTIL_CONFIG_H
