// AETHER - Configuration File Parser
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Parses INI-style configuration files and command-line options.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare "key" means key=true, a bare "nokey" means key=false
// - Environment variable expansion: ${VAR_NAME}
// - "include <path>" pulls in another file

#ifndef AETHER_UTIL_CONFIG_H
#define AETHER_UTIL_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aether {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".aether";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "aether.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Maximum include depth
constexpr int MAX_INCLUDE_DEPTH = 10;

/// Source name recorded for command-line entries
constexpr const char* COMMAND_LINE_SOURCE = "<command-line>";

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<string>" or "<command-line>"
    int lineNumber{0};
    bool isDefault{false};
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
 * Priority order (highest to lowest):
 * 1. Command-line arguments
 * 2. Config file(s), later files overriding earlier ones
 * 3. Values registered with SetDefault
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file (~ and ${VAR} are expanded)
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /**
     * Parse configuration from a string.
     *
     * @param content Config file content
     * @param sourceName Name for error messages
     * @return Parse result
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse command-line arguments.
     *
     * Options look like -key=value, --key=value, -flag or -noflag. Anything
     * not starting with '-' is kept, in order, as a positional argument.
     * A lone "--" ends option parsing.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

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

    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    /// Boolean value; nullopt if missing or unrecognized
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Path value with ~ expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    /// Full entry, for diagnostics (source file and line)
    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;

    /// Positional (non-option) command-line arguments
    const std::vector<std::string>& GetArgs() const { return args_; }

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically (command-line priority)
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a default value (lowest priority; never overrides an existing key)
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();

    size_t Size() const { return entries_.size(); }

    /// $HOME/.aether, or empty if HOME cannot be determined
    static std::string GetDefaultDataDir();

    static std::string ExpandEnvVars(const std::string& value);

    static std::string ExpandTilde(const std::string& path);

    static std::optional<bool> ParseBool(const std::string& str);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& stream, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    /// Store an entry unless a higher-priority one already holds the key
    void Store(ConfigEntry entry);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> args_;
    int includeDepth_{0};
};

} // namespace util
} // namespace aether

#endif // AETHER_UTIL_CONFIG_H
