#pragma once

/**
 * @file config_parser.hpp
 * @brief Line-based `key: value` configuration files with includes
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace datamap {

// ============================================================================
// ConfigValue - A parsed configuration value
// ============================================================================

class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}

    [[nodiscard]] std::string_view asString() const { return text_; }

    // Returns nullopt if the text is not entirely an integer
    [[nodiscard]] std::optional<long long> asInteger() const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

struct ConfigEntry {
    std::string key;
    ConfigValue value;
    int line = 0;   // 1-based line in the file that defined it
};

// ============================================================================
// ConfigDocument - A parsed configuration file
// ============================================================================

/**
 * @brief Entries from a config file, in order
 *
 * A key may appear more than once; simple lookups return the last one,
 * so later lines (and later includes) override earlier ones.
 */
class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    // Last entry with this key, or nullptr
    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;

    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;
    [[nodiscard]] long long getInt(std::string_view key, long long defaultVal = 0) const;

    [[nodiscard]] const std::vector<ConfigEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<ConfigEntry> entries_;
};

// ============================================================================
// ConfigParser - Parses configuration files
// ============================================================================

/**
 * @brief Parser for simple line-based configuration files
 *
 * Format:
 * ```
 * # Comments start with #
 * name_collision: reject
 * first_id: 1
 * include: local.conf
 * ```
 *
 * `include:` pulls in another file at that point, resolved relative to the
 * including file. Missing includes are skipped, and so is an include of a
 * file that is already being parsed further up the include chain.
 */
class ConfigParser {
public:
    ConfigParser() = default;

    /**
     * @brief Parse a configuration file
     * @return Parsed document, or nullopt if the file cannot be opened
     */
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    /**
     * @brief Parse configuration from a string
     * @param basePath Directory prefix for relative includes
     */
    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    // includeChain holds the canonical paths of the files being parsed
    std::optional<ConfigDocument> parseFile(const std::string& path,
                                            std::vector<std::string>& includeChain) const;
    ConfigDocument parseContent(std::string_view content, const std::string& basePath,
                                std::vector<std::string>& includeChain) const;
    void parseLine(std::string_view line, int lineNum, ConfigDocument& doc,
                   const std::string& basePath, std::vector<std::string>& includeChain) const;
};

}  // namespace datamap
