#include "datamap/config_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace datamap {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::string canonicalPath(const std::string& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    return ec ? path : canonical.string();
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

std::optional<long long> ConfigValue::asInteger() const {
    if (text_.empty()) return std::nullopt;

    errno = 0;
    char* end;
    long long val = std::strtoll(text_.c_str(), &end, 10);
    if (end == text_.c_str() || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return val;
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
    // Later entries override earlier ones
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key) {
            return &(*it);
        }
    }
    return nullptr;
}

std::string_view ConfigDocument::getString(std::string_view key, std::string_view defaultVal) const {
    if (auto* entry = get(key)) {
        if (!entry->value.empty()) return entry->value.asString();
    }
    return defaultVal;
}

long long ConfigDocument::getInt(std::string_view key, long long defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asInteger().value_or(defaultVal);
    }
    return defaultVal;
}

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    std::vector<std::string> includeChain;
    return parseFile(path, includeChain);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    std::vector<std::string> includeChain;
    return parseContent(content, basePath, includeChain);
}

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path,
                                                      std::vector<std::string>& includeChain) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // Relative includes resolve against this file's directory
    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    includeChain.push_back(canonicalPath(path));
    ConfigDocument doc = parseContent(buffer.str(), basePath, includeChain);
    includeChain.pop_back();
    return doc;
}

ConfigDocument ConfigParser::parseContent(std::string_view content, const std::string& basePath,
                                          std::vector<std::string>& includeChain) const {
    ConfigDocument doc;
    int lineNum = 0;

    while (!content.empty()) {
        auto lineEnd = content.find('\n');
        std::string_view line = content.substr(0, lineEnd);
        content = lineEnd == std::string_view::npos ? std::string_view{} : content.substr(lineEnd + 1);
        ++lineNum;

        parseLine(line, lineNum, doc, basePath, includeChain);
    }

    return doc;
}

void ConfigParser::parseLine(std::string_view line, int lineNum, ConfigDocument& doc,
                             const std::string& basePath,
                             std::vector<std::string>& includeChain) const {
    line = trim(line);
    if (line.empty() || line[0] == '#') {
        return;
    }

    ConfigEntry entry;
    entry.line = lineNum;

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        // Bare key, no value
        entry.key = std::string(line);
        doc.addEntry(std::move(entry));
        return;
    }

    entry.key = std::string(trim(line.substr(0, colonPos)));
    auto rest = trim(line.substr(colonPos + 1));

    if (entry.key == "include") {
        std::string resolvedPath = basePath + std::string(rest);

        if (std::find(includeChain.begin(), includeChain.end(), canonicalPath(resolvedPath)) !=
            includeChain.end()) {
            std::cerr << "[ConfigParser] Line " << lineNum << ": include cycle through '"
                      << rest << "', skipped\n";
            return;
        }

        if (auto included = parseFile(resolvedPath, includeChain)) {
            for (const auto& includedEntry : *included) {
                doc.addEntry(includedEntry);
            }
        }
        return;
    }

    entry.value = ConfigValue(rest);
    doc.addEntry(std::move(entry));
}

}  // namespace datamap
