#include "ndnoise/config_parser.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace ndnoise {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
    return s;
}

/// Split on whitespace; views point into s
std::vector<std::string_view> tokenize(std::string_view s) {
    std::vector<std::string_view> tokens;
    size_t pos = 0;
    while (pos < s.size()) {
        while (pos < s.size() && isSpace(s[pos])) ++pos;
        size_t start = pos;
        while (pos < s.size() && !isSpace(s[pos])) ++pos;
        if (pos > start) {
            tokens.push_back(s.substr(start, pos - start));
        }
    }
    return tokens;
}

template <typename T>
std::optional<T> parseInteger(std::string_view token) {
    T value{};
    const char* first = token.data();
    const char* last = token.data() + token.size();
    if (!token.empty() && token.front() == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || first == last) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parseDouble(std::string_view token) {
    double value = 0.0;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    if (!token.empty() && token.front() == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || first == last) {
        return std::nullopt;
    }
    return value;
}

/// nullopt if any token is not a number
std::optional<std::vector<double>> parseDataLine(std::string_view line) {
    std::vector<double> numbers;
    for (auto token : tokenize(line)) {
        auto value = parseDouble(token);
        if (!value) {
            return std::nullopt;
        }
        numbers.push_back(*value);
    }
    return numbers;
}

std::string directoryOf(const std::string& path) {
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash == std::string::npos) {
        return {};
    }
    return path.substr(0, lastSlash + 1);
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

std::optional<int64_t> ConfigValue::asInt() const {
    return parseInteger<int64_t>(trim(text_));
}

std::optional<uint64_t> ConfigValue::asUnsigned() const {
    return parseInteger<uint64_t>(trim(text_));
}

std::optional<double> ConfigValue::asDouble() const {
    return parseDouble(trim(text_));
}

std::optional<std::vector<int64_t>> ConfigValue::asIntList() const {
    std::vector<int64_t> values;
    for (auto token : tokenize(text_)) {
        auto value = parseInteger<int64_t>(token);
        if (!value) {
            return std::nullopt;
        }
        values.push_back(*value);
    }
    return values;
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key) {
            return &(*it);
        }
    }
    return nullptr;
}

const ConfigEntry* ConfigDocument::get(std::string_view key, std::string_view suffix) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key && it->suffix == suffix) {
            return &(*it);
        }
    }
    return nullptr;
}

std::vector<const ConfigEntry*> ConfigDocument::getAll(std::string_view key) const {
    std::vector<const ConfigEntry*> result;
    for (const auto& entry : entries_) {
        if (entry.key == key) {
            result.push_back(&entry);
        }
    }
    return result;
}

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    return parseFileAt(path, 0);
}

ConfigDocument ConfigParser::parseString(std::string_view content,
                                         const std::string& basePath) const {
    return parseStringAt(content, basePath, 0);
}

std::optional<ConfigDocument> ConfigParser::parseFileAt(const std::string& path, int depth) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseStringAt(buffer.str(), directoryOf(path), depth);
}

ConfigDocument ConfigParser::parseStringAt(std::string_view content, const std::string& basePath,
                                           int depth) const {
    ConfigDocument doc;
    ConfigEntry current;
    int lineNumber = 0;

    std::string_view remaining = content;
    while (!remaining.empty()) {
        auto lineEnd = remaining.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = remaining;
            remaining = {};
        } else {
            line = remaining.substr(0, lineEnd);
            remaining = remaining.substr(lineEnd + 1);
        }
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        parseLine(line, ++lineNumber, current, doc, basePath, depth);
    }

    if (!current.key.empty()) {
        doc.addEntry(std::move(current));
    }
    return doc;
}

void ConfigParser::parseLine(std::string_view line, int lineNumber, ConfigEntry& current,
                             ConfigDocument& doc, const std::string& basePath, int depth) const {
    if (trim(line).empty()) {
        return;
    }

    // Indented lines are data for the current entry
    if (isSpace(line[0])) {
        if (current.key.empty()) {
            return;
        }
        auto numbers = parseDataLine(line);
        if (!numbers) {
            std::cerr << "[ConfigParser] WARNING: non-numeric data line " << lineNumber
                      << " under '" << current.key << "'\n";
            current.malformedDataLines.push_back(lineNumber);
        } else if (!numbers->empty()) {
            current.dataLines.push_back(std::move(*numbers));
        }
        return;
    }

    if (!current.key.empty()) {
        doc.addEntry(std::move(current));
    }
    current = ConfigEntry{};

    if (line[0] == '#') {
        return;
    }

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        current.key = std::string(trim(line));
        current.line = lineNumber;
        return;
    }

    current.key = std::string(trim(line.substr(0, colonPos)));
    current.line = lineNumber;

    auto rest = line.substr(colonPos + 1);
    auto secondColon = rest.find(':');
    if (secondColon != std::string_view::npos) {
        current.suffix = std::string(trim(rest.substr(0, secondColon)));
        rest = rest.substr(secondColon + 1);
    }
    rest = trim(rest);

    if (current.key == "include") {
        includeFile(rest, doc, basePath, depth);
        current = ConfigEntry{};
        return;
    }

    if (!rest.empty()) {
        current.value = ConfigValue(rest);
    }
}

void ConfigParser::includeFile(std::string_view includePath, ConfigDocument& doc,
                               const std::string& basePath, int depth) const {
    std::string path(includePath);
    if (depth + 1 > kMaxIncludeDepth) {
        std::cerr << "[ConfigParser] WARNING: include depth exceeded, skipping '"
                  << path << "'\n";
        return;
    }

    std::string resolved = includeResolver_ ? includeResolver_(path, basePath)
                                            : basePath + path;
    auto included = parseFileAt(resolved, depth + 1);
    if (!included) {
        std::cerr << "[ConfigParser] WARNING: cannot read include '" << resolved << "'\n";
        return;
    }
    for (const auto& entry : *included) {
        doc.addEntry(entry);
    }
}

}  // namespace ndnoise
