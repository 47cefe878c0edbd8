#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ndnoise {

// ============================================================================
// ConfigValue - A parsed configuration value
// ============================================================================

/**
 * @brief Text following the colon of a config entry
 *
 * Numeric accessors are strict: the whole value must parse, otherwise they
 * return nullopt.
 */
class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}

    [[nodiscard]] std::string_view asString() const { return text_; }

    [[nodiscard]] std::optional<int64_t> asInt() const;
    [[nodiscard]] std::optional<uint64_t> asUnsigned() const;
    [[nodiscard]] std::optional<double> asDouble() const;

    /// Whitespace-separated integers, e.g. "16 16 8"
    [[nodiscard]] std::optional<std::vector<int64_t>> asIntList() const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

// ============================================================================
// ConfigEntry - A key-value pair with optional suffix and data lines
// ============================================================================

/**
 * @brief A configuration entry
 *
 * Represents entries like:
 *   key: value
 *   key:suffix: value
 *   key:
 *       1 2 3
 */
struct ConfigEntry {
    std::string key;
    std::string suffix;
    ConfigValue value;
    std::vector<std::vector<double>> dataLines;  // Indented numeric lines
    std::vector<int> malformedDataLines;         // Indented lines with a non-numeric token
    int line = 0;                                // 1-based source line of the key

    [[nodiscard]] bool hasSuffix() const { return !suffix.empty(); }
    [[nodiscard]] bool hasData() const { return !dataLines.empty(); }
};

// ============================================================================
// ConfigDocument - A parsed configuration file
// ============================================================================

/// Entries in file order; lookups return the last match so later entries
/// (including those pulled in after an include) override earlier ones.
class ConfigDocument {
public:
    void addEntry(ConfigEntry entry);

    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;
    [[nodiscard]] const ConfigEntry* get(std::string_view key, std::string_view suffix) const;
    [[nodiscard]] std::vector<const ConfigEntry*> getAll(std::string_view key) const;

    [[nodiscard]] const std::vector<ConfigEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<ConfigEntry> entries_;
};

// ============================================================================
// ConfigParser - Parses configuration text
// ============================================================================

/**
 * @brief Parser for line-based configuration files
 *
 * Format:
 * ```
 * # Comments start with #
 * seed: 123
 * grid_size: 16 16
 * key:suffix: value
 * grid_size:
 *     16 16
 * include: other.conf
 * ```
 *
 * Include paths are resolved relative to the including file unless an
 * include resolver is set. Includes nest at most kMaxIncludeDepth deep.
 */
class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string& includePath,
                                                      const std::string& basePath)>;

    static constexpr int kMaxIncludeDepth = 8;

    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /// @return Parsed document, or nullopt if the file cannot be read
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    std::optional<ConfigDocument> parseFileAt(const std::string& path, int depth) const;
    ConfigDocument parseStringAt(std::string_view content, const std::string& basePath,
                                 int depth) const;

    void parseLine(std::string_view line, int lineNumber, ConfigEntry& current,
                   ConfigDocument& doc, const std::string& basePath, int depth) const;
    void includeFile(std::string_view includePath, ConfigDocument& doc,
                     const std::string& basePath, int depth) const;

    IncludeResolver includeResolver_;
};

}  // namespace ndnoise
