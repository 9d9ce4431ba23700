#pragma once
// =============================================================================
// MFCONV - Configuration File Parser
// Version: 1.2.0
// INI file support: [section] headers, key = value or key: value,
// '#' and ';' comments, optional surrounding quotes on values
// =============================================================================

#include "mfconv/common/types.hpp"
#include "mfconv/common/error.hpp"
#include <map>

namespace mfconv::config {

// =============================================================================
// Configuration Value
// =============================================================================

class ConfigValue {
private:
    String value_;

public:
    ConfigValue() = default;
    explicit ConfigValue(String value) : value_(std::move(value)) {}

    [[nodiscard]] const String& str() const { return value_; }
    [[nodiscard]] bool empty() const { return value_.empty(); }

    [[nodiscard]] Result<Int64> to_int() const;
    [[nodiscard]] Result<bool> to_bool() const;

    [[nodiscard]] Int64 to_int_or(Int64 default_val) const;
    [[nodiscard]] bool to_bool_or(bool default_val) const;
    [[nodiscard]] String to_string_or(StringView default_val) const;
};

// =============================================================================
// Configuration Section
// =============================================================================

class ConfigSection {
private:
    String name_;
    std::map<String, ConfigValue, std::less<>> values_;

public:
    ConfigSection() = default;
    explicit ConfigSection(String name) : name_(std::move(name)) {}

    [[nodiscard]] const String& name() const { return name_; }

    [[nodiscard]] bool has(StringView key) const;
    [[nodiscard]] const ConfigValue& get(StringView key) const;

    [[nodiscard]] String get_string(StringView key, StringView default_val = "") const;
    [[nodiscard]] Int64 get_int(StringView key, Int64 default_val = 0) const;
    [[nodiscard]] bool get_bool(StringView key, bool default_val = false) const;

    void set(StringView key, StringView value);
    void remove(StringView key);

    [[nodiscard]] Vector<String> keys() const;
    [[nodiscard]] Size size() const { return values_.size(); }
    [[nodiscard]] bool empty() const { return values_.empty(); }

    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }
};

// =============================================================================
// Configuration File
// =============================================================================

class ConfigFile {
private:
    Path filepath_;
    String default_section_name_ = "default";
    std::map<String, ConfigSection, std::less<>> sections_;

    void parse_line(StringView line, String& current_section);

public:
    ConfigFile() = default;

    [[nodiscard]] Result<void> load(const Path& path);
    void parse(StringView content);
    [[nodiscard]] Result<void> save(const Path& path) const;

    [[nodiscard]] const Path& path() const { return filepath_; }
    [[nodiscard]] bool is_loaded() const { return !filepath_.empty(); }

    [[nodiscard]] bool has_section(StringView name) const;
    [[nodiscard]] ConfigSection& section(StringView name);
    [[nodiscard]] const ConfigSection& section(StringView name) const;
    ConfigSection& add_section(StringView name);

    // Keys before the first [section] header land in the default section
    [[nodiscard]] const ConfigSection& default_section() const;

    [[nodiscard]] bool has(StringView section, StringView key) const;
    [[nodiscard]] String get_string(StringView section, StringView key, StringView default_val = "") const;
    [[nodiscard]] Int64 get_int(StringView section, StringView key, Int64 default_val = 0) const;
    [[nodiscard]] bool get_bool(StringView section, StringView key, bool default_val = false) const;

    void set(StringView section, StringView key, StringView value);

    [[nodiscard]] Vector<String> section_names() const;
    [[nodiscard]] Size section_count() const { return sections_.size(); }

    [[nodiscard]] String to_string() const;
};

// =============================================================================
// Factory Functions
// =============================================================================

// CONFIG_FILE_NOT_FOUND when the file cannot be opened
[[nodiscard]] Result<ConfigFile> load_config(const Path& path);

[[nodiscard]] Result<ConfigFile> parse_config(StringView content);

} // namespace mfconv::config
