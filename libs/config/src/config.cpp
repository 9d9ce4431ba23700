// =============================================================================
// MFCONV - Configuration File Parser Implementation
// Version: 1.2.0
// =============================================================================

#include <mfconv/config/config.hpp>
#include <fstream>
#include <sstream>
#include <algorithm>

namespace mfconv::config {

namespace {

bool is_true_value(StringView sv) {
    String lower = to_lower(sv);
    return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

bool is_false_value(StringView sv) {
    String lower = to_lower(sv);
    return lower == "false" || lower == "no" || lower == "off" || lower == "0";
}

String strip_quotes(String value) {
    if (value.size() >= 2) {
        if ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

} // anonymous namespace

// =============================================================================
// ConfigValue Implementation
// =============================================================================

Result<Int64> ConfigValue::to_int() const {
    if (value_.empty()) {
        return make_error<Int64>(ErrorCode::CONFIG_INVALID_VALUE, "Empty value");
    }
    auto parsed = parse_int64(value_);
    if (!parsed) {
        return make_error<Int64>(ErrorCode::CONFIG_INVALID_VALUE,
            "Invalid integer format: " + value_);
    }
    return *parsed;
}

Result<bool> ConfigValue::to_bool() const {
    if (is_true_value(value_)) return true;
    if (is_false_value(value_)) return false;
    return make_error<bool>(ErrorCode::CONFIG_INVALID_VALUE, "Cannot parse boolean: " + value_);
}

Int64 ConfigValue::to_int_or(Int64 default_val) const {
    auto result = to_int();
    return result.is_success() ? result.value() : default_val;
}

bool ConfigValue::to_bool_or(bool default_val) const {
    auto result = to_bool();
    return result.is_success() ? result.value() : default_val;
}

String ConfigValue::to_string_or(StringView default_val) const {
    return value_.empty() ? String(default_val) : value_;
}

// =============================================================================
// ConfigSection Implementation
// =============================================================================

static const ConfigValue EMPTY_VALUE;

bool ConfigSection::has(StringView key) const {
    return values_.find(key) != values_.end();
}

const ConfigValue& ConfigSection::get(StringView key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : EMPTY_VALUE;
}

String ConfigSection::get_string(StringView key, StringView default_val) const {
    return get(key).to_string_or(default_val);
}

Int64 ConfigSection::get_int(StringView key, Int64 default_val) const {
    return get(key).to_int_or(default_val);
}

bool ConfigSection::get_bool(StringView key, bool default_val) const {
    return get(key).to_bool_or(default_val);
}

void ConfigSection::set(StringView key, StringView value) {
    values_[String(key)] = ConfigValue(String(value));
}

void ConfigSection::remove(StringView key) {
    auto it = values_.find(key);
    if (it != values_.end()) {
        values_.erase(it);
    }
}

Vector<String> ConfigSection::keys() const {
    Vector<String> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigFile Implementation
// =============================================================================

void ConfigFile::parse_line(StringView line, String& current_section) {
    String trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return;
    }

    // Section header [section]
    if (trimmed[0] == '[' && trimmed.back() == ']') {
        current_section = trim(StringView(trimmed).substr(1, trimmed.size() - 2));
        if (!has_section(current_section)) {
            add_section(current_section);
        }
        return;
    }

    // key=value or key:value
    size_t eq_pos = trimmed.find('=');
    size_t colon_pos = trimmed.find(':');
    size_t sep_pos = std::min(eq_pos, colon_pos);

    if (sep_pos != String::npos) {
        String key = trim(StringView(trimmed).substr(0, sep_pos));
        String value = strip_quotes(trim(StringView(trimmed).substr(sep_pos + 1)));
        section(current_section).set(key, value);
    }
}

void ConfigFile::parse(StringView content) {
    sections_.clear();

    String current_section = default_section_name_;
    add_section(current_section);

    for (const auto& line : split_lines(content)) {
        parse_line(line, current_section);
    }
}

Result<void> ConfigFile::load(const Path& path) {
    std::ifstream file(path);
    if (!file) {
        return make_error<void>(ErrorCode::CONFIG_FILE_NOT_FOUND,
            "Cannot open config file: " + path.string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    parse(ss.str());
    filepath_ = path;
    return {};
}

Result<void> ConfigFile::save(const Path& path) const {
    std::ofstream file(path);
    if (!file) {
        return make_error<void>(ErrorCode::IO_ERROR,
            "Cannot create config file: " + path.string());
    }

    file << to_string();
    if (!file) {
        return make_error<void>(ErrorCode::WRITE_ERROR,
            "Failed writing config file: " + path.string());
    }
    return {};
}

bool ConfigFile::has_section(StringView name) const {
    return sections_.find(name) != sections_.end();
}

static const ConfigSection EMPTY_SECTION;

ConfigSection& ConfigFile::section(StringView name) {
    auto it = sections_.find(name);
    if (it == sections_.end()) {
        return add_section(name);
    }
    return it->second;
}

const ConfigSection& ConfigFile::section(StringView name) const {
    auto it = sections_.find(name);
    return it != sections_.end() ? it->second : EMPTY_SECTION;
}

ConfigSection& ConfigFile::add_section(StringView name) {
    auto [it, _] = sections_.try_emplace(String(name), String(name));
    return it->second;
}

const ConfigSection& ConfigFile::default_section() const {
    return section(default_section_name_);
}

bool ConfigFile::has(StringView section_name, StringView key) const {
    return section(section_name).has(key);
}

String ConfigFile::get_string(StringView section_name, StringView key, StringView default_val) const {
    return section(section_name).get_string(key, default_val);
}

Int64 ConfigFile::get_int(StringView section_name, StringView key, Int64 default_val) const {
    return section(section_name).get_int(key, default_val);
}

bool ConfigFile::get_bool(StringView section_name, StringView key, bool default_val) const {
    return section(section_name).get_bool(key, default_val);
}

void ConfigFile::set(StringView section_name, StringView key, StringView value) {
    section(section_name).set(key, value);
}

Vector<String> ConfigFile::section_names() const {
    Vector<String> result;
    result.reserve(sections_.size());
    for (const auto& [name, _] : sections_) {
        result.push_back(name);
    }
    return result;
}

String ConfigFile::to_string() const {
    std::ostringstream oss;

    // Default section first, without a header
    const auto& def = default_section();
    for (const auto& [key, value] : def) {
        oss << key << " = " << value.str() << "\n";
    }
    if (!def.empty()) oss << "\n";

    for (const auto& [name, sec] : sections_) {
        if (name == default_section_name_ || sec.empty()) continue;

        oss << "[" << name << "]\n";
        for (const auto& [key, value] : sec) {
            oss << key << " = " << value.str() << "\n";
        }
        oss << "\n";
    }

    return oss.str();
}

// =============================================================================
// Factory Functions
// =============================================================================

Result<ConfigFile> load_config(const Path& path) {
    ConfigFile config;
    auto result = config.load(path);
    if (result.is_error()) {
        return result.error();
    }
    return config;
}

Result<ConfigFile> parse_config(StringView content) {
    ConfigFile config;
    config.parse(content);
    return config;
}

} // namespace mfconv::config
