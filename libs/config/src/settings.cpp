// =============================================================================
// MFCONV - Converter Settings Implementation
// Version: 1.2.0
// =============================================================================

#include <mfconv/config/settings.hpp>
#include <mfconv/ebcdic/ebcdic.hpp>
#include <sstream>

namespace mfconv::config {

namespace {

ErrorInfo invalid_value(StringView section, StringView key, const String& detail) {
    ErrorInfo info(ErrorCode::CONFIG_INVALID_VALUE,
        std::format("[{}] {}: {}", section, key, detail), "config");
    info.with_context("section", String(section)).with_context("key", String(key));
    return info;
}

String strip_hex_prefix(String text) {
    String upper = to_upper(text);
    if (starts_with(upper, "U+") || starts_with(upper, "0X")) {
        return text.substr(2);
    }
    return text;
}

} // anonymous namespace

Result<std::array<Byte, 2>> parse_byte_pair(StringView text) {
    String compact;
    for (char c : text) {
        if (c == ' ' || c == ',' || c == '\t') continue;
        compact.push_back(c);
    }
    compact = strip_hex_prefix(compact);

    if (compact.size() != 4 || !is_hex_string(compact)) {
        return make_error<std::array<Byte, 2>>(ErrorCode::CONFIG_INVALID_VALUE,
            std::format("Expected two hex bytes, got '{}'", text));
    }
    auto value = parse_hex(compact);
    if (!value) {
        return make_error<std::array<Byte, 2>>(ErrorCode::CONFIG_INVALID_VALUE,
            std::format("Expected two hex bytes, got '{}'", text));
    }
    return std::array<Byte, 2>{static_cast<Byte>((*value >> 8) & 0xFF),
                               static_cast<Byte>(*value & 0xFF)};
}

Result<char32_t> parse_code_point(StringView text) {
    String trimmed = trim(text);
    if (trimmed.empty()) {
        return make_error<char32_t>(ErrorCode::CONFIG_INVALID_VALUE, "Empty code point");
    }

    String hex = strip_hex_prefix(trimmed);
    bool explicit_hex = hex.size() != trimmed.size();
    if (is_hex_string(hex) && (explicit_hex || hex.size() >= 2)) {
        auto value = parse_hex(hex);
        if (value && *value <= 0x10FFFF &&
            ebcdic::is_unicode_scalar(static_cast<char32_t>(*value))) {
            return static_cast<char32_t>(*value);
        }
        return make_error<char32_t>(ErrorCode::CONFIG_INVALID_VALUE,
            std::format("Not a Unicode scalar value: '{}'", trimmed));
    }

    U32String decoded = ebcdic::from_utf8(trimmed);
    if (decoded.size() == 1 && decoded[0] != U'\uFFFD') {
        return decoded[0];
    }
    return make_error<char32_t>(ErrorCode::CONFIG_INVALID_VALUE,
        std::format("Expected a hex code point or a single character, got '{}'", trimmed));
}

Result<ConverterSettings> settings_from_config(const ConfigFile& config, ConverterSettings base) {
    ConverterSettings settings = std::move(base);

    // [paths]
    const auto& paths = config.section("paths");
    if (paths.has("input_dir")) settings.layout.input_dir = paths.get_string("input_dir");
    if (paths.has("schema_dir")) settings.layout.schema_dir = paths.get_string("schema_dir");
    if (paths.has("output_dir")) settings.layout.output_dir = paths.get_string("output_dir");
    if (paths.has("code_map") && !paths.get("code_map").empty()) {
        settings.code_map_path = Path(paths.get_string("code_map"));
    }

    // [naming]
    const auto& naming = config.section("naming");
    auto& conv = settings.layout.naming;
    if (naming.has("binary_extension")) conv.binary_extension = naming.get_string("binary_extension");
    if (naming.has("schema_prefix")) conv.schema_prefix = naming.get_string("schema_prefix");
    if (naming.has("schema_extension")) conv.schema_extension = naming.get_string("schema_extension");
    if (naming.has("output_prefix")) conv.output_prefix = naming.get_string("output_prefix");
    if (naming.has("output_extension")) conv.output_extension = naming.get_string("output_extension");

    // [decoding]
    const auto& decoding = config.section("decoding");
    if (decoding.has("code_page")) {
        auto cp = ebcdic::parse_code_page(decoding.get_string("code_page"));
        if (!cp) {
            return invalid_value("decoding", "code_page",
                "Unknown code page '" + decoding.get_string("code_page") + "'");
        }
        settings.decoding.code_page = *cp;
    }
    if (decoding.has("placeholder")) {
        auto cp = parse_code_point(decoding.get_string("placeholder"));
        if (cp.is_error()) return invalid_value("decoding", "placeholder", cp.error().message);
        settings.decoding.placeholder = cp.value();
    }
    if (decoding.has("dbcs_marker")) {
        auto pair = parse_byte_pair(decoding.get_string("dbcs_marker"));
        if (pair.is_error()) return invalid_value("decoding", "dbcs_marker", pair.error().message);
        settings.decoding.dbcs_marker = pair.value();
    }
    if (decoding.has("dbcs_space")) {
        auto pair = parse_byte_pair(decoding.get_string("dbcs_space"));
        if (pair.is_error()) return invalid_value("decoding", "dbcs_space", pair.error().message);
        settings.decoding.dbcs_space = pair.value();
    }

    // [logging]
    const auto& log = config.section("logging");
    if (log.has("level")) {
        auto level = logging::parse_log_level(log.get_string("level"));
        if (!level) {
            return invalid_value("logging", "level",
                "Unknown log level '" + log.get_string("level") + "'");
        }
        settings.log_level = *level;
    }
    if (log.has("file") && !log.get("file").empty()) {
        settings.log_file = Path(log.get_string("file"));
    }
    if (log.has("colored")) {
        auto colored = log.get("colored").to_bool();
        if (colored.is_error()) return invalid_value("logging", "colored", colored.error().message);
        settings.colored = colored.value();
    }

    return settings;
}

String ConverterSettings::to_string() const {
    std::ostringstream oss;
    oss << "Input dir:   " << layout.input_dir.string() << "\n";
    oss << "Schema dir:  " << layout.schema_dir.string() << "\n";
    oss << "Output dir:  " << layout.output_dir.string() << "\n";
    oss << "Code map:    " << (code_map_path ? code_map_path->string() : String("(none)")) << "\n";
    oss << "Code page:   " << ebcdic::code_page_name(decoding.code_page) << "\n";
    oss << "Log level:   " << logging::to_string(log_level) << "\n";
    return oss.str();
}

} // namespace mfconv::config
