// =============================================================================
// MFCONV - Copybook Schema Parser Implementation
// Version: 1.2.0
// =============================================================================

#include <mfconv/copybook/copybook.hpp>
#include <mfconv/common/logging.hpp>
#include <sstream>
#include <fstream>
#include <limits>

namespace mfconv {
namespace copybook {

namespace {

constexpr StringView UTF8_BOM = "\xEF\xBB\xBF";

SharedPtr<logging::Logger> logger() {
    return logging::LogManager::instance().get_logger("copybook");
}

Optional<Int64> parse_integer(StringView text) {
    return parse_int64(trim(text));
}

} // namespace

// =============================================================================
// FieldDefinition Implementation
// =============================================================================

String FieldDefinition::to_string() const {
    std::ostringstream oss;
    oss << name << " " << type_token << " [" << offset << ".." << end() << ") "
        << copybook::to_string(rule.kind);
    if (rule.kind == FieldKind::ZONED_DECIMAL) oss << " decimals=" << rule.decimal_digits;
    if (rule.scale) oss << " scale=" << *rule.scale;
    return oss.str();
}

// =============================================================================
// RecordSchema Implementation
// =============================================================================

const FieldDefinition* RecordSchema::find_field(StringView name) const {
    for (const auto& field : fields) {
        if (field.name == name) return &field;
    }
    return nullptr;
}

UInt32 RecordSchema::covered_length() const {
    return fields.empty() ? 0 : fields.back().end();
}

std::vector<String> RecordSchema::field_names() const {
    std::vector<String> names;
    names.reserve(fields.size());
    for (const auto& field : fields) names.push_back(field.name);
    return names;
}

String RecordSchema::to_string() const {
    std::ostringstream oss;
    oss << "Record length " << record_length << ", " << fields.size() << " fields";
    if (!source_file.empty()) oss << " (" << source_file.string() << ")";
    oss << "\n";
    for (const auto& field : fields) {
        oss << "  " << field.to_string() << "\n";
    }
    return oss.str();
}

// =============================================================================
// SchemaParser Implementation
// =============================================================================

void SchemaParser::warn(String message) {
    logger()->warn("{}", message);
    warnings_.push_back(std::move(message));
}

Optional<FieldDefinition> SchemaParser::parse_field_line(const String& line, Size line_number,
                                                         UInt32 running_offset) {
    auto parts = split(line, ',');

    // An empty numeric attribute may be omitted entirely
    if (parts.size() == 4 && trim(parts[2]).empty()) {
        parts.insert(parts.begin() + 2, String{});
    }

    if (parts.size() != 5) {
        warn(std::format("Skipping malformed schema line {}: '{}' (expected 5 parts, got {})",
                         line_number, line, parts.size()));
        return nullopt;
    }

    auto byte_length = parse_integer(parts[3]);
    auto declared_offset = parse_integer(parts[4]);
    if (!byte_length || !declared_offset) {
        warn(std::format("Skipping schema line {} with non-numeric length or offset: '{}'",
                         line_number, line));
        return nullopt;
    }

    if (*byte_length <= 0 || *byte_length > std::numeric_limits<UInt32>::max()) {
        warn(std::format("Skipping schema line {} with invalid byte length {}: '{}'",
                         line_number, *byte_length, line));
        return nullopt;
    }

    if (*declared_offset != static_cast<Int64>(running_offset) + 1) {
        warn(std::format("Offset mismatch on schema line {}: declared {}, calculated {}; using {}",
                         line_number, *declared_offset, running_offset + 1, running_offset));
    }

    FieldDefinition field;
    field.name = trim(parts[0]);
    field.type_token = to_upper(trim(parts[1]));

    String attribute = trim(parts[2]);
    if (is_all_digits(attribute)) {
        auto value = parse_int64(attribute);
        if (value && *value <= std::numeric_limits<UInt32>::max()) {
            field.numeric_attribute = static_cast<UInt32>(*value);
        }
    }

    field.byte_length = static_cast<UInt32>(*byte_length);
    field.offset = running_offset;
    field.rule = resolve_rule(field.type_token, field.numeric_attribute);
    return field;
}

Result<RecordSchema> SchemaParser::parse(const std::vector<String>& lines) {
    warnings_.clear();

    if (lines.empty()) {
        return make_error<RecordSchema>(ErrorCode::SCHEMA_INVALID_RECORD_LENGTH,
            "Schema is empty; expected record length on line 1");
    }

    String first = trim(lines[0]);
    if (starts_with(first, UTF8_BOM)) first = trim(StringView(first).substr(UTF8_BOM.size()));

    auto record_length = parse_int64(first);
    if (!record_length || *record_length <= 0) {
        return Result<RecordSchema>(ErrorInfo(ErrorCode::SCHEMA_INVALID_RECORD_LENGTH,
            std::format("Invalid record length '{}' on line 1", first), "copybook")
            .with_context("line", first));
    }
    if (*record_length > static_cast<Int64>(MAX_RECORD_LENGTH)) {
        return Result<RecordSchema>(ErrorInfo(ErrorCode::SCHEMA_INVALID_RECORD_LENGTH,
            std::format("Record length {} exceeds the limit of {} bytes",
                        *record_length, MAX_RECORD_LENGTH), "copybook")
            .with_context("line", first));
    }

    RecordSchema schema;
    schema.record_length = static_cast<UInt32>(*record_length);

    UInt32 running_offset = 0;
    for (Size i = 2; i < lines.size(); ++i) {
        String line = trim(lines[i]);
        Size line_number = i + 1;

        auto field = parse_field_line(line, line_number, running_offset);
        if (!field) continue;

        if (static_cast<UInt64>(running_offset) + field->byte_length > schema.record_length) {
            return Result<RecordSchema>(ErrorInfo(ErrorCode::SCHEMA_FIELD_EXCEEDS_RECORD,
                std::format("Field '{}' on line {} ends at byte {}, record length is {}",
                            field->name, line_number,
                            static_cast<UInt64>(running_offset) + field->byte_length,
                            schema.record_length), "copybook")
                .with_context("field", field->name));
        }

        running_offset += field->byte_length;
        schema.fields.push_back(std::move(*field));
    }

    if (schema.fields.empty()) {
        return make_error<RecordSchema>(ErrorCode::SCHEMA_NO_FIELDS,
            "No valid field definitions found in schema");
    }

    if (running_offset != schema.record_length) {
        warn(std::format("Total field length {} does not match declared record length {}",
                         running_offset, schema.record_length));
    }

    return make_success(std::move(schema));
}

Result<RecordSchema> SchemaParser::parse(StringView text) {
    return parse(split_lines(text));
}

Result<RecordSchema> SchemaParser::parse_file(const Path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return make_error<RecordSchema>(ErrorCode::FILE_NOT_FOUND,
            "Schema file not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error<RecordSchema>(ErrorCode::READ_ERROR,
            "Cannot open schema file: " + path.string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return make_error<RecordSchema>(ErrorCode::READ_ERROR,
            "Failed reading schema file: " + path.string());
    }

    auto result = parse(StringView(ss.str()));
    if (result.is_success()) {
        result.value().source_file = path;
    }
    return result;
}

} // namespace copybook
} // namespace mfconv
