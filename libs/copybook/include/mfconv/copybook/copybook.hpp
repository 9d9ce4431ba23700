// =============================================================================
// MFCONV - Copybook Schema Parser Module
// Version: 1.2.0
// =============================================================================
// Parses flat, line-oriented record layouts:
//   line 1   record length
//   line 2   reserved
//   line 3+  name,TYPE,numeric_attribute,byte_length,declared_offset
// =============================================================================

#ifndef MFCONV_COPYBOOK_HPP
#define MFCONV_COPYBOOK_HPP

#include <mfconv/common/types.hpp>
#include <mfconv/common/error.hpp>
#include <mfconv/copybook/picture.hpp>
#include <vector>

namespace mfconv {
namespace copybook {

// =============================================================================
// Field Definition
// =============================================================================

struct FieldDefinition {
    String name;
    String type_token;                 // upper-cased
    Optional<UInt32> numeric_attribute;
    UInt32 byte_length = 0;
    UInt32 offset = 0;                 // zero-based, computed
    DecodeRule rule;

    [[nodiscard]] UInt32 end() const { return offset + byte_length; }
    [[nodiscard]] String to_string() const;
};

// =============================================================================
// Record Schema
// =============================================================================

// Largest accepted record length; one record is buffered in memory.
constexpr UInt32 MAX_RECORD_LENGTH = 16u * 1024u * 1024u;

struct RecordSchema {
    UInt32 record_length = 0;
    std::vector<FieldDefinition> fields;
    Path source_file;

    [[nodiscard]] const FieldDefinition* find_field(StringView name) const;
    [[nodiscard]] UInt32 covered_length() const;
    [[nodiscard]] std::vector<String> field_names() const;
    [[nodiscard]] String to_string() const;
};

// =============================================================================
// Schema Parser
// =============================================================================

class SchemaParser {
private:
    std::vector<String> warnings_;

    void warn(String message);
    Optional<FieldDefinition> parse_field_line(const String& line, Size line_number,
                                               UInt32 running_offset);

public:
    SchemaParser() = default;

    Result<RecordSchema> parse(const std::vector<String>& lines);
    Result<RecordSchema> parse(StringView text);
    Result<RecordSchema> parse_file(const Path& path);

    // Warnings from the most recent parse.
    [[nodiscard]] const std::vector<String>& warnings() const { return warnings_; }
};

} // namespace copybook
} // namespace mfconv

#endif // MFCONV_COPYBOOK_HPP
