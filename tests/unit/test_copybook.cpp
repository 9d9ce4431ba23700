#include "../framework/test_framework.hpp"
#include "../framework/log_capture.hpp"
#include "mfconv/copybook/picture.hpp"
#include "mfconv/copybook/copybook.hpp"
#include <fstream>

using namespace mfconv;
using namespace mfconv::copybook;
using namespace mfconv::test;

// =============================================================================
// Picture analysis
// =============================================================================

void test_digits_of() {
    ASSERT_TRUE(digits_of("9(5)V9(2)") == (PictureDigits{5, 2}));
    ASSERT_TRUE(digits_of("PS9(7)V9(3)") == (PictureDigits{7, 3}));
    ASSERT_TRUE(digits_of("S9(4)") == (PictureDigits{4, 0}));
    ASSERT_TRUE(digits_of("V9(4)") == (PictureDigits{4, 0}));
    ASSERT_TRUE(digits_of("S9V9(2)") == (PictureDigits{0, 2}));
    ASSERT_TRUE(digits_of("X(10)") == (PictureDigits{0, 0}));
    ASSERT_TRUE(digits_of("9(5)V9(2)X") == (PictureDigits{0, 0}));
    ASSERT_TRUE(digits_of("9(99999999999)") == (PictureDigits{0, 0}));
}

void test_resolve_simple_types() {
    ASSERT_EQ(resolve_rule("X", nullopt).kind, FieldKind::TEXT);
    ASSERT_EQ(resolve_rule("9", nullopt).kind, FieldKind::ZONED_INTEGER);
    ASSERT_EQ(resolve_rule("N", nullopt).kind, FieldKind::DBCS_TEXT);
    ASSERT_EQ(resolve_rule("COMP-1", nullopt).kind, FieldKind::UNSUPPORTED);
    ASSERT_EQ(resolve_rule("X(10)", nullopt).kind, FieldKind::UNSUPPORTED);
}

void test_resolve_zoned() {
    auto rule = resolve_rule("9(5)V9(2)", nullopt);
    ASSERT_EQ(rule.kind, FieldKind::ZONED_DECIMAL);
    ASSERT_EQ(rule.decimal_digits, 2u);

    ASSERT_EQ(resolve_rule("V9(3)", nullopt).kind, FieldKind::ZONED_FRACTION);
    ASSERT_EQ(resolve_rule("V9V9", nullopt).kind, FieldKind::UNSUPPORTED);
}

void test_resolve_packed() {
    auto with_v = resolve_rule("PS9(5)V9(2)", nullopt);
    ASSERT_EQ(with_v.kind, FieldKind::PACKED_DECIMAL);
    ASSERT_EQ(with_v.scale, Optional<UInt32>(2));

    ASSERT_EQ(resolve_rule("P9(5)", nullopt).kind, FieldKind::PACKED_INTEGER);
    ASSERT_EQ(resolve_rule("S9(9)", nullopt).kind, FieldKind::PACKED_INTEGER);
    ASSERT_EQ(resolve_rule("SP9", nullopt).kind, FieldKind::PACKED_INTEGER);

    auto pv9 = resolve_rule("PV9", Optional<UInt32>(3));
    ASSERT_EQ(pv9.kind, FieldKind::PACKED_DECIMAL);
    ASSERT_EQ(pv9.scale, Optional<UInt32>(3));

    ASSERT_EQ(resolve_rule("PSV9", nullopt).kind, FieldKind::PACKED_MISSING_SCALE);
    ASSERT_TRUE(is_packed(FieldKind::PACKED_MISSING_SCALE));
    ASSERT_FALSE(is_packed(FieldKind::ZONED_DECIMAL));
}

// =============================================================================
// Schema parsing
// =============================================================================

void test_parse_basic_schema() {
    SchemaParser parser;
    auto result = parser.parse(StringView(
        "24\n"
        "reserved\n"
        "NAME,X,,10,1\n"
        "QTY,9,,4,11\n"
        "AMT,ps9(5)v9(2),,4,15\n"
        "RATE,PV9,3,6,19\n"));
    ASSERT_TRUE(result.is_success());

    const auto& schema = *result;
    ASSERT_EQ(schema.record_length, 24u);
    ASSERT_EQ(schema.fields.size(), 4u);
    ASSERT_EQ(schema.covered_length(), 24u);

    const auto* amt = schema.find_field("AMT");
    ASSERT_TRUE(amt != nullptr);
    ASSERT_EQ(amt->type_token, "PS9(5)V9(2)");
    ASSERT_EQ(amt->offset, 14u);
    ASSERT_EQ(amt->rule.kind, FieldKind::PACKED_DECIMAL);

    const auto* rate = schema.find_field("RATE");
    ASSERT_EQ(rate->numeric_attribute, Optional<UInt32>(3));
    ASSERT_EQ(rate->rule.scale, Optional<UInt32>(3));
    ASSERT_EQ(rate->end(), 24u);

    auto names = schema.field_names();
    ASSERT_EQ(names[0], "NAME");
    ASSERT_TRUE(parser.warnings().empty());
}

void test_four_part_line_normalized() {
    SchemaParser parser;
    auto result = parser.parse(StringView("10\n\nNAME,X,,10\n"));
    // Four parts with an empty third part gain an attribute slot, which
    // leaves the byte length empty and the line is skipped.
    ASSERT_TRUE(result.is_error());
    ASSERT_EQ(result.error().code, ErrorCode::SCHEMA_NO_FIELDS);
    ASSERT_EQ(parser.warnings().size(), 1u);
}

void test_offset_mismatch_warns() {
    ScopedCapture capture;
    SchemaParser parser;
    auto result = parser.parse(StringView("10\n\nA,X,,5,1\nB,X,,5,9\n"));
    ASSERT_TRUE(result.is_success());
    ASSERT_EQ(result->fields[1].offset, 5u);
    ASSERT_EQ(parser.warnings().size(), 1u);
    ASSERT_TRUE(capture->contains("Offset mismatch"));
}

void test_malformed_lines_skipped() {
    SchemaParser parser;
    auto result = parser.parse(StringView(
        "12\n"
        "\n"
        "A,X,,4,1\n"
        "garbage line\n"
        "B,X,,abc,5\n"
        "C,X,,0,5\n"
        "D,X,,8,5\n"));
    ASSERT_TRUE(result.is_success());
    ASSERT_EQ(result->fields.size(), 2u);
    ASSERT_EQ(result->fields[1].name, "D");
    ASSERT_EQ(parser.warnings().size(), 3u);
}

void test_length_mismatch_is_warning() {
    SchemaParser parser;
    auto result = parser.parse(StringView("20\n\nA,X,,4,1\n"));
    ASSERT_TRUE(result.is_success());
    ASSERT_EQ(result->covered_length(), 4u);
    ASSERT_EQ(parser.warnings().size(), 1u);
}

void test_invalid_record_length() {
    SchemaParser parser;
    auto empty = parser.parse(StringView(""));
    ASSERT_EQ(empty.error().code, ErrorCode::SCHEMA_INVALID_RECORD_LENGTH);

    auto text = parser.parse(StringView("abc\n\nA,X,,4,1\n"));
    ASSERT_EQ(text.error().code, ErrorCode::SCHEMA_INVALID_RECORD_LENGTH);
    ASSERT_EQ(text.error().context_value("line"), "abc");

    ASSERT_EQ(parser.parse(StringView("0\n\nA,X,,4,1\n")).error().code,
              ErrorCode::SCHEMA_INVALID_RECORD_LENGTH);
}

void test_record_length_limit() {
    SchemaParser parser;
    auto at_limit = parser.parse(std::format("{}\n\nA,X,,4,1\n", MAX_RECORD_LENGTH));
    ASSERT_TRUE(at_limit.is_success());
    ASSERT_EQ(at_limit->record_length, MAX_RECORD_LENGTH);

    auto too_long = parser.parse(std::format("{}\n\nA,X,,4,1\n", MAX_RECORD_LENGTH + 1));
    ASSERT_TRUE(too_long.is_error());
    ASSERT_EQ(too_long.error().code, ErrorCode::SCHEMA_INVALID_RECORD_LENGTH);

    auto huge = parser.parse(StringView("4294967295\n\nA,X,,4,1\n"));
    ASSERT_EQ(huge.error().code, ErrorCode::SCHEMA_INVALID_RECORD_LENGTH);
}

void test_bom_on_first_line() {
    SchemaParser parser;
    auto result = parser.parse(StringView("\xEF\xBB\xBF" "4\n\nA,X,,4,1\n"));
    ASSERT_TRUE(result.is_success());
    ASSERT_EQ(result->record_length, 4u);
}

void test_field_exceeds_record() {
    SchemaParser parser;
    auto result = parser.parse(StringView("8\n\nA,X,,4,1\nB,X,,6,5\n"));
    ASSERT_TRUE(result.is_error());
    ASSERT_EQ(result.error().code, ErrorCode::SCHEMA_FIELD_EXCEEDS_RECORD);
    ASSERT_EQ(result.error().context_value("field"), "B");
}

void test_parse_file() {
    auto dir = std::filesystem::temp_directory_path() / "mfconv_test_copybook";
    std::filesystem::create_directories(dir);
    auto path = dir / "CPY_SAMPLE.txt";
    {
        std::ofstream out(path);
        out << "10\r\nheader\r\nNAME,X,,10,1\r\n";
    }

    SchemaParser parser;
    auto result = parser.parse_file(path);
    ASSERT_TRUE(result.is_success());
    ASSERT_TRUE(result->source_file == path);
    ASSERT_EQ(result->fields[0].name, "NAME");

    auto missing = parser.parse_file(dir / "CPY_MISSING.txt");
    ASSERT_EQ(missing.error().code, ErrorCode::FILE_NOT_FOUND);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

int main() {
    TestSuite picture("Picture Analysis Tests");
    picture.add_test("digits_of", test_digits_of);
    picture.add_test("Simple types", test_resolve_simple_types);
    picture.add_test("Zoned types", test_resolve_zoned);
    picture.add_test("Packed types", test_resolve_packed);

    TestSuite parser("Schema Parser Tests");
    parser.add_test("Basic schema", test_parse_basic_schema);
    parser.add_test("Four-part line normalization", test_four_part_line_normalized);
    parser.add_test("Offset mismatch warns", test_offset_mismatch_warns);
    parser.add_test("Malformed lines skipped", test_malformed_lines_skipped);
    parser.add_test("Length mismatch is a warning", test_length_mismatch_is_warning);
    parser.add_test("Invalid record length", test_invalid_record_length);
    parser.add_test("Record length limit", test_record_length_limit);
    parser.add_test("BOM on first line", test_bom_on_first_line);
    parser.add_test("Field exceeds record", test_field_exceeds_record);
    parser.add_test("parse_file", test_parse_file);

    TestRunner runner;
    runner.add_suite(&picture);
    runner.add_suite(&parser);
    return runner.run_all();
}
