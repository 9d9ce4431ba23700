#include "../framework/test_framework.hpp"
#include "../framework/log_capture.hpp"
#include "mfconv/decoder/field_decoder.hpp"

using namespace mfconv;
using namespace mfconv::copybook;
using namespace mfconv::decoder;
using namespace mfconv::logging;
using namespace mfconv::test;

namespace {

FieldDefinition make_field(const String& name, const String& type, UInt32 length,
                           Optional<UInt32> attribute = nullopt) {
    FieldDefinition field;
    field.name = name;
    field.type_token = type;
    field.numeric_attribute = attribute;
    field.byte_length = length;
    field.rule = resolve_rule(type, attribute);
    return field;
}

codemap::CodeMap sample_map() {
    codemap::CodeMap map;
    (void)map.insert("A4A2", "3042");   // HIRAGANA LETTER A
    (void)map.insert("A1A1", "3000");   // IDEOGRAPHIC SPACE
    (void)map.insert("A4A8", "D800");   // surrogate, not a scalar value
    return map;
}

String decode_ok(const FieldDecoder& decoder, const FieldDefinition& field, const ByteBuffer& data) {
    auto result = decoder.decode(field, data);
    if (result.is_error()) {
        throw std::runtime_error("decode failed: " + result.error().to_string());
    }
    return result.value();
}

} // namespace

// =============================================================================
// Numeric formatting
// =============================================================================

void test_insert_zoned_scale() {
    ASSERT_EQ(insert_zoned_scale("12345", 2), "123.45");
    ASSERT_EQ(insert_zoned_scale("123", 5), "0.00123");
    ASSERT_EQ(insert_zoned_scale("12", 2), "0.12");
    ASSERT_EQ(insert_zoned_scale("123", 0), "123");
    ASSERT_EQ(insert_zoned_scale("", 2), "");
}

void test_format_packed() {
    ASSERT_EQ(format_packed("1234567", false, Optional<UInt32>(2)), "12345.67");
    ASSERT_EQ(format_packed("0001234", true, nullopt), "-1234");
    ASSERT_EQ(format_packed("005", false, Optional<UInt32>(3)), "0.005");
    ASSERT_EQ(format_packed("000", true, Optional<UInt32>(2)), "0.00");
    ASSERT_EQ(format_packed("000", true, nullopt), "0");
    ASSERT_EQ(strip_leading_zeros("000120"), "120");
    ASSERT_EQ(strip_leading_zeros("000"), "");
}

// =============================================================================
// Single-byte fields
// =============================================================================

void test_decode_text() {
    auto map = sample_map();
    FieldDecoder decoder(map);
    auto field = make_field("NAME", "X", 10);
    ByteBuffer data = {0xC8, 0xC5, 0xD3, 0xD3, 0xD6, 0x40, 0x40, 0x40, 0x40, 0x40};
    ASSERT_STR_EQ(decode_ok(decoder, field, data), "HELLO");
}

void test_decode_code_page_option() {
    auto map = sample_map();
    DecoderOptions options;
    options.code_page = ebcdic::CodePage::IBM037;
    FieldDecoder decoder(map, options);
    auto field = make_field("FLAG", "X", 1);
    ASSERT_STR_EQ(decode_ok(decoder, field, {0x5A}), "!");

    FieldDecoder international(map);
    ASSERT_STR_EQ(decode_ok(international, field, {0x5A}), "]");
}

void test_decode_zoned() {
    auto map = sample_map();
    FieldDecoder decoder(map);

    auto integer = make_field("QTY", "9", 5);
    ASSERT_STR_EQ(decode_ok(decoder, integer, {0xF0, 0xF0, 0xF1, 0xF2, 0xF3}), "123");
    ASSERT_STR_EQ(decode_ok(decoder, integer, {0xF0, 0xF0, 0xF0, 0xF0, 0xF0}), "0");

    auto decimal = make_field("PRICE", "9(3)V9(2)", 5);
    ASSERT_STR_EQ(decode_ok(decoder, decimal, {0xF1, 0xF2, 0xF3, 0xF4, 0xF5}), "123.45");

    auto small = make_field("RATE", "9(1)V9(5)", 5);
    ASSERT_STR_EQ(decode_ok(decoder, small, {0x40, 0x40, 0xF1, 0xF2, 0xF3}), "0.00123");

    auto fraction = make_field("PCT", "V9(4)", 4);
    ASSERT_STR_EQ(decode_ok(decoder, fraction, {0xF0, 0xF0, 0xF4, 0xF5}), "0.45");
    ASSERT_STR_EQ(decode_ok(decoder, fraction, {0x40, 0x40, 0x40, 0x40}), "0.0");
}

// =============================================================================
// Packed decimal fields
// =============================================================================

void test_decode_packed() {
    auto map = sample_map();
    FieldDecoder decoder(map);

    auto amt = make_field("AMT", "PS9(5)V9(2)", 4);
    ASSERT_STR_EQ(decode_ok(decoder, amt, {0x12, 0x34, 0x56, 0x7C}), "12345.67");
    ASSERT_STR_EQ(decode_ok(decoder, amt, {0x12, 0x34, 0x56, 0x7D}), "-12345.67");
    ASSERT_STR_EQ(decode_ok(decoder, amt, {0x00, 0x00, 0x00, 0x0D}), "0.00");

    auto count = make_field("CNT", "S9(5)", 3);
    ASSERT_STR_EQ(decode_ok(decoder, count, {0x00, 0x12, 0x3F}), "123");

    auto rate = make_field("RATE", "PV9", 3, Optional<UInt32>(3));
    ASSERT_STR_EQ(decode_ok(decoder, rate, {0x01, 0x23, 0x4C}), "1.234");
}

void test_packed_round_trip() {
    auto map = sample_map();
    FieldDecoder decoder(map);
    auto amt = make_field("AMT", "PS9(7)V9(2)", 5);

    for (const char* value : {"1234567.89", "-0.05", "42.00"}) {
        auto packed = ebcdic::string_to_packed(value, 5);
        ASSERT_TRUE(packed.is_success());
        ASSERT_STR_EQ(decode_ok(decoder, amt, *packed), value);
    }
}

void test_packed_sign_nibbles() {
    ScopedCapture capture;
    auto map = sample_map();
    FieldDecoder decoder(map);
    auto count = make_field("CNT", "P9(3)", 2);

    ASSERT_STR_EQ(decode_ok(decoder, count, {0x12, 0x3B}), "123");
    ASSERT_EQ(capture->count(LogLevel::WARN), 0u);

    // A digit in the sign position is read as positive with a warning
    ASSERT_STR_EQ(decode_ok(decoder, count, {0x12, 0x33}), "123");
    ASSERT_EQ(capture->count(LogLevel::WARN), 1u);
    ASSERT_TRUE(capture->contains("unusual sign nibble 3"));
}

void test_packed_invalid() {
    auto map = sample_map();
    FieldDecoder decoder(map);
    auto amt = make_field("AMT", "PS9(3)", 2);

    auto result = decoder.decode(amt, ByteBuffer{0x1A, 0x3C});
    ASSERT_TRUE(result.is_error());
    ASSERT_EQ(result.error().code, ErrorCode::FIELD_INVALID_PACKED);
    ASSERT_EQ(result.error().context_value("field"), "AMT");
    ASSERT_STR_EQ(format_error_token(result.error()), "ERROR(COMP3_INVALID):1a3c");
}

void test_packed_missing_scale() {
    auto map = sample_map();
    FieldDecoder decoder(map);
    auto field = make_field("RATE", "PSV9", 2);

    auto result = decoder.decode(field, ByteBuffer{0x12, 0x3C});
    ASSERT_EQ(result.error().code, ErrorCode::FIELD_MISSING_SCALE);
    ASSERT_STR_EQ(format_error_token(result.error()), "ERROR(PV9/PSV9_NO_ATTR):123c");
}

void test_unsupported_type() {
    auto map = sample_map();
    FieldDecoder decoder(map);
    auto field = make_field("F", "COMP-2", 2);

    auto result = decoder.decode(field, ByteBuffer{0xAB, 0x01});
    ASSERT_EQ(result.error().code, ErrorCode::FIELD_UNSUPPORTED_TYPE);
    ASSERT_STR_EQ(format_error_token(result.error()), "UNSUPPORTED_TYPE(COMP-2):ab01");
}

// =============================================================================
// DBCS fields
// =============================================================================

void test_replace_dbcs_markers() {
    auto map = sample_map();
    FieldDecoder decoder(map);

    ASSERT_TRUE(decoder.replace_dbcs_markers(ByteBuffer{0x42, 0x42, 0x42}) ==
                (ByteBuffer{0xA1, 0xA1, 0x42}));
    ASSERT_TRUE(decoder.replace_dbcs_markers(ByteBuffer{0x00, 0x42, 0x42}) ==
                (ByteBuffer{0x00, 0xA1, 0xA1}));
    ASSERT_TRUE(decoder.replace_dbcs_markers(ByteBuffer{0x42, 0x41}) ==
                (ByteBuffer{0x42, 0x41}));
}

void test_decode_dbcs() {
    ScopedCapture capture;
    auto map = sample_map();
    FieldDecoder decoder(map);
    auto field = make_field("KANA", "N", 8);

    // A, unmapped code, marker (becomes an ideographic space), A
    ByteBuffer data = {0xA4, 0xA2, 0xA4, 0xA4, 0x42, 0x42, 0xA4, 0xA2};
    ASSERT_STR_EQ(decode_ok(decoder, field, data),
                  "\xE3\x81\x82\xE2\x98\x85\xE3\x80\x80\xE3\x81\x82");
    ASSERT_TRUE(capture->contains("undefined DBCS code A4A4"));

    ByteBuffer padded = {0xA4, 0xA2, 0x42, 0x42, 0x42, 0x42};
    ASSERT_STR_EQ(decode_ok(decoder, field, padded), "\xE3\x81\x82");
}

void test_dbcs_one_placeholder_per_unmapped_pair() {
    auto map = sample_map();
    DecoderOptions options;
    options.placeholder = U'?';
    FieldDecoder decoder(map, options);
    auto field = make_field("KANA", "N", 6);

    ASSERT_STR_EQ(decode_ok(decoder, field, {0x01, 0x02, 0x03, 0x04, 0x05, 0x06}), "???");
    // Odd trailing byte also becomes a placeholder
    ASSERT_STR_EQ(decode_ok(decoder, field, {0xA4, 0xA2, 0x07}), "\xE3\x81\x82?");
}

void test_dbcs_invalid_code_point() {
    auto map = sample_map();
    FieldDecoder decoder(map);
    auto field = make_field("KANA", "N", 2);

    auto result = decoder.decode(field, ByteBuffer{0xA4, 0xA8});
    ASSERT_EQ(result.error().code, ErrorCode::FIELD_INVALID_CODE_POINT);
    ASSERT_STR_EQ(format_error_token(result.error()), "ERROR(DBCS_INVALID_CODEPOINT):a4a8");
}

void test_conversion_error_token() {
    ErrorInfo info(ErrorCode::FIELD_CONVERSION_ERROR, "bad_alloc", "decoder");
    ASSERT_STR_EQ(format_error_token(info), "CONVERSION_ERROR: bad_alloc");
}

int main() {
    TestSuite numeric("Numeric Formatting Tests");
    numeric.add_test("insert_zoned_scale", test_insert_zoned_scale);
    numeric.add_test("format_packed", test_format_packed);

    TestSuite decoding("Field Decoder Tests");
    decoding.add_test("Text field", test_decode_text);
    decoding.add_test("Code page option", test_decode_code_page_option);
    decoding.add_test("Zoned fields", test_decode_zoned);
    decoding.add_test("Packed fields", test_decode_packed);
    decoding.add_test("Packed round trip", test_packed_round_trip);
    decoding.add_test("Packed sign nibbles", test_packed_sign_nibbles);
    decoding.add_test("Packed invalid nibble", test_packed_invalid);
    decoding.add_test("Packed missing scale", test_packed_missing_scale);
    decoding.add_test("Unsupported type", test_unsupported_type);
    decoding.add_test("DBCS marker replacement", test_replace_dbcs_markers);
    decoding.add_test("DBCS decoding", test_decode_dbcs);
    decoding.add_test("DBCS placeholder per pair", test_dbcs_one_placeholder_per_unmapped_pair);
    decoding.add_test("DBCS invalid code point", test_dbcs_invalid_code_point);
    decoding.add_test("Conversion error token", test_conversion_error_token);

    TestRunner runner;
    runner.add_suite(&numeric);
    runner.add_suite(&decoding);
    return runner.run_all();
}
