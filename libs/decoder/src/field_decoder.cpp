// =============================================================================
// MFCONV - Field Decoder Implementation
// Version: 1.2.0
// =============================================================================

#include <mfconv/decoder/field_decoder.hpp>
#include <exception>

namespace mfconv {
namespace decoder {

using copybook::FieldDefinition;
using copybook::FieldKind;

// =============================================================================
// Numeric Formatting
// =============================================================================

String strip_leading_zeros(StringView text) {
    Size pos = text.find_first_not_of('0');
    return pos == StringView::npos ? String{} : String(text.substr(pos));
}

String insert_zoned_scale(StringView digits, UInt32 decimal_digits) {
    if (digits.empty()) return "";
    if (decimal_digits == 0) return String(digits);

    if (digits.size() <= decimal_digits) {
        return "0." + String(decimal_digits - digits.size(), '0') + String(digits);
    }

    Size insert_at = digits.size() - decimal_digits;
    return String(digits.substr(0, insert_at)) + "." + String(digits.substr(insert_at));
}

String format_packed(StringView digits, bool negative, Optional<UInt32> scale) {
    String significant = strip_leading_zeros(digits);
    UInt32 places = scale.value_or(0);

    // Zero never carries a sign
    if (significant.empty()) {
        return places > 0 ? "0." + String(places, '0') : "0";
    }

    String number;
    if (places == 0) {
        number = significant;
    } else if (places >= significant.size()) {
        number = "0." + String(places - significant.size(), '0') + significant;
    } else {
        Size insert_at = significant.size() - places;
        number = significant.substr(0, insert_at) + "." + significant.substr(insert_at);
    }

    return negative ? "-" + number : number;
}

// =============================================================================
// FieldDecoder Implementation
// =============================================================================

FieldDecoder::FieldDecoder(const codemap::CodeMap& code_map, DecoderOptions options)
    : code_map_(code_map)
    , options_(options)
    , logger_(logging::LogManager::instance().get_logger("decoder")) {}

ErrorInfo FieldDecoder::field_error(ErrorCode code, String message,
                                    const FieldDefinition& field, ConstByteSpan data) const {
    ErrorInfo info(code, std::move(message), "decoder");
    info.with_context("field", field.name)
        .with_context("type", field.type_token)
        .with_context("hex", to_hex_string(data, false));
    return info;
}

String FieldDecoder::decode_text(ConstByteSpan data) const {
    return ebcdic::ebcdic_to_string(data, options_.code_page);
}

ByteBuffer FieldDecoder::replace_dbcs_markers(ConstByteSpan data) const {
    ByteBuffer result;
    result.reserve(data.size());
    Size i = 0;
    while (i < data.size()) {
        if (i + 1 < data.size() &&
            data[i] == options_.dbcs_marker[0] && data[i + 1] == options_.dbcs_marker[1]) {
            result.push_back(options_.dbcs_space[0]);
            result.push_back(options_.dbcs_space[1]);
            i += 2;
        } else {
            result.push_back(data[i]);
            ++i;
        }
    }
    return result;
}

Result<String> FieldDecoder::decode_dbcs(const FieldDefinition& field, ConstByteSpan data) const {
    ByteBuffer bytes = replace_dbcs_markers(data);
    U32String text;
    text.reserve(bytes.size() / 2 + 1);

    Size i = 0;
    for (; i + 1 < bytes.size(); i += 2) {
        const String* mapped = code_map_.lookup(bytes[i], bytes[i + 1]);
        if (!mapped) {
            logger_->warn("Field '{}': undefined DBCS code {:02X}{:02X}",
                          field.name, bytes[i], bytes[i + 1]);
            text.push_back(options_.placeholder);
            continue;
        }
        if (mapped->empty()) {
            logger_->warn("Field '{}': empty mapping for DBCS code {:02X}{:02X}",
                          field.name, bytes[i], bytes[i + 1]);
            text.push_back(options_.placeholder);
            continue;
        }

        auto code_point = parse_hex(*mapped);
        if (!code_point || *code_point > 0x10FFFF ||
            !ebcdic::is_unicode_scalar(static_cast<char32_t>(*code_point))) {
            return field_error(ErrorCode::FIELD_INVALID_CODE_POINT,
                std::format("DBCS code {:02X}{:02X} maps to invalid code point {}",
                            bytes[i], bytes[i + 1], *mapped),
                field, data);
        }
        text.push_back(static_cast<char32_t>(*code_point));
    }

    if (i < bytes.size()) {
        logger_->warn("Field '{}': unpaired trailing DBCS byte {:02X}", field.name, bytes[i]);
        text.push_back(options_.placeholder);
    }

    return make_success(ebcdic::to_utf8(ebcdic::trim_unicode(text)));
}

Result<String> FieldDecoder::decode_packed(const FieldDefinition& field, ConstByteSpan data) const {
    auto unpacked = ebcdic::unpack_digits(data);
    if (unpacked.is_error()) {
        logger_->warn("Field '{}': {} (data {})", field.name, unpacked.error().message,
                      to_hex_string(data, false));
        return field_error(ErrorCode::FIELD_INVALID_PACKED, unpacked.error().message, field, data);
    }

    Byte sign = unpacked->sign_nibble;
    if (!ebcdic::is_positive_sign(sign) && !ebcdic::is_negative_sign(sign)) {
        logger_->warn("Field '{}': unusual sign nibble {:X} treated as positive (data {})",
                      field.name, sign, to_hex_string(data, false));
    } else if (!ebcdic::is_preferred_sign(sign)) {
        logger_->debug("Field '{}': non-canonical positive sign nibble {:X}", field.name, sign);
    }

    Optional<UInt32> scale;
    if (field.rule.kind == FieldKind::PACKED_DECIMAL) scale = field.rule.scale;
    return make_success(format_packed(unpacked->digits, unpacked->negative(), scale));
}

Result<String> FieldDecoder::decode_by_rule(const FieldDefinition& field, ConstByteSpan data) const {
    switch (field.rule.kind) {
        case FieldKind::TEXT:
            return make_success(decode_text(data));

        case FieldKind::ZONED_INTEGER: {
            String digits = strip_leading_zeros(decode_text(data));
            return make_success(digits.empty() ? String("0") : digits);
        }

        case FieldKind::DBCS_TEXT:
            return decode_dbcs(field, data);

        case FieldKind::ZONED_DECIMAL:
            return make_success(insert_zoned_scale(decode_text(data), field.rule.decimal_digits));

        case FieldKind::ZONED_FRACTION: {
            String digits = strip_leading_zeros(decode_text(data));
            return make_success(digits.empty() ? String("0.0") : "0." + digits);
        }

        case FieldKind::PACKED_INTEGER:
        case FieldKind::PACKED_DECIMAL:
            return decode_packed(field, data);

        case FieldKind::PACKED_MISSING_SCALE:
            logger_->error("Field '{}': {} requires a numeric attribute (data {})",
                           field.name, field.type_token, to_hex_string(data, false));
            return field_error(ErrorCode::FIELD_MISSING_SCALE,
                field.type_token + " requires a numeric attribute", field, data);

        case FieldKind::UNSUPPORTED:
            logger_->warn("Field '{}': unsupported type '{}' (data {})",
                          field.name, field.type_token, to_hex_string(data, false));
            return field_error(ErrorCode::FIELD_UNSUPPORTED_TYPE,
                "Unsupported type " + field.type_token, field, data);
    }

    return field_error(ErrorCode::FIELD_UNSUPPORTED_TYPE,
        "Unsupported type " + field.type_token, field, data);
}

Result<String> FieldDecoder::decode(const FieldDefinition& field, ConstByteSpan data) const {
    try {
        return decode_by_rule(field, data);
    } catch (const std::exception& e) {
        logger_->error("Field '{}' (type {}): conversion failed: {} (data {})",
                       field.name, field.type_token, e.what(), to_hex_string(data, false));
        return field_error(ErrorCode::FIELD_CONVERSION_ERROR, e.what(), field, data);
    }
}

// =============================================================================
// Error Tokens
// =============================================================================

String format_error_token(const ErrorInfo& error) {
    String hex = error.context_value("hex");
    switch (error.code) {
        case ErrorCode::FIELD_INVALID_PACKED:
            return "ERROR(COMP3_INVALID):" + hex;
        case ErrorCode::FIELD_MISSING_SCALE:
            return "ERROR(PV9/PSV9_NO_ATTR):" + hex;
        case ErrorCode::FIELD_UNSUPPORTED_TYPE:
            return "UNSUPPORTED_TYPE(" + error.context_value("type") + "):" + hex;
        case ErrorCode::FIELD_INVALID_CODE_POINT:
            return "ERROR(DBCS_INVALID_CODEPOINT):" + hex;
        case ErrorCode::FIELD_CONVERSION_ERROR:
            return "CONVERSION_ERROR: " + error.message;
        default:
            return "CONVERSION_ERROR: " + error.to_string();
    }
}

} // namespace decoder
} // namespace mfconv
