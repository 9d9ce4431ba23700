// =============================================================================
// MFCONV - Picture Format Analysis Implementation
// Version: 1.2.0
// =============================================================================

#include <mfconv/copybook/picture.hpp>
#include <limits>

namespace mfconv {
namespace copybook {

namespace {

// Reads "(digits)" at pos. Advances pos past ')' on success.
bool read_repeat_count(StringView token, Size& pos, UInt32& count) {
    if (pos >= token.size() || token[pos] != '(') return true;  // absent is fine

    Size close = token.find(')', pos + 1);
    if (close == StringView::npos) return false;

    StringView digits = token.substr(pos + 1, close - pos - 1);
    if (!is_all_digits(digits)) return false;

    UInt64 value = 0;
    for (char c : digits) {
        value = value * 10 + static_cast<UInt64>(c - '0');
        if (value > std::numeric_limits<UInt32>::max()) return false;
    }
    count = static_cast<UInt32>(value);
    pos = close + 1;
    return true;
}

} // namespace

PictureDigits digits_of(StringView type_token) {
    PictureDigits result;
    Size pos = 0;

    while (pos < type_token.size() &&
           (type_token[pos] == 'P' || type_token[pos] == 'S' || type_token[pos] == 'V')) {
        ++pos;
    }
    if (pos >= type_token.size() || type_token[pos] != '9') return {};
    ++pos;

    UInt32 integer_digits = 0;
    if (!read_repeat_count(type_token, pos, integer_digits)) return {};

    UInt32 decimal_digits = 0;
    if (pos < type_token.size()) {
        if (type_token.substr(pos, 2) != "V9") return {};
        pos += 2;
        if (!read_repeat_count(type_token, pos, decimal_digits)) return {};
    }

    if (pos != type_token.size()) return {};

    result.integer_digits = integer_digits;
    result.decimal_digits = decimal_digits;
    return result;
}

StringView to_string(FieldKind kind) {
    switch (kind) {
        case FieldKind::TEXT:                 return "TEXT";
        case FieldKind::ZONED_INTEGER:        return "ZONED_INTEGER";
        case FieldKind::DBCS_TEXT:            return "DBCS_TEXT";
        case FieldKind::ZONED_DECIMAL:        return "ZONED_DECIMAL";
        case FieldKind::ZONED_FRACTION:       return "ZONED_FRACTION";
        case FieldKind::PACKED_INTEGER:       return "PACKED_INTEGER";
        case FieldKind::PACKED_DECIMAL:       return "PACKED_DECIMAL";
        case FieldKind::PACKED_MISSING_SCALE: return "PACKED_MISSING_SCALE";
        case FieldKind::UNSUPPORTED:          return "UNSUPPORTED";
    }
    return "UNKNOWN";
}

bool is_packed(FieldKind kind) {
    return kind == FieldKind::PACKED_INTEGER || kind == FieldKind::PACKED_DECIMAL ||
           kind == FieldKind::PACKED_MISSING_SCALE;
}

DecodeRule resolve_rule(StringView type_token, Optional<UInt32> numeric_attribute) {
    DecodeRule rule;

    if (type_token == "X") {
        rule.kind = FieldKind::TEXT;
    } else if (type_token == "9") {
        rule.kind = FieldKind::ZONED_INTEGER;
    } else if (type_token == "N") {
        rule.kind = FieldKind::DBCS_TEXT;
    } else if (starts_with(type_token, "9") && contains(type_token, "V9")) {
        rule.kind = FieldKind::ZONED_DECIMAL;
        rule.decimal_digits = digits_of(type_token).decimal_digits;
    } else if (starts_with(type_token, "V9") && type_token.find('V', 1) == StringView::npos) {
        rule.kind = FieldKind::ZONED_FRACTION;
    } else if (type_token == "PV9" || type_token == "PSV9") {
        if (numeric_attribute) {
            rule.kind = FieldKind::PACKED_DECIMAL;
            rule.scale = numeric_attribute;
        } else {
            rule.kind = FieldKind::PACKED_MISSING_SCALE;
        }
    } else if (starts_with(type_token, "P9") || starts_with(type_token, "PS9") ||
               starts_with(type_token, "S9") || starts_with(type_token, "SP9")) {
        if (contains(type_token, "V9")) {
            rule.kind = FieldKind::PACKED_DECIMAL;
            rule.scale = digits_of(type_token).decimal_digits;
        } else {
            rule.kind = FieldKind::PACKED_INTEGER;
        }
    } else {
        rule.kind = FieldKind::UNSUPPORTED;
    }

    return rule;
}

} // namespace copybook
} // namespace mfconv
