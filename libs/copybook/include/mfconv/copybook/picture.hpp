// =============================================================================
// MFCONV - Picture Format Analysis
// Version: 1.2.0
// =============================================================================
// Digit counts of compact PIC-style type tokens and the decode rule each
// token resolves to.
// =============================================================================

#ifndef MFCONV_PICTURE_HPP
#define MFCONV_PICTURE_HPP

#include <mfconv/common/types.hpp>

namespace mfconv {
namespace copybook {

// =============================================================================
// Digit Counts
// =============================================================================

struct PictureDigits {
    UInt32 integer_digits = 0;
    UInt32 decimal_digits = 0;

    bool operator==(const PictureDigits&) const = default;
};

// Recognizes [PSV]*9(n)?(V9(m)?)? only; anything else yields {0, 0}.
// integer_digits is n when present, decimal_digits is m when present.
[[nodiscard]] PictureDigits digits_of(StringView type_token);

// =============================================================================
// Decode Rules
// =============================================================================

enum class FieldKind : UInt8 {
    TEXT,                  // X
    ZONED_INTEGER,         // 9
    DBCS_TEXT,             // N
    ZONED_DECIMAL,         // 9(n)V9(m)
    ZONED_FRACTION,        // V9(m)
    PACKED_INTEGER,        // P9, PS9, S9, SP9
    PACKED_DECIMAL,        // same prefixes with V9, or PV9/PSV9 with attribute
    PACKED_MISSING_SCALE,  // PV9/PSV9 without attribute
    UNSUPPORTED
};

[[nodiscard]] StringView to_string(FieldKind kind);
[[nodiscard]] bool is_packed(FieldKind kind);

struct DecodeRule {
    FieldKind kind = FieldKind::UNSUPPORTED;
    UInt32 decimal_digits = 0;    // ZONED_DECIMAL
    Optional<UInt32> scale;       // PACKED_DECIMAL

    bool operator==(const DecodeRule&) const = default;
};

// type_token must already be upper-cased.
[[nodiscard]] DecodeRule resolve_rule(StringView type_token, Optional<UInt32> numeric_attribute);

} // namespace copybook
} // namespace mfconv

#endif // MFCONV_PICTURE_HPP
