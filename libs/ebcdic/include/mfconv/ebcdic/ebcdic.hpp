// =============================================================================
// MFCONV - EBCDIC Conversion Module
// Version: 1.2.0
// =============================================================================
// Single-byte EBCDIC code pages mapped to Unicode, Unicode whitespace and
// UTF-8 helpers, and packed decimal (COMP-3) nibble handling.
// =============================================================================

#ifndef MFCONV_EBCDIC_HPP
#define MFCONV_EBCDIC_HPP

#include <mfconv/common/types.hpp>
#include <mfconv/common/error.hpp>
#include <array>

namespace mfconv {
namespace ebcdic {

// =============================================================================
// Code Pages
// =============================================================================

enum class CodePage : UInt16 {
    IBM037 = 37,     // US/Canada EBCDIC
    IBM273 = 273,    // German EBCDIC
    IBM500 = 500,    // International EBCDIC
    IBM1140 = 1140,  // IBM037 with euro sign
    IBM1148 = 1148   // IBM500 with euro sign
};

// =============================================================================
// Translation Tables (EBCDIC byte -> Unicode code point)
// =============================================================================

extern const std::array<char32_t, 256> IBM037_TO_UNICODE;
extern const std::array<char32_t, 256> IBM273_TO_UNICODE;
extern const std::array<char32_t, 256> IBM500_TO_UNICODE;
extern const std::array<char32_t, 256> IBM1140_TO_UNICODE;
extern const std::array<char32_t, 256> IBM1148_TO_UNICODE;

[[nodiscard]] const std::array<char32_t, 256>& unicode_table(CodePage cp);
[[nodiscard]] char32_t to_unicode(Byte ebcdic_char, CodePage cp);

// Accepts "500", "IBM500", "IBM-500", "CP500" (case-insensitive).
[[nodiscard]] Optional<CodePage> parse_code_page(StringView name);
[[nodiscard]] String code_page_name(CodePage cp);
[[nodiscard]] Vector<CodePage> supported_code_pages();

// =============================================================================
// Unicode Helpers
// =============================================================================

// Same set of code points Python's str.isspace() accepts, including the
// ideographic space U+3000 and the information separators 0x1C-0x1F.
[[nodiscard]] bool is_unicode_whitespace(char32_t c);
[[nodiscard]] bool is_unicode_scalar(char32_t c);
[[nodiscard]] U32StringView trim_unicode(U32StringView text);

// Caller guarantees c is a Unicode scalar value.
void append_utf8(String& out, char32_t c);
[[nodiscard]] String to_utf8(U32StringView text);
// Malformed sequences decode to U+FFFD.
[[nodiscard]] U32String from_utf8(StringView text);

// =============================================================================
// Text Conversion
// =============================================================================

// Embedded 0x00 bytes are dropped before translation.
[[nodiscard]] U32String decode_text(ConstByteSpan data, CodePage cp);

// decode_text + whitespace trim + UTF-8.
[[nodiscard]] String ebcdic_to_string(ConstByteSpan data, CodePage cp = CodePage::IBM500);

// UTF-8 in, EBCDIC out. Characters without a code point in cp become '?'.
[[nodiscard]] ByteBuffer string_to_ebcdic(StringView text, CodePage cp = CodePage::IBM500);

// =============================================================================
// Packed Decimal (COMP-3) Operations
// =============================================================================

struct PackedDigits {
    String digits;            // every digit nibble in byte order, leading zeros kept
    Byte sign_nibble = 0x0C;

    [[nodiscard]] bool negative() const;
};

// Fails with FIELD_INVALID_PACKED when any digit nibble is above 9.
// The sign nibble itself is never rejected.
[[nodiscard]] Result<PackedDigits> unpack_digits(ConstByteSpan data);

[[nodiscard]] bool is_negative_sign(Byte nibble);
[[nodiscard]] bool is_positive_sign(Byte nibble);
[[nodiscard]] bool is_preferred_sign(Byte nibble);

// Packs the digits of value (sign, '.', ',' allowed) right-aligned into
// length bytes with a C or D sign nibble.
[[nodiscard]] Result<ByteBuffer> string_to_packed(StringView value, UInt32 length);

// =============================================================================
// Constants
// =============================================================================

constexpr Byte EBCDIC_SPACE = 0x40;
constexpr Byte EBCDIC_ZERO = 0xF0;
constexpr Byte EBCDIC_QUESTION = 0x6F;

// Packed decimal sign nibbles
constexpr Byte PACK_POSITIVE_C = 0x0C;  // Preferred positive
constexpr Byte PACK_NEGATIVE_D = 0x0D;  // Preferred negative
constexpr Byte PACK_UNSIGNED_F = 0x0F;  // Unsigned positive
constexpr Byte PACK_ALTERNATE_A = 0x0A;
constexpr Byte PACK_ALTERNATE_B = 0x0B;
constexpr Byte PACK_ALTERNATE_E = 0x0E;

} // namespace ebcdic
} // namespace mfconv

#endif // MFCONV_EBCDIC_HPP
