// =============================================================================
// MFCONV - Field Decoder Module
// Version: 1.2.0
// =============================================================================
// Turns the raw bytes of one field into display text according to the
// field's pre-resolved decode rule. Failures come back as field errors and
// never leave the decoder as exceptions.
// =============================================================================

#ifndef MFCONV_FIELD_DECODER_HPP
#define MFCONV_FIELD_DECODER_HPP

#include <mfconv/common/types.hpp>
#include <mfconv/common/error.hpp>
#include <mfconv/common/logging.hpp>
#include <mfconv/ebcdic/ebcdic.hpp>
#include <mfconv/codemap/code_map.hpp>
#include <mfconv/copybook/copybook.hpp>

namespace mfconv {
namespace decoder {

// =============================================================================
// Options
// =============================================================================

struct DecoderOptions {
    ebcdic::CodePage code_page = ebcdic::CodePage::IBM500;
    char32_t placeholder = U'\u2605';                // BLACK STAR
    std::array<Byte, 2> dbcs_marker = {0x42, 0x42};
    std::array<Byte, 2> dbcs_space = {0xA1, 0xA1};     // EUC-JP ideographic space
};

// =============================================================================
// Numeric Formatting
// =============================================================================

// Inserts the implied decimal point into zoned digits. decimal_digits == 0
// returns the input unchanged; an empty input stays empty.
[[nodiscard]] String insert_zoned_scale(StringView digits, UInt32 decimal_digits);

// Formats unpacked packed-decimal digits. No scale means integer.
[[nodiscard]] String format_packed(StringView digits, bool negative, Optional<UInt32> scale);

// Copy of text without leading '0' characters.
[[nodiscard]] String strip_leading_zeros(StringView text);

// =============================================================================
// Field Decoder
// =============================================================================

class FieldDecoder {
private:
    const codemap::CodeMap& code_map_;
    DecoderOptions options_;
    SharedPtr<logging::Logger> logger_;

    [[nodiscard]] String decode_text(ConstByteSpan data) const;
    [[nodiscard]] Result<String> decode_dbcs(const copybook::FieldDefinition& field,
                                             ConstByteSpan data) const;
    [[nodiscard]] Result<String> decode_packed(const copybook::FieldDefinition& field,
                                               ConstByteSpan data) const;
    [[nodiscard]] Result<String> decode_by_rule(const copybook::FieldDefinition& field,
                                                ConstByteSpan data) const;
    [[nodiscard]] ErrorInfo field_error(ErrorCode code, String message,
                                        const copybook::FieldDefinition& field,
                                        ConstByteSpan data) const;

public:
    // code_map must outlive the decoder.
    explicit FieldDecoder(const codemap::CodeMap& code_map, DecoderOptions options = {});

    // data is exactly the field's bytes within the record.
    [[nodiscard]] Result<String> decode(const copybook::FieldDefinition& field,
                                        ConstByteSpan data) const;

    // Marker pairs replaced by the full-width space pair, scanning left to right
    // at any alignment without overlap.
    [[nodiscard]] ByteBuffer replace_dbcs_markers(ConstByteSpan data) const;

    [[nodiscard]] const DecoderOptions& options() const { return options_; }
    [[nodiscard]] const codemap::CodeMap& code_map() const { return code_map_; }
};

// =============================================================================
// Error Tokens
// =============================================================================

// Inline text written in place of a failed field's value.
[[nodiscard]] String format_error_token(const ErrorInfo& error);

} // namespace decoder
} // namespace mfconv

#endif // MFCONV_FIELD_DECODER_HPP
