// =============================================================================
// MFCONV - Code Mapping Table
// Version: 1.2.0
// =============================================================================
// Maps 4-hex-digit double-byte source codes (JEF style) to Unicode code
// points given as hex strings. Loaded once per run, read-only afterwards.
// =============================================================================

#ifndef MFCONV_CODE_MAP_HPP
#define MFCONV_CODE_MAP_HPP

#include <mfconv/common/types.hpp>
#include <mfconv/common/error.hpp>

namespace mfconv {
namespace codemap {

class CodeMap {
private:
    std::unordered_map<String, String> entries_;
    Size skipped_lines_ = 0;

public:
    CodeMap() = default;

    // Both sides are trimmed and upper-cased. Returns false (and stores
    // nothing) unless both are non-empty hex.
    bool insert(StringView source_hex, StringView target_hex);

    // Key is the upper-case hex of the source code, e.g. "A4A2".
    [[nodiscard]] const String* lookup(StringView key) const;
    [[nodiscard]] const String* lookup(Byte high, Byte low) const;
    [[nodiscard]] bool contains(StringView key) const { return lookup(key) != nullptr; }

    [[nodiscard]] Size size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] Size skipped_lines() const { return skipped_lines_; }

    // Lines "SRC,DST"; blank and '#' lines ignored, malformed lines skipped
    // with a warning. No usable entries yields CONFIG_MAP_EMPTY.
    [[nodiscard]] static Result<CodeMap> parse(StringView content);
};

// Detects a UTF-16 LE/BE byte order mark and transcodes to UTF-8; otherwise
// treats the bytes as UTF-8 and drops a UTF-8 BOM.
[[nodiscard]] String decode_map_bytes(ConstByteSpan raw);

// CONFIG_MAP_NOT_FOUND when the file is missing, READ_ERROR when unreadable.
[[nodiscard]] Result<CodeMap> load_code_map(const Path& path);

} // namespace codemap
} // namespace mfconv

#endif // MFCONV_CODE_MAP_HPP
