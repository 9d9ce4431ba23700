// =============================================================================
// MFCONV - Code Mapping Table Implementation
// Version: 1.2.0
// =============================================================================

#include <mfconv/codemap/code_map.hpp>
#include <mfconv/common/logging.hpp>
#include <mfconv/ebcdic/ebcdic.hpp>
#include <fstream>
#include <iterator>

namespace mfconv {
namespace codemap {

namespace {

SharedPtr<logging::Logger> logger() {
    return logging::LogManager::instance().get_logger("codemap");
}

String utf16_to_utf8(ConstByteSpan data, bool big_endian) {
    String result;
    result.reserve(data.size() / 2);
    auto unit_at = [&](Size i) -> char32_t {
        return big_endian
            ? static_cast<char32_t>((data[i] << 8) | data[i + 1])
            : static_cast<char32_t>((data[i + 1] << 8) | data[i]);
    };

    Size i = 0;
    while (i + 1 < data.size()) {
        char32_t unit = unit_at(i);
        i += 2;
        if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < data.size()) {
            char32_t low = unit_at(i);
            if (low >= 0xDC00 && low <= 0xDFFF) {
                i += 2;
                ebcdic::append_utf8(result, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                continue;
            }
        }
        // Lone surrogates cannot be encoded; only ASCII matters for map lines
        if (unit >= 0xD800 && unit <= 0xDFFF) unit = 0xFFFD;
        ebcdic::append_utf8(result, unit);
    }
    return result;
}

} // namespace

bool CodeMap::insert(StringView source_hex, StringView target_hex) {
    String source = to_upper(trim(source_hex));
    String target = to_upper(trim(target_hex));
    if (!is_hex_string(source) || !is_hex_string(target)) return false;
    entries_[std::move(source)] = std::move(target);
    return true;
}

const String* CodeMap::lookup(StringView key) const {
    auto it = entries_.find(String(key));
    return it != entries_.end() ? &it->second : nullptr;
}

const String* CodeMap::lookup(Byte high, Byte low) const {
    const Byte pair[2] = {high, low};
    return lookup(to_hex_string(ConstByteSpan(pair, 2)));
}

Result<CodeMap> CodeMap::parse(StringView content) {
    CodeMap map;
    auto lines = split_lines(content);

    for (Size i = 0; i < lines.size(); ++i) {
        String line = trim(lines[i]);
        if (line.empty() || line[0] == '#') continue;

        auto parts = split(line, ',');
        if (parts.size() != 2 || !map.insert(parts[0], parts[1])) {
            ++map.skipped_lines_;
            logger()->warn("Code map line {} skipped: '{}'", i + 1, line);
        }
    }

    if (map.empty()) {
        return make_error<CodeMap>(ErrorCode::CONFIG_MAP_EMPTY,
            "Code mapping table contains no usable entries");
    }
    return make_success(std::move(map));
}

String decode_map_bytes(ConstByteSpan raw) {
    if (raw.size() >= 2 && raw[0] == 0xFF && raw[1] == 0xFE) {
        return utf16_to_utf8(raw.subspan(2), false);
    }
    if (raw.size() >= 2 && raw[0] == 0xFE && raw[1] == 0xFF) {
        return utf16_to_utf8(raw.subspan(2), true);
    }
    if (raw.size() >= 3 && raw[0] == 0xEF && raw[1] == 0xBB && raw[2] == 0xBF) {
        raw = raw.subspan(3);
    }
    return String(reinterpret_cast<const char*>(raw.data()), raw.size());
}

Result<CodeMap> load_code_map(const Path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Result<CodeMap>(ErrorInfo(ErrorCode::CONFIG_MAP_NOT_FOUND,
            std::format("Code mapping file not found: {}", path.string()), "codemap")
            .with_context("path", path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error<CodeMap>(ErrorCode::READ_ERROR,
            std::format("Cannot open code mapping file: {}", path.string()));
    }
    ByteBuffer raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return make_error<CodeMap>(ErrorCode::READ_ERROR,
            std::format("Failed reading code mapping file: {}", path.string()));
    }

    auto result = CodeMap::parse(decode_map_bytes(raw));
    if (result.is_success()) {
        logger()->info("Loaded {} code mappings from {} ({} lines skipped)",
                    result->size(), path.string(), result->skipped_lines());
    }
    return result;
}

} // namespace codemap
} // namespace mfconv
