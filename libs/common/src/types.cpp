#include "mfconv/common/types.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace mfconv {

String to_upper(StringView str) {
    String result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

String to_lower(StringView str) {
    String result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

String trim(StringView str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == StringView::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return String(str.substr(start, end - start + 1));
}

std::vector<String> split(StringView str, char delimiter) {
    std::vector<String> result;
    Size start = 0, end = 0;
    while ((end = str.find(delimiter, start)) != StringView::npos) {
        result.emplace_back(str.substr(start, end - start));
        start = end + 1;
    }
    result.emplace_back(str.substr(start));
    return result;
}

std::vector<String> split_lines(StringView text) {
    std::vector<String> lines;
    if (text.empty()) return lines;
    Size start = 0, end = 0;
    while ((end = text.find('\n', start)) != StringView::npos) {
        StringView line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);
        start = end + 1;
    }
    // No phantom empty line after a final newline
    if (start < text.size()) {
        StringView line = text.substr(start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);
    }
    return lines;
}

String join(const std::vector<String>& strings, StringView delimiter) {
    if (strings.empty()) return "";
    String result = strings[0];
    for (Size i = 1; i < strings.size(); ++i) {
        result += delimiter;
        result += strings[i];
    }
    return result;
}

bool starts_with(StringView str, StringView prefix) {
    return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

bool contains(StringView str, StringView substr) {
    return str.find(substr) != StringView::npos;
}

String replace_all(StringView str, StringView from, StringView to) {
    String result(str);
    if (from.empty()) return result;
    Size pos = 0;
    while ((pos = result.find(from, pos)) != String::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }
    return result;
}

bool is_all_digits(StringView str) {
    if (str.empty()) return false;
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return c >= '0' && c <= '9'; });
}

Optional<Int64> parse_int64(StringView str) {
    StringView sv = str;
    bool negative = false;
    if (!sv.empty() && (sv.front() == '+' || sv.front() == '-')) {
        negative = sv.front() == '-';
        sv.remove_prefix(1);
    }
    if (!is_all_digits(sv)) return nullopt;

    constexpr UInt64 limit = static_cast<UInt64>(std::numeric_limits<Int64>::max());
    UInt64 value = 0;
    for (char c : sv) {
        UInt64 digit = static_cast<UInt64>(c - '0');
        if (value > (limit - digit) / 10) return nullopt;
        value = value * 10 + digit;
    }
    Int64 result = static_cast<Int64>(value);
    return negative ? -result : result;
}

String to_hex_string(ConstByteSpan data, bool uppercase) {
    static const char UPPER[] = "0123456789ABCDEF";
    static const char LOWER[] = "0123456789abcdef";
    const char* digits = uppercase ? UPPER : LOWER;
    String result;
    result.reserve(data.size() * 2);
    for (Byte b : data) {
        result.push_back(digits[(b >> 4) & 0xF]);
        result.push_back(digits[b & 0xF]);
    }
    return result;
}

bool is_hex_string(StringView str) {
    if (str.empty()) return false;
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

Optional<UInt64> parse_hex(StringView hex) {
    if (!is_hex_string(hex)) return nullopt;
    UInt64 value = 0;
    for (char c : hex) {
        UInt64 nibble = 0;
        if (c >= '0' && c <= '9') nibble = static_cast<UInt64>(c - '0');
        else if (c >= 'A' && c <= 'F') nibble = static_cast<UInt64>(10 + c - 'A');
        else nibble = static_cast<UInt64>(10 + c - 'a');
        if (value > (std::numeric_limits<UInt64>::max() >> 4)) return nullopt;
        value = (value << 4) | nibble;
    }
    return value;
}

} // namespace mfconv
