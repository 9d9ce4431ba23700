#pragma once
// =============================================================================
// MFCONV - Core Types (C++20)
// Version: 1.2.0
// =============================================================================

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <optional>
#include <variant>
#include <memory>
#include <functional>
#include <chrono>
#include <format>
#include <filesystem>
#include <source_location>
#include <unordered_map>

namespace mfconv {

// =============================================================================
// Fundamental Types
// =============================================================================
using Byte = std::uint8_t;
using Int8 = std::int8_t;
using UInt8 = std::uint8_t;
using Int16 = std::int16_t;
using UInt16 = std::uint16_t;
using Int32 = std::int32_t;
using UInt32 = std::uint32_t;
using Int64 = std::int64_t;
using UInt64 = std::uint64_t;
using Float64 = double;
using Size = std::size_t;

// =============================================================================
// String Types
// =============================================================================
using String = std::string;
using StringView = std::string_view;
using U32String = std::u32string;
using U32StringView = std::u32string_view;

// =============================================================================
// Container Types
// =============================================================================
using ByteBuffer = std::vector<Byte>;
using ByteSpan = std::span<Byte>;
using ConstByteSpan = std::span<const Byte>;
template<typename T> using Vector = std::vector<T>;

// =============================================================================
// Smart Pointers
// =============================================================================
template<typename T> using UniquePtr = std::unique_ptr<T>;
template<typename T> using SharedPtr = std::shared_ptr<T>;

// =============================================================================
// Optional and Variant
// =============================================================================
template<typename T> using Optional = std::optional<T>;
template<typename... Ts> using Variant = std::variant<Ts...>;
inline constexpr std::nullopt_t nullopt = std::nullopt;

// =============================================================================
// Time Types
// =============================================================================
using Clock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using SystemTimePoint = SystemClock::time_point;
using Duration = Clock::duration;
using Microseconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;

// =============================================================================
// Filesystem
// =============================================================================
using Path = std::filesystem::path;

// =============================================================================
// String Utilities
// =============================================================================
[[nodiscard]] String to_upper(StringView str);
[[nodiscard]] String to_lower(StringView str);
[[nodiscard]] String trim(StringView str);
[[nodiscard]] std::vector<String> split(StringView str, char delimiter);
[[nodiscard]] std::vector<String> split_lines(StringView text);
[[nodiscard]] String join(const std::vector<String>& strings, StringView delimiter);
[[nodiscard]] bool starts_with(StringView str, StringView prefix);
[[nodiscard]] bool contains(StringView str, StringView substr);
[[nodiscard]] String replace_all(StringView str, StringView from, StringView to);

// Strict decimal parsing: optional sign, digits only, no surrounding garbage.
[[nodiscard]] Optional<Int64> parse_int64(StringView str);
[[nodiscard]] bool is_all_digits(StringView str);

// =============================================================================
// Hex Encoding
// =============================================================================
[[nodiscard]] String to_hex_string(ConstByteSpan data, bool uppercase = true);
[[nodiscard]] bool is_hex_string(StringView str);
[[nodiscard]] Optional<UInt64> parse_hex(StringView hex);

} // namespace mfconv
