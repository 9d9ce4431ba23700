#pragma once
// =============================================================================
// MFCONV - Converter Settings
// Version: 1.2.0
// Typed view of the [paths], [naming], [decoding] and [logging] sections
// =============================================================================

#include "mfconv/config/config.hpp"
#include "mfconv/common/logging.hpp"
#include "mfconv/decoder/field_decoder.hpp"
#include "mfconv/pipeline/batch.hpp"
#include <array>

namespace mfconv::config {

struct ConverterSettings {
    pipeline::BatchLayout layout;
    Optional<Path> code_map_path;
    decoder::DecoderOptions decoding;
    logging::LogLevel log_level = logging::LogLevel::INFO;
    Optional<Path> log_file;
    bool colored = true;

    [[nodiscard]] String to_string() const;
};

// Two hex bytes, "4242" or "42 42" or "42,42".
[[nodiscard]] Result<std::array<Byte, 2>> parse_byte_pair(StringView text);

// "2605", "U+2605", "0x2605" or a single UTF-8 character.
[[nodiscard]] Result<char32_t> parse_code_point(StringView text);

// Overlays keys present in config onto base. Any malformed value is a
// CONFIG_INVALID_VALUE carrying "section" and "key" context.
[[nodiscard]] Result<ConverterSettings> settings_from_config(const ConfigFile& config,
                                                             ConverterSettings base = {});

} // namespace mfconv::config
