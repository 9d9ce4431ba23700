#include "mfconv/common/error.hpp"
#include <sstream>

namespace mfconv {

const char* MfconvErrorCategory::name() const noexcept { return "mfconv"; }

String MfconvErrorCategory::message(int code) const {
    switch (static_cast<ErrorCode>(code)) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::UNKNOWN_ERROR: return "Unknown error";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::OUT_OF_RANGE: return "Out of range";
        case ErrorCode::INVALID_STATE: return "Invalid state";
        case ErrorCode::IO_ERROR: return "I/O error";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::READ_ERROR: return "Read error";
        case ErrorCode::WRITE_ERROR: return "Write error";
        case ErrorCode::CONFIG_ERROR: return "Configuration error";
        case ErrorCode::CONFIG_FILE_NOT_FOUND: return "Configuration file not found";
        case ErrorCode::CONFIG_INVALID_VALUE: return "Invalid configuration value";
        case ErrorCode::CONFIG_MAP_NOT_FOUND: return "Code mapping file not found";
        case ErrorCode::CONFIG_MAP_EMPTY: return "Code mapping table is empty";
        case ErrorCode::SCHEMA_ERROR: return "Schema error";
        case ErrorCode::SCHEMA_INVALID_RECORD_LENGTH: return "Invalid record length";
        case ErrorCode::SCHEMA_FIELD_EXCEEDS_RECORD: return "Field exceeds record length";
        case ErrorCode::SCHEMA_NO_FIELDS: return "Schema defines no fields";
        case ErrorCode::RECORD_ERROR: return "Record error";
        case ErrorCode::RECORD_TRUNCATED: return "Truncated record";
        case ErrorCode::FIELD_ERROR: return "Field error";
        case ErrorCode::FIELD_INVALID_PACKED: return "Invalid packed decimal";
        case ErrorCode::FIELD_MISSING_SCALE: return "Packed field missing scale attribute";
        case ErrorCode::FIELD_UNSUPPORTED_TYPE: return "Unsupported field type";
        case ErrorCode::FIELD_INVALID_CODE_POINT: return "Invalid mapped code point";
        case ErrorCode::FIELD_CONVERSION_ERROR: return "Conversion error";
        default: return "Unknown mfconv error";
    }
}

const std::error_category& mfconv_error_category() noexcept {
    static MfconvErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode e) noexcept {
    return {static_cast<int>(e), mfconv_error_category()};
}

ErrorInfo::ErrorInfo(ErrorCode c, String msg, String comp, std::source_location loc)
    : code(c), message(std::move(msg)), component(std::move(comp))
    , timestamp(SystemClock::now()), location(loc) {}

ErrorInfo& ErrorInfo::with_context(String key, String value) {
    context[std::move(key)] = std::move(value);
    return *this;
}

String ErrorInfo::context_value(const String& key) const {
    auto it = context.find(key);
    return it != context.end() ? it->second : String{};
}

String ErrorInfo::to_string() const {
    return std::format("[{}] {}: {}", static_cast<int>(code),
        mfconv_error_category().message(static_cast<int>(code)), message);
}

String ErrorInfo::format_full() const {
    std::ostringstream oss;
    oss << "Error: " << to_string() << "\n";
    oss << "  Component: " << (component.empty() ? "unknown" : component) << "\n";
    oss << "  Location: " << location.file_name() << ":" << location.line() << "\n";
    oss << "  Function: " << location.function_name() << "\n";
    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [k, v] : context) {
            oss << "    " << k << ": " << v << "\n";
        }
    }
    return oss.str();
}

MfconvException::MfconvException(ErrorInfo info)
    : std::runtime_error(info.to_string()), error_info_(std::move(info)) {}

MfconvException::MfconvException(ErrorCode code, const String& message, std::source_location loc)
    : std::runtime_error(message), error_info_(code, message, "", loc) {}

String MfconvException::detailed_message() const {
    return error_info_.format_full();
}

bool is_field_error(ErrorCode code) {
    int c = static_cast<int>(code);
    return c >= 5000 && c < 6000;
}

bool is_fatal_to_run(ErrorCode code) {
    int c = static_cast<int>(code);
    return c >= 2000 && c < 3000;
}

StringView error_category_name(ErrorCode code) {
    int c = static_cast<int>(code);
    if (c >= 1000 && c < 1100) return "General";
    if (c >= 1100 && c < 2000) return "I/O";
    if (c >= 2000 && c < 3000) return "Configuration";
    if (c >= 3000 && c < 4000) return "Schema";
    if (c >= 4000 && c < 5000) return "Record";
    if (c >= 5000 && c < 6000) return "Field";
    return "Unknown";
}

String format_error_code(ErrorCode code) {
    return std::format("MFC{:04d}", static_cast<int>(code));
}

} // namespace mfconv
