// =============================================================================
// MFCONV - Record Pipeline Implementation
// Version: 1.2.0
// =============================================================================

#include <mfconv/pipeline/record_pipeline.hpp>
#include <sstream>

namespace mfconv {
namespace pipeline {

StringView to_string(FileStatus status) {
    switch (status) {
        case FileStatus::SUCCESS:               return "SUCCESS";
        case FileStatus::COMPLETED_WITH_ERRORS: return "COMPLETED_WITH_ERRORS";
        case FileStatus::BINARY_NOT_FOUND:      return "BINARY_NOT_FOUND";
        case FileStatus::SCHEMA_NOT_FOUND:      return "SCHEMA_NOT_FOUND";
        case FileStatus::SCHEMA_PARSE_ERROR:    return "SCHEMA_PARSE_ERROR";
        case FileStatus::IO_ERROR:              return "IO_ERROR";
    }
    return "UNKNOWN";
}

StringView status_label(FileStatus status) {
    switch (status) {
        case FileStatus::SUCCESS:            return "SUCCESS";
        case FileStatus::BINARY_NOT_FOUND:   return "ERROR (BIN_NOT_FOUND)";
        case FileStatus::SCHEMA_NOT_FOUND:   return "ERROR (CPY_NOT_FOUND)";
        case FileStatus::SCHEMA_PARSE_ERROR: return "ERROR (CPY_PARSE_ERROR)";
        case FileStatus::COMPLETED_WITH_ERRORS:
        case FileStatus::IO_ERROR:
            return "ERROR (PROCESSING_ERROR)";
    }
    return "ERROR";
}

String FileDecodeResult::to_string() const {
    std::ostringstream oss;
    oss << pipeline::to_string(status) << ": " << records_written << " records, "
        << error_count << " errors";
    if (truncated) oss << " (truncated)";
    if (!message.empty()) oss << " - " << message;
    return oss.str();
}

String quote_field(StringView value) {
    String result;
    result.reserve(value.size() + 2);
    result.push_back('"');
    for (char c : value) {
        if (c == '"') result.push_back('"');
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

// =============================================================================
// RecordPipeline Implementation
// =============================================================================

RecordPipeline::RecordPipeline(const copybook::RecordSchema& schema,
                               const decoder::FieldDecoder& decoder)
    : schema_(schema)
    , decoder_(decoder)
    , logger_(logging::LogManager::instance().get_logger("pipeline")) {}

String RecordPipeline::header_line() const {
    std::vector<String> quoted;
    quoted.reserve(schema_.fields.size());
    for (const auto& field : schema_.fields) {
        quoted.push_back(quote_field(field.name));
    }
    return join(quoted, ",");
}

String RecordPipeline::format_record(ConstByteSpan record, UInt64& error_count) const {
    std::vector<String> quoted;
    quoted.reserve(schema_.fields.size());

    for (const auto& field : schema_.fields) {
        auto value = decoder_.decode(field, record.subspan(field.offset, field.byte_length));
        if (value.is_success()) {
            quoted.push_back(quote_field(value.value()));
        } else {
            ++error_count;
            quoted.push_back(quote_field(decoder::format_error_token(value.error())));
        }
    }
    return join(quoted, ",");
}

FileDecodeResult RecordPipeline::run(std::istream& in, std::ostream& out) const {
    FileDecodeResult result;
    const Size record_length = schema_.record_length;
    ByteBuffer buffer(record_length);

    out << header_line() << '\n';

    while (out) {
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(record_length));
        auto bytes_read = static_cast<Size>(in.gcount());
        if (bytes_read == 0) break;

        if (bytes_read < record_length) {
            UInt64 offset = result.records_written * record_length;
            ErrorInfo error(ErrorCode::RECORD_TRUNCATED,
                std::format("Incomplete record at byte offset {}: expected {} bytes, got {}",
                            offset, record_length, bytes_read), "pipeline");
            error.with_context("offset", std::to_string(offset))
                 .with_context("expected", std::to_string(record_length))
                 .with_context("actual", std::to_string(bytes_read));
            logger_->warn("{} {}; skipping remaining data",
                          format_error_code(error.code), error.message);
            ++result.error_count;
            result.truncated = true;
            result.record_error = std::move(error);
            break;
        }

        out << format_record(buffer, result.error_count) << '\n';
        if (out) ++result.records_written;
    }

    if (!out) {
        result.status = FileStatus::IO_ERROR;
        result.message = "Failed writing output";
        logger_->error("Write failure after {} records", result.records_written);
    } else if (in.bad()) {
        result.status = FileStatus::IO_ERROR;
        result.message = "Failed reading binary input";
        logger_->error("Read failure after {} records", result.records_written);
    } else {
        result.status = result.error_count == 0 ? FileStatus::SUCCESS
                                                : FileStatus::COMPLETED_WITH_ERRORS;
    }
    return result;
}

} // namespace pipeline
} // namespace mfconv
