// =============================================================================
// MFCONV - Record Pipeline Module
// Version: 1.2.0
// =============================================================================
// Streams fixed-length records from a binary source, decodes every field and
// writes one quoted, comma-separated line per record.
// =============================================================================

#ifndef MFCONV_RECORD_PIPELINE_HPP
#define MFCONV_RECORD_PIPELINE_HPP

#include <mfconv/common/types.hpp>
#include <mfconv/common/error.hpp>
#include <mfconv/common/logging.hpp>
#include <mfconv/copybook/copybook.hpp>
#include <mfconv/decoder/field_decoder.hpp>
#include <istream>
#include <ostream>

namespace mfconv {
namespace pipeline {

// =============================================================================
// File Result
// =============================================================================

enum class FileStatus : UInt8 {
    SUCCESS,
    COMPLETED_WITH_ERRORS,
    BINARY_NOT_FOUND,
    SCHEMA_NOT_FOUND,
    SCHEMA_PARSE_ERROR,
    IO_ERROR
};

[[nodiscard]] StringView to_string(FileStatus status);

// Batch status label: "SUCCESS" or "ERROR (<reason>)".
[[nodiscard]] StringView status_label(FileStatus status);

struct FileDecodeResult {
    UInt64 records_written = 0;
    UInt64 error_count = 0;       // field errors plus a truncated tail
    bool truncated = false;
    Optional<ErrorInfo> record_error;   // RECORD_TRUNCATED for a short tail
    FileStatus status = FileStatus::SUCCESS;
    String message;               // reason for a file-level failure

    [[nodiscard]] bool is_success() const { return status == FileStatus::SUCCESS; }
    [[nodiscard]] String to_string() const;
};

// =============================================================================
// Serialization
// =============================================================================

// Wraps value in double quotes, doubling embedded quotes.
[[nodiscard]] String quote_field(StringView value);

// =============================================================================
// Record Pipeline
// =============================================================================

class RecordPipeline {
private:
    const copybook::RecordSchema& schema_;
    const decoder::FieldDecoder& decoder_;
    SharedPtr<logging::Logger> logger_;

public:
    // schema and decoder must outlive the pipeline.
    RecordPipeline(const copybook::RecordSchema& schema, const decoder::FieldDecoder& decoder);

    [[nodiscard]] String header_line() const;

    // One output line (without newline) for a record of exactly
    // record_length bytes. Adds the number of failed fields to error_count.
    [[nodiscard]] String format_record(ConstByteSpan record, UInt64& error_count) const;

    FileDecodeResult run(std::istream& in, std::ostream& out) const;
};

} // namespace pipeline
} // namespace mfconv

#endif // MFCONV_RECORD_PIPELINE_HPP
