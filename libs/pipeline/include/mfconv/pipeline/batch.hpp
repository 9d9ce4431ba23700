// =============================================================================
// MFCONV - Batch Conversion
// Version: 1.2.0
// =============================================================================
// Pairs each binary input with its schema and output file by naming
// convention and converts them one after another.
// =============================================================================

#ifndef MFCONV_BATCH_HPP
#define MFCONV_BATCH_HPP

#include <mfconv/common/types.hpp>
#include <mfconv/common/error.hpp>
#include <mfconv/decoder/field_decoder.hpp>
#include <mfconv/pipeline/record_pipeline.hpp>

namespace mfconv {
namespace pipeline {

// <base>.bin -> CPY_<base>.txt -> LOAD_<base>.dat
struct NamingConvention {
    String binary_extension = "bin";
    String schema_prefix = "CPY_";
    String schema_extension = "txt";
    String output_prefix = "LOAD_";
    String output_extension = "dat";
};

struct BatchLayout {
    Path input_dir = "./iBIN";
    Path schema_dir = "./iCPY";
    Path output_dir = "./oDAT";
    NamingConvention naming;
};

struct ConversionJob {
    Path binary_path;
    Path schema_path;
    Path output_path;
};

struct RunSummary {
    UInt64 attempted = 0;
    UInt64 succeeded = 0;
    UInt64 failed = 0;

    [[nodiscard]] bool all_succeeded() const { return failed == 0; }
};

[[nodiscard]] ConversionJob make_job(const Path& binary_path, const BatchLayout& layout);

// Binary files in layout.input_dir with the configured extension, sorted by
// file name. A missing input directory logs a warning and yields no jobs.
[[nodiscard]] Vector<ConversionJob> plan_jobs(const BatchLayout& layout);

// Creates the directory (and parents) when missing.
[[nodiscard]] Result<void> ensure_directory(const Path& dir);

[[nodiscard]] FileDecodeResult convert_file(const ConversionJob& job,
                                            const decoder::FieldDecoder& decoder);

RunSummary run_batch(const Vector<ConversionJob>& jobs, const decoder::FieldDecoder& decoder);

} // namespace pipeline
} // namespace mfconv

#endif // MFCONV_BATCH_HPP
