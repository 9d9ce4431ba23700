// =============================================================================
// MFCONV - Batch Conversion Implementation
// Version: 1.2.0
// =============================================================================

#include <mfconv/pipeline/batch.hpp>
#include <mfconv/common/logging.hpp>
#include <mfconv/copybook/copybook.hpp>
#include <algorithm>
#include <fstream>

namespace mfconv {
namespace pipeline {

namespace {

SharedPtr<logging::Logger> logger() {
    return logging::LogManager::instance().get_logger("pipeline");
}

FileDecodeResult failed(FileStatus status, String message) {
    FileDecodeResult result;
    result.status = status;
    result.message = std::move(message);
    return result;
}

} // namespace

ConversionJob make_job(const Path& binary_path, const BatchLayout& layout) {
    const auto& naming = layout.naming;
    String base = binary_path.stem().string();

    ConversionJob job;
    job.binary_path = binary_path;
    job.schema_path = layout.schema_dir /
        (naming.schema_prefix + base + "." + naming.schema_extension);
    job.output_path = layout.output_dir /
        (naming.output_prefix + base + "." + naming.output_extension);
    return job;
}

Vector<ConversionJob> plan_jobs(const BatchLayout& layout) {
    Vector<ConversionJob> jobs;
    std::error_code ec;
    if (!std::filesystem::is_directory(layout.input_dir, ec)) {
        logger()->warn("Input directory not found: {}", layout.input_dir.string());
        return jobs;
    }

    const String extension = "." + layout.naming.binary_extension;
    Vector<Path> binaries;
    for (const auto& entry : std::filesystem::directory_iterator(layout.input_dir, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        if (entry.path().extension().string() == extension) {
            binaries.push_back(entry.path());
        }
    }
    if (ec) {
        logger()->warn("Error listing {}: {}", layout.input_dir.string(), ec.message());
    }

    std::sort(binaries.begin(), binaries.end(), [](const Path& a, const Path& b) {
        return a.filename().string() < b.filename().string();
    });

    jobs.reserve(binaries.size());
    for (const auto& binary : binaries) {
        jobs.push_back(make_job(binary, layout));
    }
    return jobs;
}

Result<void> ensure_directory(const Path& dir) {
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) return make_success();

    logger()->info("Creating output directory: {}", dir.string());
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Result<void>(ErrorInfo(ErrorCode::IO_ERROR,
            std::format("Cannot create directory {}: {}", dir.string(), ec.message()), "pipeline"));
    }
    return make_success();
}

FileDecodeResult convert_file(const ConversionJob& job, const decoder::FieldDecoder& decoder) {
    auto log = logger();
    std::error_code ec;

    if (!std::filesystem::exists(job.binary_path, ec)) {
        log->error("Binary file not found: {}", job.binary_path.string());
        return failed(FileStatus::BINARY_NOT_FOUND, "Binary file not found: " + job.binary_path.string());
    }
    if (!std::filesystem::exists(job.schema_path, ec)) {
        log->error("Schema file not found: {}", job.schema_path.string());
        return failed(FileStatus::SCHEMA_NOT_FOUND, "Schema file not found: " + job.schema_path.string());
    }

    copybook::SchemaParser parser;
    auto schema = parser.parse_file(job.schema_path);
    if (schema.is_error()) {
        log->error("Failed to parse schema {}: {}", job.schema_path.string(),
                   schema.error().to_string());
        return failed(FileStatus::SCHEMA_PARSE_ERROR, schema.error().message);
    }

    std::ifstream in(job.binary_path, std::ios::binary);
    if (!in) {
        log->error("Cannot open binary file: {}", job.binary_path.string());
        return failed(FileStatus::IO_ERROR, "Cannot open " + job.binary_path.string());
    }
    std::ofstream out(job.output_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        log->error("Cannot create output file: {}", job.output_path.string());
        return failed(FileStatus::IO_ERROR, "Cannot create " + job.output_path.string());
    }

    FileDecodeResult result;
    {
        logging::ScopedTimer timer(log, "Conversion of " + job.binary_path.filename().string());
        RecordPipeline pipeline(schema.value(), decoder);
        result = pipeline.run(in, out);
    }

    out.close();
    if (out.fail() && result.status != FileStatus::IO_ERROR) {
        result.status = FileStatus::IO_ERROR;
        result.message = "Failed writing " + job.output_path.string();
    }

    log->info("Finished {}: {} records processed, {} errors",
              job.binary_path.filename().string(), result.records_written, result.error_count);
    return result;
}

RunSummary run_batch(const Vector<ConversionJob>& jobs, const decoder::FieldDecoder& decoder) {
    auto log = logger();
    RunSummary summary;

    for (const auto& job : jobs) {
        String name = job.binary_path.filename().string();
        log->info("Processing: {}", name);
        log->info("  Using schema: {}", job.schema_path.filename().string());

        ++summary.attempted;
        FileDecodeResult result = convert_file(job, decoder);
        if (result.is_success()) {
            ++summary.succeeded;
            log->info("Status: {} - {}", status_label(result.status), name);
        } else {
            ++summary.failed;
            log->error("Status: {} - {}", status_label(result.status), name);
        }
    }

    log->info("--- Processing Summary ---");
    log->info("Total files attempted: {}", summary.attempted);
    log->info("Successful conversions: {}", summary.succeeded);
    log->info("Failed conversions: {}", summary.failed);
    return summary;
}

} // namespace pipeline
} // namespace mfconv
