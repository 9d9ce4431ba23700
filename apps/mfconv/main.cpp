// =============================================================================
// MFCONV - Mainframe Record Converter
// Version: 1.2.0
// Converts fixed-length EBCDIC record files to quoted UTF-8 text using
// copybook-derived schemas and a DBCS code mapping table
// =============================================================================

#include <iostream>
#include <string>
#include <unistd.h>

#include "mfconv/common/types.hpp"
#include "mfconv/common/error.hpp"
#include "mfconv/common/logging.hpp"
#include "mfconv/common/cli.hpp"
#include "mfconv/config/config.hpp"
#include "mfconv/config/settings.hpp"
#include "mfconv/ebcdic/ebcdic.hpp"
#include "mfconv/codemap/code_map.hpp"
#include "mfconv/decoder/field_decoder.hpp"
#include "mfconv/pipeline/batch.hpp"

namespace cfg = mfconv::config;
namespace eb = mfconv::ebcdic;
namespace lg = mfconv::logging;
namespace pl = mfconv::pipeline;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FILES_FAILED = 1;
constexpr int EXIT_USAGE = 2;

void print_header() {
    std::cout << R"(
================================================================================
                    MFCONV v1.2.0
                    Mainframe Record Converter
================================================================================
)" << std::endl;
}

void list_code_pages() {
    std::cout << "Supported code pages:\n";
    for (auto cp : eb::supported_code_pages()) {
        std::cout << "  " << eb::code_page_name(cp) << "\n";
    }
}

mfconv::cli::ArgParser make_parser() {
    mfconv::cli::ArgParser parser("mfconv",
        "Converts EBCDIC record files in the input directory to UTF-8 text.");
    parser.add_option("config", 'c', "INI configuration file")
          .add_option("map", 'm', "DBCS code mapping file")
          .add_option("input-dir", 'i', "Directory of binary record files")
          .add_option("schema-dir", 's', "Directory of schema files")
          .add_option("output-dir", 'o', "Directory for converted output")
          .add_option("code-page", 'p', "Single-byte EBCDIC code page (e.g. IBM-500)")
          .add_option("log-level", 'l', "TRACE, DEBUG, INFO, WARN, ERROR, FATAL or OFF")
          .add_option("log-file", 0, "Also write log records to this file")
          .add_flag("no-color", 0, "Disable colored console output")
          .add_flag("list-code-pages", 0, "List supported code pages and exit");
    return parser;
}

// Command line values override the configuration file
mfconv::Result<cfg::ConverterSettings> apply_cli(const mfconv::cli::ArgParser& args,
                                                 cfg::ConverterSettings settings) {
    if (args.supplied("map")) settings.code_map_path = mfconv::Path(*args.get("map"));
    if (args.supplied("input-dir")) settings.layout.input_dir = *args.get("input-dir");
    if (args.supplied("schema-dir")) settings.layout.schema_dir = *args.get("schema-dir");
    if (args.supplied("output-dir")) settings.layout.output_dir = *args.get("output-dir");
    if (args.supplied("log-file")) settings.log_file = mfconv::Path(*args.get("log-file"));
    if (args.flag("no-color")) settings.colored = false;

    if (args.supplied("code-page")) {
        auto cp = eb::parse_code_page(*args.get("code-page"));
        if (!cp) {
            return mfconv::make_error<cfg::ConverterSettings>(mfconv::ErrorCode::CONFIG_INVALID_VALUE,
                "Unknown code page: " + *args.get("code-page"));
        }
        settings.decoding.code_page = *cp;
    }
    if (args.supplied("log-level")) {
        auto level = lg::parse_log_level(*args.get("log-level"));
        if (!level) {
            return mfconv::make_error<cfg::ConverterSettings>(mfconv::ErrorCode::CONFIG_INVALID_VALUE,
                "Unknown log level: " + *args.get("log-level"));
        }
        settings.log_level = *level;
    }
    return settings;
}

mfconv::Result<cfg::ConverterSettings> resolve_settings(const mfconv::cli::ArgParser& args) {
    cfg::ConverterSettings settings;
    if (args.supplied("config")) {
        auto config = cfg::load_config(*args.get("config"));
        if (config.is_error()) return config.error();
        auto from_file = cfg::settings_from_config(config.value(), settings);
        if (from_file.is_error()) return from_file.error();
        settings = std::move(from_file.value());
    }
    return apply_cli(args, std::move(settings));
}

// Asks for the mapping file only when a person is at the terminal
mfconv::Optional<mfconv::Path> prompt_for_map() {
    if (!isatty(STDIN_FILENO)) {
        return mfconv::nullopt;
    }
    std::cout << "Path to DBCS code mapping file: " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        return mfconv::nullopt;
    }
    auto path = mfconv::trim(line);
    if (path.empty()) {
        return mfconv::nullopt;
    }
    return mfconv::Path(path);
}

int report_config_error(const mfconv::ErrorInfo& error) {
    auto log = lg::LogManager::instance().get_logger("mfconv");
    log->fatal("{} {}", mfconv::format_error_code(error.code), error.to_string());
    for (const auto& [key, value] : error.context) {
        log->fatal("  {}: {}", key, value);
    }
    return EXIT_USAGE;
}

int run(int argc, char* argv[]) {
    auto args = make_parser();
    if (!args.parse(argc, argv)) {
        if (args.help_requested()) {
            args.show_help(std::cout);
            return EXIT_OK;
        }
        std::cerr << "Error: " << args.error() << "\n\n";
        args.show_help(std::cerr);
        return EXIT_USAGE;
    }

    if (args.flag("list-code-pages")) {
        list_code_pages();
        return EXIT_OK;
    }

    auto settings_result = resolve_settings(args);
    if (settings_result.is_error()) {
        lg::LogManager::instance().configure_default();
        throw mfconv::MfconvException(settings_result.error());
    }
    auto settings = std::move(settings_result.value());

    lg::LogManager::instance().configure_default(settings.log_level, settings.log_file,
                                                 lg::LogLevel::DBG, settings.colored);
    auto log = lg::LogManager::instance().get_logger("mfconv");

    print_header();
    log->debug("Effective settings:\n{}", settings.to_string());

    if (!settings.code_map_path) {
        settings.code_map_path = prompt_for_map();
    }
    if (!settings.code_map_path) {
        throw mfconv::MfconvException(mfconv::ErrorInfo(mfconv::ErrorCode::CONFIG_MAP_NOT_FOUND,
            "No code mapping file configured (use --map or [paths] code_map)", "mfconv"));
    }

    auto code_map = mfconv::codemap::load_code_map(*settings.code_map_path);
    if (code_map.is_error()) {
        throw mfconv::MfconvException(code_map.error());
    }

    mfconv::decoder::FieldDecoder decoder(code_map.value(), settings.decoding);
    log->info("Code page: {}", eb::code_page_name(settings.decoding.code_page));

    auto jobs = pl::plan_jobs(settings.layout);
    if (jobs.empty()) {
        log->info("No .{} files found in {}", settings.layout.naming.binary_extension,
                  settings.layout.input_dir.string());
        return EXIT_OK;
    }

    auto dir_result = pl::ensure_directory(settings.layout.output_dir);
    if (dir_result.is_error()) {
        throw mfconv::MfconvException(dir_result.error());
    }

    auto summary = pl::run_batch(jobs, decoder);
    lg::LogManager::instance().shutdown();
    return summary.all_succeeded() ? EXIT_OK : EXIT_FILES_FAILED;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const mfconv::MfconvException& e) {
        int code = report_config_error(e.error_info());
        lg::LogManager::instance().shutdown();
        return code;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return EXIT_USAGE;
    }
}
