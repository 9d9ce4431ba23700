#include "../framework/test_framework.hpp"
#include "mfconv/config/config.hpp"
#include "mfconv/config/settings.hpp"
#include "mfconv/common/cli.hpp"
#include <fstream>

using namespace mfconv;
using namespace mfconv::config;
using namespace mfconv::test;

// =============================================================================
// INI parsing
// =============================================================================

void test_parse_sections() {
    auto result = parse_config(
        "# converter settings\n"
        "version = 2\n"
        "[paths]\n"
        "input_dir = /data/in\n"
        "output_dir: \"/data/out dir\"\n"
        "; comment\n"
        "[logging]\n"
        "colored = no\n");
    ASSERT_TRUE(result.is_success());
    const auto& config = *result;

    ASSERT_TRUE(config.has_section("paths"));
    ASSERT_EQ(config.get_string("paths", "input_dir"), "/data/in");
    ASSERT_EQ(config.get_string("paths", "output_dir"), "/data/out dir");
    ASSERT_EQ(config.get_string("paths", "missing", "fallback"), "fallback");
    ASSERT_FALSE(config.get_bool("logging", "colored", true));
    ASSERT_EQ(config.default_section().get_int("version"), 2);
    ASSERT_FALSE(config.has("paths", "schema_dir"));
}

void test_config_value_conversions() {
    ConfigValue number("42");
    ASSERT_EQ(number.to_int().value(), 42);

    ConfigValue flag("Yes");
    ASSERT_TRUE(flag.to_bool().value());

    ConfigValue junk("4x");
    ASSERT_TRUE(junk.to_int().is_error());
    ASSERT_EQ(junk.to_int().error().code, ErrorCode::CONFIG_INVALID_VALUE);
    ASSERT_TRUE(junk.to_bool().is_error());
    ASSERT_EQ(junk.to_int_or(7), 7);
    ASSERT_EQ(ConfigValue().to_string_or("d"), "d");
}

void test_section_editing() {
    ConfigFile config;
    config.set("naming", "output_prefix", "OUT_");
    ASSERT_EQ(config.get_string("naming", "output_prefix"), "OUT_");

    config.section("naming").remove("output_prefix");
    ASSERT_FALSE(config.has("naming", "output_prefix"));

    config.set("decoding", "code_page", "IBM-037");
    String text = config.to_string();
    ASSERT_TRUE(text.find("[decoding]\ncode_page = IBM-037\n") != String::npos);
}

void test_load_and_save() {
    auto dir = std::filesystem::temp_directory_path() / "mfconv_test_config";
    std::filesystem::create_directories(dir);
    auto path = dir / "mfconv.ini";

    ConfigFile config;
    config.set("paths", "code_map", "map.txt");
    ASSERT_TRUE(config.save(path).is_success());

    auto loaded = load_config(path);
    ASSERT_TRUE(loaded.is_success());
    ASSERT_TRUE(loaded->is_loaded());
    ASSERT_EQ(loaded->get_string("paths", "code_map"), "map.txt");

    auto missing = load_config(dir / "absent.ini");
    ASSERT_EQ(missing.error().code, ErrorCode::CONFIG_FILE_NOT_FOUND);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

// =============================================================================
// Converter settings
// =============================================================================

void test_parse_byte_pair() {
    auto pair = parse_byte_pair("42 42");
    ASSERT_TRUE(pair.is_success());
    ASSERT_EQ((*pair)[0], 0x42);
    ASSERT_EQ((*pair)[1], 0x42);

    auto compact = parse_byte_pair("a1a1");
    ASSERT_EQ((*compact)[0], 0xA1);

    ASSERT_TRUE(parse_byte_pair("0x4040").is_success());
    ASSERT_TRUE(parse_byte_pair("42").is_error());
    ASSERT_TRUE(parse_byte_pair("42 4G").is_error());
}

void test_parse_code_point() {
    ASSERT_TRUE(parse_code_point("2605").value() == U'\u2605');
    ASSERT_TRUE(parse_code_point("U+FFFD").value() == U'\uFFFD');
    ASSERT_TRUE(parse_code_point("?").value() == U'?');
    ASSERT_TRUE(parse_code_point("\xE2\x98\x85").value() == U'\u2605');
    ASSERT_TRUE(parse_code_point("U+D800").is_error());
    ASSERT_TRUE(parse_code_point("").is_error());
    ASSERT_TRUE(parse_code_point("ab?").is_error());
}

void test_settings_defaults() {
    auto settings = settings_from_config(ConfigFile{});
    ASSERT_TRUE(settings.is_success());
    ASSERT_TRUE(settings->layout.input_dir == Path("./iBIN"));
    ASSERT_TRUE(settings->layout.schema_dir == Path("./iCPY"));
    ASSERT_TRUE(settings->layout.output_dir == Path("./oDAT"));
    ASSERT_EQ(settings->layout.naming.schema_prefix, "CPY_");
    ASSERT_FALSE(settings->code_map_path.has_value());
    ASSERT_TRUE(settings->decoding.code_page == ebcdic::CodePage::IBM500);
    ASSERT_TRUE(settings->decoding.placeholder == U'\u2605');
    ASSERT_TRUE(settings->log_level == logging::LogLevel::INFO);
}

void test_settings_from_config() {
    auto config = parse_config(
        "[paths]\n"
        "input_dir = in\n"
        "code_map = maps/jis.txt\n"
        "[naming]\n"
        "binary_extension = ebc\n"
        "output_prefix = OUT_\n"
        "[decoding]\n"
        "code_page = IBM-1140\n"
        "placeholder = U+003F\n"
        "dbcs_marker = 40 40\n"
        "[logging]\n"
        "level = debug\n"
        "file = logs/mfconv.log\n"
        "colored = false\n");
    auto settings = settings_from_config(*config);
    ASSERT_TRUE(settings.is_success());

    ASSERT_TRUE(settings->layout.input_dir == Path("in"));
    ASSERT_TRUE(settings->layout.output_dir == Path("./oDAT"));
    ASSERT_TRUE(settings->code_map_path == Optional<Path>(Path("maps/jis.txt")));
    ASSERT_EQ(settings->layout.naming.binary_extension, "ebc");
    ASSERT_EQ(settings->layout.naming.output_prefix, "OUT_");
    ASSERT_TRUE(settings->decoding.code_page == ebcdic::CodePage::IBM1140);
    ASSERT_TRUE(settings->decoding.placeholder == U'?');
    ASSERT_EQ(settings->decoding.dbcs_marker[0], 0x40);
    ASSERT_EQ(settings->decoding.dbcs_space[0], 0xA1);
    ASSERT_TRUE(settings->log_level == logging::LogLevel::DBG);
    ASSERT_TRUE(settings->log_file == Optional<Path>(Path("logs/mfconv.log")));
    ASSERT_FALSE(settings->colored);
}

void test_settings_invalid_values() {
    auto bad_cp = settings_from_config(*parse_config("[decoding]\ncode_page = IBM-930\n"));
    ASSERT_TRUE(bad_cp.is_error());
    ASSERT_EQ(bad_cp.error().code, ErrorCode::CONFIG_INVALID_VALUE);
    ASSERT_EQ(bad_cp.error().context_value("section"), "decoding");
    ASSERT_EQ(bad_cp.error().context_value("key"), "code_page");

    auto bad_hex = settings_from_config(*parse_config("[decoding]\ndbcs_space = ZZZZ\n"));
    ASSERT_EQ(bad_hex.error().context_value("key"), "dbcs_space");

    auto bad_level = settings_from_config(*parse_config("[logging]\nlevel = chatty\n"));
    ASSERT_EQ(bad_level.error().code, ErrorCode::CONFIG_INVALID_VALUE);

    auto bad_bool = settings_from_config(*parse_config("[logging]\ncolored = maybe\n"));
    ASSERT_TRUE(bad_bool.is_error());
}

// =============================================================================
// Command line
// =============================================================================

cli::ArgParser make_parser() {
    cli::ArgParser parser("mfconv");
    parser.add_option("map", 'm', "Mapping file")
          .add_option("input-dir", 'i', "Input directory", "./iBIN")
          .add_flag("no-color", 0, "Disable color");
    return parser;
}

void test_cli_options() {
    auto parser = make_parser();
    const char* argv[] = {"mfconv", "--map=jis.txt", "-i", "in", "--no-color"};
    ASSERT_TRUE(parser.parse(5, argv));
    ASSERT_EQ(parser.get("map").value(), "jis.txt");
    ASSERT_EQ(parser.get("input-dir", ""), "in");
    ASSERT_TRUE(parser.supplied("input-dir"));
    ASSERT_TRUE(parser.flag("no-color"));
}

void test_cli_defaults_not_supplied() {
    auto parser = make_parser();
    const char* argv[] = {"mfconv"};
    ASSERT_TRUE(parser.parse(1, argv));
    ASSERT_EQ(parser.get("input-dir").value(), "./iBIN");
    ASSERT_FALSE(parser.supplied("input-dir"));
    ASSERT_FALSE(parser.get("map").has_value());
    ASSERT_FALSE(parser.flag("no-color"));
}

void test_cli_errors() {
    auto unknown = make_parser();
    const char* argv1[] = {"mfconv", "--bogus"};
    ASSERT_FALSE(unknown.parse(2, argv1));
    ASSERT_EQ(unknown.error(), "Unknown option: --bogus");

    auto missing = make_parser();
    const char* argv2[] = {"mfconv", "--map"};
    ASSERT_FALSE(missing.parse(2, argv2));
    ASSERT_FALSE(missing.help_requested());

    auto positional = make_parser();
    const char* argv3[] = {"mfconv", "extra"};
    ASSERT_FALSE(positional.parse(2, argv3));

    auto help = make_parser();
    const char* argv4[] = {"mfconv", "-h"};
    ASSERT_FALSE(help.parse(2, argv4));
    ASSERT_TRUE(help.help_requested());

    std::ostringstream out;
    help.show_help(out);
    ASSERT_TRUE(out.str().find("--map") != String::npos);
}

int main() {
    TestSuite ini("Configuration File Tests");
    ini.add_test("Sections and values", test_parse_sections);
    ini.add_test("ConfigValue conversions", test_config_value_conversions);
    ini.add_test("Section editing", test_section_editing);
    ini.add_test("Load and save", test_load_and_save);

    TestSuite settings("Converter Settings Tests");
    settings.add_test("parse_byte_pair", test_parse_byte_pair);
    settings.add_test("parse_code_point", test_parse_code_point);
    settings.add_test("Defaults", test_settings_defaults);
    settings.add_test("From config", test_settings_from_config);
    settings.add_test("Invalid values", test_settings_invalid_values);

    TestSuite command_line("Command Line Tests");
    command_line.add_test("Options", test_cli_options);
    command_line.add_test("Defaults are not supplied", test_cli_defaults_not_supplied);
    command_line.add_test("Errors", test_cli_errors);

    TestRunner runner;
    runner.add_suite(&ini);
    runner.add_suite(&settings);
    runner.add_suite(&command_line);
    return runner.run_all();
}
