#include "../framework/test_framework.hpp"
#include "../framework/log_capture.hpp"
#include "mfconv/codemap/code_map.hpp"
#include <fstream>

using namespace mfconv;
using namespace mfconv::codemap;
using namespace mfconv::test;

namespace {

Path temp_dir() {
    auto dir = std::filesystem::temp_directory_path() / "mfconv_test_code_map";
    std::filesystem::create_directories(dir);
    return dir;
}

void write_bytes(const Path& path, const ByteBuffer& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

ByteBuffer utf16(StringView ascii, bool big_endian) {
    ByteBuffer bytes = big_endian ? ByteBuffer{0xFE, 0xFF} : ByteBuffer{0xFF, 0xFE};
    for (char c : ascii) {
        if (big_endian) {
            bytes.push_back(0x00);
            bytes.push_back(static_cast<Byte>(c));
        } else {
            bytes.push_back(static_cast<Byte>(c));
            bytes.push_back(0x00);
        }
    }
    return bytes;
}

} // namespace

void test_insert_and_lookup() {
    CodeMap map;
    ASSERT_TRUE(map.insert(" a4a2 ", "3042"));
    ASSERT_FALSE(map.insert("ZZ", "3042"));
    ASSERT_FALSE(map.insert("A4A4", ""));

    ASSERT_EQ(map.size(), 1u);
    ASSERT_TRUE(map.contains("A4A2"));
    ASSERT_FALSE(map.contains("a4a2"));

    const String* value = map.lookup(0xA4, 0xA2);
    ASSERT_TRUE(value != nullptr);
    ASSERT_EQ(*value, "3042");
    ASSERT_TRUE(map.lookup(0x00, 0x01) == nullptr);
}

void test_parse_skips_comments_and_malformed() {
    ScopedCapture capture;
    auto result = CodeMap::parse(
        "# DBCS to Unicode\n"
        "\n"
        "A4A2,3042\n"
        "a1a1 , 3000\n"
        "A4A4\n"
        "XYZ,3044\n"
        "A4A6,3046,extra\n");
    ASSERT_TRUE(result.is_success());
    ASSERT_EQ(result->size(), 2u);
    ASSERT_EQ(*result->lookup("A1A1"), "3000");
    ASSERT_EQ(result->skipped_lines(), 3u);
    ASSERT_TRUE(capture->contains("Code map line 5 skipped"));
}

void test_parse_empty_map() {
    auto result = CodeMap::parse("# nothing here\n\nbad\n");
    ASSERT_TRUE(result.is_error());
    ASSERT_EQ(result.error().code, ErrorCode::CONFIG_MAP_EMPTY);
}

void test_decode_map_bytes() {
    ASSERT_EQ(decode_map_bytes(utf16("A4A2,3042", false)), "A4A2,3042");
    ASSERT_EQ(decode_map_bytes(utf16("A4A2,3042", true)), "A4A2,3042");

    const Byte utf8_bom[] = {0xEF, 0xBB, 0xBF, 'A', '1', ',', '2'};
    ASSERT_EQ(decode_map_bytes(utf8_bom), "A1,2");

    const Byte plain[] = {'A', '1', ',', '2'};
    ASSERT_EQ(decode_map_bytes(plain), "A1,2");
}

void test_load_code_map_utf16() {
    auto path = temp_dir() / "map_utf16le.txt";
    write_bytes(path, utf16("A4A2,3042\r\nA4A4,3044\r\n", false));

    auto result = load_code_map(path);
    ASSERT_TRUE(result.is_success());
    ASSERT_EQ(result->size(), 2u);
    ASSERT_EQ(*result->lookup(0xA4, 0xA4), "3044");
}

void test_load_code_map_missing() {
    auto path = temp_dir() / "does_not_exist.txt";
    auto result = load_code_map(path);
    ASSERT_TRUE(result.is_error());
    ASSERT_EQ(result.error().code, ErrorCode::CONFIG_MAP_NOT_FOUND);
    ASSERT_EQ(result.error().context_value("path"), path.string());
    ASSERT_TRUE(is_fatal_to_run(result.error().code));

    std::error_code ec;
    std::filesystem::remove_all(temp_dir(), ec);
}

int main() {
    TestSuite suite("Code Mapping Table Tests");

    suite.add_test("insert and lookup", test_insert_and_lookup);
    suite.add_test("parse skips comments and malformed lines", test_parse_skips_comments_and_malformed);
    suite.add_test("parse empty map", test_parse_empty_map);
    suite.add_test("decode_map_bytes", test_decode_map_bytes);
    suite.add_test("load_code_map UTF-16", test_load_code_map_utf16);
    suite.add_test("load_code_map missing file", test_load_code_map_missing);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
