// =============================================================================
// MFCONV - Basic Record Decoding Example
// =============================================================================

#include <iostream>
#include <sstream>
#include "mfconv/common/types.hpp"
#include "mfconv/ebcdic/ebcdic.hpp"
#include "mfconv/codemap/code_map.hpp"
#include "mfconv/copybook/copybook.hpp"
#include "mfconv/decoder/field_decoder.hpp"
#include "mfconv/pipeline/record_pipeline.hpp"

namespace eb = mfconv::ebcdic;
namespace cb = mfconv::copybook;
using mfconv::ByteBuffer;

int main() {
    std::cout << "MFCONV - Basic Record Decoding Example\n";
    std::cout << "================================================\n\n";

    // Step 1: Parse a schema
    std::cout << "Step 1: Parse Schema\n";
    cb::SchemaParser parser;
    auto schema = parser.parse(mfconv::StringView(
        "20\n"
        "CUSTOMER\n"
        "NAME,X,,10,1\n"
        "KANA,N,,4,11\n"
        "BALANCE,PS9(7)V9(2),,5,15\n"
        "FLAG,X,,1,20\n"));
    if (schema.is_error()) {
        std::cerr << schema.error().format_full();
        return 1;
    }
    std::cout << schema->to_string() << "\n";

    // Step 2: Build a small DBCS mapping table
    std::cout << "Step 2: Code Mapping Table\n";
    auto map = mfconv::codemap::CodeMap::parse("# EUC-JP hiragana\nA4A2,3042\nA4A4,3044\n");
    if (map.is_error()) {
        std::cerr << map.error().to_string() << "\n";
        return 1;
    }
    std::cout << "  Entries: " << map->size() << "\n\n";

    // Step 3: Build a record: text, DBCS, packed decimal, text
    std::cout << "Step 3: Build Record\n";
    ByteBuffer record = eb::string_to_ebcdic("TANAKA");
    record.resize(10, eb::EBCDIC_SPACE);
    record.insert(record.end(), {0xA4, 0xA2, 0xA4, 0xA4});
    auto balance = eb::string_to_packed("-1234.56", 5);
    if (balance.is_error()) {
        std::cerr << balance.error().to_string() << "\n";
        return 1;
    }
    record.insert(record.end(), balance->begin(), balance->end());
    record.push_back(0xE8);  // 'Y'
    std::cout << "  Bytes: " << mfconv::to_hex_string(record) << "\n\n";

    // Step 4: Decode through the pipeline
    std::cout << "Step 4: Decode\n";
    mfconv::decoder::FieldDecoder decoder(*map);
    mfconv::pipeline::RecordPipeline pipeline(*schema, decoder);

    std::istringstream in(std::string(record.begin(), record.end()));
    std::ostringstream out;
    auto result = pipeline.run(in, out);
    std::cout << out.str();
    std::cout << "  Result: " << result.to_string() << "\n";

    return result.is_success() ? 0 : 1;
}
