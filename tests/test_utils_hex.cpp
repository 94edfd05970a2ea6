#include "fitgen/utils/hex.hpp"

#include "test_main.hpp"

#include <string>
#include <vector>

namespace {

using fitgen::core::byte;
using fitgen::utils::hex_dump;
using fitgen::utils::HexDumpOptions;
using fitgen::utils::parse_hex;
using fitgen::utils::to_hex;

void test_to_hex() {
    TEST_EXPECT_EQ(to_hex({}), "");
    const std::vector<byte> bytes{0x0E, 0x20, 0x7B, 0x08, 0xFF};
    TEST_EXPECT_EQ(to_hex(bytes), "0e 20 7b 08 ff");
}

void test_parse_hex_separators() {
    std::vector<byte> out;
    TEST_EXPECT_OK(parse_hex("0x0E, 0x20:7b-08_FF\n2e", out));
    const std::vector<byte> expected{0x0E, 0x20, 0x7B, 0x08, 0xFF, 0x2E};
    TEST_EXPECT_BYTES_EQ(out, expected);

    TEST_EXPECT_OK(parse_hex("", out));
    TEST_EXPECT(out.empty());
}

void test_parse_hex_errors() {
    std::vector<byte> out{0x01};
    TEST_EXPECT_EQ(parse_hex("0g", out),
                   fitgen::core::make_error_code(
                       fitgen::core::errc::invalid_argument));
    TEST_EXPECT(out.empty());

    // 奇数个 nibble
    TEST_EXPECT_EQ(parse_hex("abc", out),
                   fitgen::core::make_error_code(
                       fitgen::core::errc::invalid_argument));
    TEST_EXPECT(out.empty());
}

void test_hex_dump_lines() {
    std::vector<byte> bytes;
    for (int i = 0; i < 20; ++i) {
        bytes.push_back(static_cast<byte>('A' + i));
    }
    HexDumpOptions options;
    options.bytes_per_line = 8;
    const auto dump = hex_dump(bytes, options);

    TEST_EXPECT(dump.find("0000: 41 42 43 44 45 46 47 48  ABCDEFGH\n") !=
                std::string::npos);
    TEST_EXPECT(dump.find("0008: ") != std::string::npos);
    TEST_EXPECT(dump.find("0010: 51 52 53 54") != std::string::npos);
    TEST_EXPECT(dump.find("QRST\n") != std::string::npos);
}

void test_hex_dump_truncation() {
    const std::vector<byte> bytes(40, 0x00);
    HexDumpOptions options;
    options.max_bytes = 16;
    options.show_ascii = false;
    options.show_offset = false;
    const auto dump = hex_dump(bytes, options);
    TEST_EXPECT(dump.find("... (truncated, total=40 bytes)") != std::string::npos);
    TEST_EXPECT_EQ(dump.find("0000:"), std::string::npos);
}

} // namespace

int main() {
    test_to_hex();
    test_parse_hex_separators();
    test_parse_hex_errors();
    test_hex_dump_lines();
    test_hex_dump_truncation();
    return ::fitgen::tests::run_and_report();
}
