#include "fitgen/fit/crc.hpp"

#include "test_main.hpp"

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

namespace {

using fitgen::core::byte;
using fitgen::core::bytes_view;
using fitgen::fit::crc16;
using fitgen::fit::crc16_update;

bytes_view as_bytes(std::string_view s) {
    return bytes_view{reinterpret_cast<const byte *>(s.data()), s.size()};
}

void test_empty_is_zero() {
    TEST_EXPECT_EQ(crc16(bytes_view{}), std::uint16_t{0});
}

void test_golden_vectors() {
    const std::array<byte, 1> zero{0x00};
    const std::array<byte, 1> one{0x01};
    const std::array<byte, 1> ff{0xFF};
    TEST_EXPECT_EQ(crc16(zero), std::uint16_t{0x0000});
    TEST_EXPECT_EQ(crc16(one), std::uint16_t{0xC0C1});
    TEST_EXPECT_EQ(crc16(ff), std::uint16_t{0x4040});

    // 标准校验串。
    TEST_EXPECT_EQ(crc16(as_bytes("123456789")), std::uint16_t{0xBB3D});
    TEST_EXPECT_EQ(crc16(as_bytes(".FIT")), std::uint16_t{0x92DE});

    std::array<byte, 16> seq{};
    for (std::size_t i = 0; i < seq.size(); ++i) {
        seq[i] = static_cast<byte>(i);
    }
    TEST_EXPECT_EQ(crc16(seq), std::uint16_t{0x170A});
}

void test_file_header_vector() {
    // "Test Workout" 三步示例的文件头前 12 字节。
    const std::array<byte, 12> header{0x0E, 0x20, 0x7B, 0x08, 0xDC, 0x00,
                                      0x00, 0x00, 0x2E, 0x46, 0x49, 0x54};
    TEST_EXPECT_EQ(crc16(header), std::uint16_t{0x8285});
}

void test_incremental_matches_bulk() {
    const auto data = as_bytes("workout step 1 warmup 300");
    std::uint16_t crc = 0;
    for (const auto b : data) {
        crc = crc16_update(crc, b);
    }
    TEST_EXPECT_EQ(crc, crc16(data));
}

void test_deterministic() {
    std::vector<byte> data(1024);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<byte>((i * 31u) & 0xFFu);
    }
    const auto a = crc16(data);
    const auto b = crc16(data);
    TEST_EXPECT_EQ(a, b);

    data[512] ^= 0x01;
    TEST_EXPECT(crc16(data) != a);
}

void test_trailing_crc_self_check() {
    // 追加小端 CRC 后，整体校验值为 0（用于校验整文件）。
    std::vector<byte> data{0x0E, 0x10, 0x43, 0x08, 0x2E, 0x46, 0x49, 0x54};
    const auto crc = crc16(data);
    data.push_back(static_cast<byte>(crc & 0xFF));
    data.push_back(static_cast<byte>((crc >> 8) & 0xFF));
    TEST_EXPECT_EQ(crc16(data), std::uint16_t{0});
}

} // namespace

int main() {
    test_empty_is_zero();
    test_golden_vectors();
    test_file_header_vector();
    test_incremental_matches_bulk();
    test_deterministic();
    test_trailing_crc_self_check();
    return ::fitgen::tests::run_and_report();
}
