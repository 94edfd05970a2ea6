#include "fitgen/fit/file.hpp"

#include "fitgen/core/error.hpp"
#include "fitgen/fit/crc.hpp"
#include "fitgen/utils/hex.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace {

using fitgen::core::byte;
using fitgen::core::bytes_view;
using fitgen::fit::crc16;
using fitgen::fit::encode_workout_file;
using fitgen::fit::EncodeOptions;
using fitgen::workout::StepSpec;
using fitgen::workout::WorkoutSpec;

constexpr std::uint32_t kFixedTime = 1000000000u;

WorkoutSpec sample_workout() {
    WorkoutSpec spec;
    spec.name = "Test Workout";
    spec.steps.push_back(StepSpec{"warmup", std::string{"300"}});
    spec.steps.push_back(StepSpec{"run", std::string{"600"}});
    spec.steps.push_back(StepSpec{"cooldown", std::string{"300"}});
    return spec;
}

EncodeOptions fixed_time() {
    EncodeOptions options;
    options.time_created = kFixedTime;
    return options;
}

std::vector<byte> encode_ok(const WorkoutSpec &spec,
                            const EncodeOptions &options) {
    std::vector<byte> out;
    TEST_EXPECT_OK(encode_workout_file(spec, out, options));
    return out;
}

std::uint32_t le32_at(const std::vector<byte> &v, std::size_t off) {
    return static_cast<std::uint32_t>(v[off]) |
           (static_cast<std::uint32_t>(v[off + 1]) << 8) |
           (static_cast<std::uint32_t>(v[off + 2]) << 16) |
           (static_cast<std::uint32_t>(v[off + 3]) << 24);
}

std::uint16_t le16_at(const std::vector<byte> &v, std::size_t off) {
    return static_cast<std::uint16_t>(v[off] | (v[off + 1] << 8));
}

void expect_structure(const std::vector<byte> &file) {
    TEST_EXPECT(file.size() >= fitgen::fit::kFileHeaderSize + 2);
    if (file.size() < fitgen::fit::kFileHeaderSize + 2) {
        return;
    }

    // 固定字段
    TEST_EXPECT_EQ(file[0], byte{14});
    TEST_EXPECT_EQ(file[1], byte{0x20});
    TEST_EXPECT_EQ(le16_at(file, 2), std::uint16_t{2171});
    TEST_EXPECT_EQ(file[8], byte{'.'});
    TEST_EXPECT_EQ(file[9], byte{'F'});
    TEST_EXPECT_EQ(file[10], byte{'I'});
    TEST_EXPECT_EQ(file[11], byte{'T'});

    // data_size == 记录区长度
    TEST_EXPECT_EQ(static_cast<std::size_t>(le32_at(file, 4)),
                   file.size() - fitgen::fit::kFileHeaderSize - 2);

    // 头部 CRC 与整文件 CRC 均可独立复算
    TEST_EXPECT_EQ(le16_at(file, 12), crc16(bytes_view{file.data(), 12}));
    TEST_EXPECT_EQ(le16_at(file, file.size() - 2),
                   crc16(bytes_view{file.data(), file.size() - 2}));
    TEST_EXPECT_EQ(crc16(file), std::uint16_t{0});
}

void test_reference_file() {
    const auto file = encode_ok(sample_workout(), fixed_time());

    std::vector<byte> expected;
    TEST_EXPECT_OK(fitgen::utils::parse_hex(
        "0e 20 7b 08 dc 00 00 00 2e 46 49 54 85 82 40 00"
        "00 00 00 05 00 01 00 01 02 84 02 02 84 03 04 86"
        "04 04 86 00 06 ff ff 00 00 12 34 56 78 00 ca 9a"
        "3b 41 00 00 1a 00 03 04 10 07 05 01 00 06 02 84"
        "01 54 65 73 74 20 57 6f 72 6b 6f 75 74 00 00 00"
        "00 01 03 00 42 00 00 1b 00 06 00 02 84 01 10 07"
        "02 01 00 03 04 86 04 01 00 06 01 00 02 00 00 77"
        "61 72 6d 75 70 20 31 00 00 00 00 00 00 00 00 00"
        "e0 93 04 00 00 02 42 00 00 1b 00 06 00 02 84 01"
        "10 07 02 01 00 03 04 86 04 01 00 06 01 00 02 01"
        "00 72 75 6e 20 32 00 00 00 00 00 00 00 00 00 00"
        "00 00 c0 27 09 00 00 02 42 00 00 1b 00 06 00 02"
        "84 01 10 07 02 01 00 03 04 86 04 01 00 06 01 00"
        "02 02 00 63 6f 6f 6c 64 6f 77 6e 20 33 00 00 00"
        "00 00 00 00 e0 93 04 00 00 02 03 f7",
        expected));

    TEST_EXPECT_EQ(file.size(), std::size_t{236});
    TEST_EXPECT_BYTES_EQ(file, expected);
    expect_structure(file);
}

void test_step_order_and_names() {
    const auto file = encode_ok(sample_workout(), fixed_time());

    // 14 头 + 35 file_id + 35 workout，之后每步 24B 定义 + 26B 数据。
    const std::vector<std::string> names{"warmup 1", "run 2", "cooldown 3"};
    for (std::size_t i = 0; i < names.size(); ++i) {
        const auto data = 14 + 35 + 35 + i * 50 + 24;
        TEST_EXPECT_EQ(file[data], byte{0x02});
        TEST_EXPECT_EQ(le16_at(file, data + 1), static_cast<std::uint16_t>(i));
        const std::string name(reinterpret_cast<const char *>(&file[data + 3]));
        TEST_EXPECT_EQ(name, names[i]);
    }
}

void test_encoded_size_matches() {
    const auto spec = sample_workout();
    std::size_t expected = 0;
    TEST_EXPECT_OK(fitgen::fit::encoded_size(spec, expected));
    TEST_EXPECT_EQ(expected, std::size_t{236});

    WorkoutSpec big;
    big.name = "big";
    for (int i = 0; i < 100; ++i) {
        big.steps.push_back(StepSpec{"Pasada", std::string{"1:00"}});
    }
    TEST_EXPECT_OK(fitgen::fit::encoded_size(big, expected));
    const auto file = encode_ok(big, fixed_time());
    TEST_EXPECT_EQ(file.size(), expected);
    TEST_EXPECT_EQ(file.size(), std::size_t{14 + 35 + 35 + 100 * 50 + 2});
    expect_structure(file);
}

void test_empty_workout() {
    WorkoutSpec spec;
    EncodeOptions options;
    options.time_created = 0;
    const auto file = encode_ok(spec, options);
    TEST_EXPECT_EQ(file.size(), std::size_t{86});
    TEST_EXPECT_EQ(le32_at(file, 4), 70u);
    expect_structure(file);
}

void test_idempotent_with_fixed_time() {
    const auto a = encode_ok(sample_workout(), fixed_time());
    const auto b = encode_ok(sample_workout(), fixed_time());
    TEST_EXPECT_BYTES_EQ(a, b);
}

void test_only_time_created_differs() {
    EncodeOptions other;
    other.time_created = kFixedTime + 1;
    const auto a = encode_ok(sample_workout(), fixed_time());
    const auto b = encode_ok(sample_workout(), other);
    TEST_EXPECT_EQ(a.size(), b.size());

    // time_created 位于 file_id 数据记录末 4 字节：14 + 21 + 10 = 45。
    for (std::size_t i = 0; i + 2 < a.size(); ++i) {
        if (i >= 45 && i < 49) {
            continue;
        }
        TEST_EXPECT_EQ(a[i], b[i]);
    }
    TEST_EXPECT_EQ(le32_at(a, 45), kFixedTime);
    TEST_EXPECT_EQ(le32_at(b, 45), kFixedTime + 1);
}

void test_current_time_is_used() {
    std::vector<byte> file;
    TEST_EXPECT_OK(encode_workout_file(sample_workout(), file));
    expect_structure(file);
    // 2020-01-01 之后的时间戳（FIT 纪元起 946684800 秒以上）。
    TEST_EXPECT(le32_at(file, 45) > 946684800u);
}

void test_malformed_steps_still_encode() {
    WorkoutSpec spec;
    spec.name = "Lenient";
    spec.steps.push_back(StepSpec{"", std::string{"???"}});
    spec.steps.push_back(StepSpec{"Pausa", -30.0});
    const auto file = encode_ok(spec, fixed_time());
    expect_structure(file);

    const auto first = 14 + 35 + 35 + 24;
    TEST_EXPECT_EQ(le32_at(file, first + 20), 60000u);
    TEST_EXPECT_EQ(file[first + 25], byte{0x02});
    const auto second = first + 50;
    TEST_EXPECT_EQ(le32_at(file, second + 20), 60000u);
    TEST_EXPECT_EQ(file[second + 25], byte{0x00});
}

void test_too_many_steps_fails_cleanly() {
    WorkoutSpec spec;
    spec.name = "huge";
    spec.steps.resize(70000);

    std::vector<byte> out{0x01, 0x02, 0x03};
    const auto ec = encode_workout_file(spec, out, fixed_time());
    TEST_EXPECT_EQ(ec, fitgen::fit::make_error_code(fitgen::fit::errc::too_many_steps));
    // 失败时不返回部分数据。
    TEST_EXPECT(out.empty());
}

void test_file_header() {
    const auto h = fitgen::fit::encode_file_header(0xDC);
    TEST_EXPECT_EQ(h.size(), fitgen::fit::kFileHeaderSize);
    TEST_EXPECT_EQ(fitgen::utils::to_hex(h),
                   "0e 20 7b 08 dc 00 00 00 2e 46 49 54 85 82");
}

void test_download_name() {
    TEST_EXPECT_EQ(fitgen::fit::download_name("Test Workout"), "Test Workout.fit");
    TEST_EXPECT_EQ(fitgen::fit::download_name(""), ".fit");
}

} // namespace

int main() {
    test_reference_file();
    test_step_order_and_names();
    test_encoded_size_matches();
    test_empty_workout();
    test_idempotent_with_fixed_time();
    test_only_time_created_differs();
    test_current_time_is_used();
    test_malformed_steps_still_encode();
    test_too_many_steps_fails_cleanly();
    test_file_header();
    test_download_name();
    return ::fitgen::tests::run_and_report();
}
