#include "fitgen/workout/intensity.hpp"

#include "test_main.hpp"

#include <cstdint>

namespace {

using fitgen::workout::classify_intensity;
using fitgen::workout::Intensity;
using fitgen::workout::IntensityTable;

void test_codes() {
    TEST_EXPECT_EQ(static_cast<std::uint8_t>(Intensity::rest), 0);
    TEST_EXPECT_EQ(static_cast<std::uint8_t>(Intensity::warmup_cooldown), 1);
    TEST_EXPECT_EQ(static_cast<std::uint8_t>(Intensity::active), 2);
}

void test_known_labels() {
    TEST_EXPECT_EQ(classify_intensity("EEC"), Intensity::warmup_cooldown);
    TEST_EXPECT_EQ(classify_intensity("VAC"), Intensity::warmup_cooldown);
    TEST_EXPECT_EQ(classify_intensity("Pausa"), Intensity::rest);
    TEST_EXPECT_EQ(classify_intensity("Pasada"), Intensity::active);
    TEST_EXPECT_EQ(classify_intensity("Rodaje"), Intensity::active);
    TEST_EXPECT_EQ(classify_intensity("Tempo"), Intensity::active);
    TEST_EXPECT_EQ(classify_intensity("Fartlek"), Intensity::active);
}

void test_unknown_labels_are_active() {
    TEST_EXPECT_EQ(classify_intensity(""), Intensity::active);
    TEST_EXPECT_EQ(classify_intensity("warmup"), Intensity::active);
    TEST_EXPECT_EQ(classify_intensity("cooldown"), Intensity::active);
    TEST_EXPECT_EQ(classify_intensity("run"), Intensity::active);

    // 大小写敏感、不做裁剪。
    TEST_EXPECT_EQ(classify_intensity("pausa"), Intensity::active);
    TEST_EXPECT_EQ(classify_intensity("PAUSA"), Intensity::active);
    TEST_EXPECT_EQ(classify_intensity(" Pausa"), Intensity::active);
    TEST_EXPECT_EQ(classify_intensity("EEC "), Intensity::active);
}

void test_default_table() {
    const auto table = IntensityTable::defaults();
    TEST_EXPECT_EQ(table.size(), std::size_t{7});
    TEST_EXPECT(table.find("Pausa").has_value());
    TEST_EXPECT(!table.find("Descanso").has_value());
}

void test_extend_table() {
    auto table = IntensityTable::defaults();
    table.add("Descanso", Intensity::rest);
    table.add("Calentamiento", Intensity::warmup_cooldown);
    TEST_EXPECT_EQ(table.size(), std::size_t{9});
    TEST_EXPECT_EQ(table.classify("Descanso"), Intensity::rest);
    TEST_EXPECT_EQ(table.classify("Calentamiento"), Intensity::warmup_cooldown);

    // 覆盖已有标签。
    table.add("Tempo", Intensity::warmup_cooldown);
    TEST_EXPECT_EQ(table.size(), std::size_t{9});
    TEST_EXPECT_EQ(table.classify("Tempo"), Intensity::warmup_cooldown);

    // 扩展的是副本，共享默认表不受影响。
    TEST_EXPECT_EQ(classify_intensity("Tempo"), Intensity::active);
    TEST_EXPECT_EQ(classify_intensity("Descanso"), Intensity::active);
}

void test_empty_table() {
    const IntensityTable table;
    TEST_EXPECT_EQ(table.size(), std::size_t{0});
    TEST_EXPECT_EQ(table.classify("Pausa"), Intensity::active);
}

} // namespace

int main() {
    test_codes();
    test_known_labels();
    test_unknown_labels_are_active();
    test_default_table();
    test_extend_table();
    test_empty_table();
    return ::fitgen::tests::run_and_report();
}
