#include "bench_main.hpp"
#include "fitgen/fit/crc.hpp"
#include "fitgen/fit/file.hpp"
#include "fitgen/workout/duration.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace fitgen;
using namespace fitgen::core;

static volatile std::uint32_t g_sink = 0;

static workout::WorkoutSpec make_workout(std::size_t steps) {
    // 典型间歇课：热身 + N 组（跑 / 休）+ 放松
    static const char *kTypes[] = {"EEC", "Pasada", "Pausa", "VAC"};
    static const char *kDurations[] = {"15min", "4:00", "90", "10min"};

    workout::WorkoutSpec spec;
    spec.name = "bench";
    spec.steps.reserve(steps);
    for (std::size_t i = 0; i < steps; ++i) {
        const auto k = i % 4;
        spec.steps.push_back(
            workout::StepSpec{kTypes[k], std::string{kDurations[k]}});
    }
    return spec;
}

static void bench_crc16() {
    // 1MB 伪随机内容：nibble 查表的逐字节吞吐
    constexpr std::size_t data_size = 1024 * 1024;
    std::vector<byte> data(data_size);
    for (std::size_t i = 0; i < data_size; ++i) {
        data[i] = static_cast<byte>((i * 131u + 7u) & 0xFFu);
    }

    BENCH_RUN("CRC: crc16 (1MB)", data_size, 10, {
        g_sink = fit::crc16(bytes_view{data.data(), data.size()});
    });
}

static void bench_parse_duration() {
    constexpr int iterations = 100000;
    const std::vector<std::string> inputs{"5min", "2:30", "90", "1.5min",
                                          "garbage"};

    BENCH_RUN("Duration: parse_duration (100k x 5 inputs)",
              iterations * inputs.size(), 3, {
                  std::uint32_t acc = 0;
                  for (int i = 0; i < iterations; ++i) {
                      for (const auto &s : inputs) {
                          acc += workout::parse_duration(s);
                      }
                  }
                  g_sink = acc;
              });
}

static void bench_encode(std::size_t steps, const char *name, int iterations) {
    const auto spec = make_workout(steps);
    fit::EncodeOptions options;
    options.time_created = 1000000000u;

    std::size_t file_size = 0;
    if (fit::encoded_size(spec, file_size)) {
        std::cerr << "encoded_size failed for " << steps << " steps\n";
        return;
    }

    std::vector<byte> out;
    BENCH_RUN(name, file_size, iterations, {
        auto ec = fit::encode_workout_file(spec, out, options);
        if (ec) {
            std::cerr << "Encode failed: " << ec.message() << "\n";
            return;
        }
        g_sink = static_cast<std::uint32_t>(out.size());
    });
}

int main() {
    bench_crc16();
    bench_parse_duration();
    bench_encode(10, "FIT: encode workout (10 steps)", 1000);
    bench_encode(100, "FIT: encode workout (100 steps)", 200);
    bench_encode(1000, "FIT: encode workout (1000 steps)", 20);

    fitgen::benchmarks::print_results();
    return 0;
}
