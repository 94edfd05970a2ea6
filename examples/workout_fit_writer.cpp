/**
 * @file workout_fit_writer.cpp
 * @brief 命令行生成 FIT workout 文件，并以 hexdump 形式打印生成结果
 *
 * 运行：
 *   ./build/examples/workout_fit_writer "Series 6x1000" EEC=15min Pasada=4:00 Pausa=90 ...
 *
 * 每个步骤写成 <type>=<duration>，duration 支持 "5min" / "2:30" / "90"。
 * 默认输出到当前目录下的 "<name>.fit"；可用 -o 指定路径。
 * 环境变量 FITGEN_LOG_LEVEL（trace|debug|...）可打开库内日志。
 */

#include <fitgen/core/log.hpp>
#include <fitgen/fit/file.hpp>
#include <fitgen/utils/hex.hpp>
#include <fitgen/workout/duration.hpp>
#include <fitgen/workout/intensity.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace fitgen;

namespace {

struct Options final {
    workout::WorkoutSpec spec{};
    std::string output_path{};
    std::optional<std::uint32_t> time_created{};
    bool dump{true};
};

void print_usage(const char *argv0) {
    std::cout << "用法:\n"
              << "  " << argv0 << " <name> <type=duration>... [options]\n\n"
              << "选项:\n"
              << "  -o, --output <path>   输出文件路径（默认 <name>.fit）\n"
              << "  --time <u32>          固定 time_created（FIT 纪元秒数，便于复现）\n"
              << "  --no-dump             不打印 hexdump\n"
              << "  --help                显示帮助\n\n"
              << "示例:\n"
              << "  " << argv0
              << " \"Test Workout\" warmup=300 run=600 cooldown=300\n"
              << "  " << argv0
              << " Series EEC=15min Pasada=4:00 Pausa=90 Pasada=4:00 VAC=10min\n";
}

bool parse_u32(std::string_view s, std::uint32_t &out) {
    std::uint32_t v = 0;
    const auto *begin = s.data();
    const auto *end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(begin, end, v, 10);
    if (ec != std::errc{} || ptr != end) {
        return false;
    }
    out = v;
    return true;
}

// "<type>=<duration>"：以最后一个 '=' 分隔，type 可以为空。
bool parse_step(std::string_view arg, workout::StepSpec &out) {
    const auto pos = arg.rfind('=');
    if (pos == std::string_view::npos) {
        return false;
    }
    out.type = std::string(arg.substr(0, pos));
    out.duration = std::string(arg.substr(pos + 1));
    return true;
}

int parse_args(int argc, char **argv, Options &out) {
    bool have_name = false;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto need_value =
            [&](const char *flag) -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << flag << "\n";
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 1;
        }

        if (arg == "-o" || arg == "--output") {
            auto v = need_value("--output");
            if (!v.has_value()) {
                return -1;
            }
            out.output_path = std::string(*v);
            continue;
        }

        if (arg == "--time") {
            auto v = need_value("--time");
            if (!v.has_value()) {
                return -1;
            }
            std::uint32_t t = 0;
            if (!parse_u32(*v, t)) {
                std::cerr << "invalid --time: " << *v << "\n";
                return -1;
            }
            out.time_created = t;
            continue;
        }

        if (arg == "--no-dump") {
            out.dump = false;
            continue;
        }

        if (!have_name) {
            out.spec.name = std::string(arg);
            have_name = true;
            continue;
        }

        workout::StepSpec step{};
        if (!parse_step(arg, step)) {
            std::cerr << "invalid step (expect <type>=<duration>): " << arg
                      << "\n";
            return -1;
        }
        out.spec.steps.push_back(std::move(step));
    }

    if (!have_name) {
        std::cerr << "missing workout name\n";
        return -1;
    }
    return 0;
}

void apply_log_level_from_env() {
    const char *env = std::getenv("FITGEN_LOG_LEVEL");
    if (env == nullptr) {
        return;
    }
    core::LogLevel lvl{};
    if (!core::parse_log_level(env, lvl)) {
        std::cerr << "ignore invalid FITGEN_LOG_LEVEL: " << env << "\n";
        return;
    }
    core::set_log_level(lvl);
}

const char *intensity_name(workout::Intensity v) {
    switch (v) {
        case workout::Intensity::rest:
            return "rest";
        case workout::Intensity::warmup_cooldown:
            return "warmup/cooldown";
        case workout::Intensity::active:
            return "active";
    }
    return "?";
}

void print_plan(const workout::WorkoutSpec &spec) {
    std::cout << "训练: " << spec.name << "（" << spec.steps.size()
              << " 个步骤）\n";
    for (std::size_t i = 0; i < spec.steps.size(); ++i) {
        const auto &step = spec.steps[i];
        std::cout << "  [" << i << "] " << fit::step_name(step.type, i)
                  << "  duration=" << workout::parse_duration_value(step.duration)
                  << "s  intensity="
                  << intensity_name(workout::classify_intensity(step.type))
                  << "\n";
    }
}

} // namespace

int main(int argc, char **argv) {
    std::cout << "=== FIT workout writer ===\n\n";

    Options opt{};
    const int parse_rc = parse_args(argc, argv, opt);
    if (parse_rc != 0) {
        if (parse_rc > 0) {
            return 0;
        }
        print_usage(argv[0]);
        return 2;
    }

    apply_log_level_from_env();
    print_plan(opt.spec);

    fit::EncodeOptions enc{};
    enc.time_created = opt.time_created;

    std::vector<core::byte> file;
    const auto ec = fit::encode_workout_file(opt.spec, file, enc);
    if (ec) {
        std::cerr << "[fit] encode failed: " << ec.message() << "\n";
        return 1;
    }

    const std::string path = opt.output_path.empty()
                                 ? fit::download_name(opt.spec.name)
                                 : opt.output_path;
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        std::cerr << "[fit] open failed: " << path << "\n";
        return 1;
    }
    ofs.write(reinterpret_cast<const char *>(file.data()),
              static_cast<std::streamsize>(file.size()));
    if (!ofs) {
        std::cerr << "[fit] write failed: " << path << "\n";
        return 1;
    }

    std::cout << "\n已写入 " << path << "（" << file.size() << " 字节）\n";

    if (opt.dump) {
        std::cout << "\n" << utils::hex_dump(core::bytes_view{file.data(), file.size()});
    }
    return 0;
}
