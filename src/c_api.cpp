#include "fitgen/c_api.h"

#include "fitgen/core/error.hpp"
#include "fitgen/core/log.hpp"
#include "fitgen/fit/crc.hpp"
#include "fitgen/fit/file.hpp"
#include "fitgen/fit/record.hpp"
#include "fitgen/workout/duration.hpp"
#include "fitgen/workout/intensity.hpp"

#include <cstdlib>
#include <cstring>
#include <exception>
#include <new>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

/*
 * C API（C ABI）实现文件。
 *
 * 错误与内存约定：
 * - 错误统一用 `fitgen_error_t{value, category}` 表达，对应 C++ 的
 *   std::error_code；
 * - 跨 ABI 返回的堆内存统一使用 `fitgen_malloc/fitgen_free`（malloc/free），
 *   避免跨 CRT/运行时导致的释放不匹配；
 * - C++ 异常禁止跨越 C 边界：内部捕获并映射到 `fitgen.c_api` 错误域。
 */

namespace {

using fitgen::core::byte;

constexpr const char *kCApiCategory = "fitgen.c_api";
constexpr const char *kVersion = "fitgen 1.0.0";
constexpr const char *kDefaultStepType = "Step";

[[nodiscard]] fitgen_error_t ok() noexcept {
    return fitgen_error_t{0, kCApiCategory};
}

[[nodiscard]] fitgen_error_t c_api_err(fitgen_c_api_errc_t code) noexcept {
    return fitgen_error_t{static_cast<int>(code), kCApiCategory};
}

[[nodiscard]] fitgen_error_t
from_error_code(const std::error_code &ec) noexcept {
    if (!ec) {
        return ok();
    }
    return fitgen_error_t{ec.value(), ec.category().name()};
}

[[nodiscard]] const std::error_category *
category_from_name(const char *name) noexcept {
    if (name == nullptr) {
        return nullptr;
    }
    if (std::strcmp(name, fitgen::core::error_category().name()) == 0) {
        return &fitgen::core::error_category();
    }
    if (std::strcmp(name, fitgen::fit::error_category().name()) == 0) {
        return &fitgen::fit::error_category();
    }
    if (std::strcmp(name, std::generic_category().name()) == 0) {
        return &std::generic_category();
    }
    return nullptr;
}

[[nodiscard]] std::string c_api_message_for(int value) {
    switch (static_cast<fitgen_c_api_errc_t>(value)) {
    case FITGEN_C_API_OK:
        return "ok";
    case FITGEN_C_API_INVALID_ARGUMENT:
        return "invalid argument";
    case FITGEN_C_API_OUT_OF_MEMORY:
        return "out of memory";
    case FITGEN_C_API_EXCEPTION:
        return "exception caught inside C API";
    }
    return "unknown fitgen.c_api error";
}

[[nodiscard]] char *dup_string(const std::string &s) noexcept {
    auto *out = static_cast<char *>(std::malloc(s.size() + 1));
    if (!out) {
        return nullptr;
    }
    std::memcpy(out, s.data(), s.size());
    out[s.size()] = '\0';
    return out;
}

template <class Fn>
fitgen_error_t guard_error(Fn &&fn) noexcept {
    try {
        return fn();
    } catch (const std::bad_alloc &) {
        return c_api_err(FITGEN_C_API_OUT_OF_MEMORY);
    } catch (const std::exception &) {
        return c_api_err(FITGEN_C_API_EXCEPTION);
    }
}

fitgen_error_t encode_impl(const char *name,
                           const fitgen_step_t *steps,
                           size_t n,
                           std::optional<uint32_t> time_created,
                           uint8_t **out_bytes,
                           size_t *out_n) noexcept {
    return guard_error([&]() -> fitgen_error_t {
        if (!out_bytes || !out_n) {
            return c_api_err(FITGEN_C_API_INVALID_ARGUMENT);
        }
        *out_bytes = nullptr;
        *out_n = 0;
        if (!name || (!steps && n != 0)) {
            return c_api_err(FITGEN_C_API_INVALID_ARGUMENT);
        }

        fitgen::workout::WorkoutSpec spec;
        spec.name = name;
        spec.steps.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            fitgen::workout::StepSpec step;
            // NULL 类型按 "Step" 命名（"Step 1"），强度归为 active。
            step.type = steps[i].type ? steps[i].type : kDefaultStepType;
            // NULL 时长交给解析器走默认值。
            step.duration = std::string{steps[i].duration ? steps[i].duration : ""};
            spec.steps.push_back(std::move(step));
        }

        fitgen::fit::EncodeOptions options;
        options.time_created = time_created;

        std::vector<byte> out;
        const auto ec = fitgen::fit::encode_workout_file(spec, out, options);
        if (ec) {
            return from_error_code(ec);
        }

        auto *buf = static_cast<uint8_t *>(fitgen_malloc(out.size()));
        if (!buf) {
            return c_api_err(FITGEN_C_API_OUT_OF_MEMORY);
        }
        std::memcpy(buf, out.data(), out.size());
        *out_bytes = buf;
        *out_n = out.size();
        return ok();
    });
}

} // namespace

extern "C" {

void *fitgen_malloc(size_t n) { return std::malloc(n == 0 ? 1 : n); }

void fitgen_free(void *p) { std::free(p); }

char *fitgen_error_message(fitgen_error_t err) {
    try {
        if (err.value == 0) {
            return dup_string("ok");
        }
        if (err.category && std::strcmp(err.category, kCApiCategory) == 0) {
            return dup_string(c_api_message_for(err.value));
        }
        if (const auto *cat = category_from_name(err.category)) {
            return dup_string(cat->message(err.value));
        }
        return dup_string("unknown error category");
    } catch (const std::bad_alloc &) {
        return nullptr;
    }
}

const char *fitgen_version_string(void) { return kVersion; }

fitgen_error_t fitgen_set_log_level(int level) {
    if (level < 0 ||
        level > static_cast<int>(fitgen::core::LogLevel::off)) {
        return c_api_err(FITGEN_C_API_INVALID_ARGUMENT);
    }
    fitgen::core::set_log_level(static_cast<fitgen::core::LogLevel>(level));
    return ok();
}

fitgen_error_t fitgen_encode_workout(const char *name,
                                     const fitgen_step_t *steps,
                                     size_t n,
                                     uint8_t **out_bytes,
                                     size_t *out_n) {
    return encode_impl(name, steps, n, std::nullopt, out_bytes, out_n);
}

fitgen_error_t fitgen_encode_workout_at(const char *name,
                                        const fitgen_step_t *steps,
                                        size_t n,
                                        uint32_t time_created,
                                        uint8_t **out_bytes,
                                        size_t *out_n) {
    return encode_impl(name, steps, n, time_created, out_bytes, out_n);
}

uint32_t fitgen_parse_duration(const char *text) {
    if (!text) {
        return fitgen::workout::kDefaultDurationSeconds;
    }
    return fitgen::workout::parse_duration(std::string_view{text});
}

fitgen_error_t fitgen_classify_intensity(const char *label, uint8_t *out) {
    return guard_error([&]() -> fitgen_error_t {
        if (!label || !out) {
            return c_api_err(FITGEN_C_API_INVALID_ARGUMENT);
        }
        *out = static_cast<uint8_t>(fitgen::workout::classify_intensity(label));
        return ok();
    });
}

uint16_t fitgen_crc16(const uint8_t *bytes, size_t n) {
    if (!bytes || n == 0) {
        return 0;
    }
    return fitgen::fit::crc16(fitgen::core::bytes_view{bytes, n});
}

} // extern "C"
