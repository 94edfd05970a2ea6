/*
 * fitgen/c_api.h
 *
 * C 语言对外接口（C ABI）。
 *
 * 设计目标：
 * - 允许非 C++ 的请求层（例如 Web 服务的扩展模块）通过
 *   `#include <fitgen/c_api.h>` 调用编码器；
 * - 错误使用 `fitgen_error_t` 表达（value + category），兼容 std::error_code；
 * - 任何由库分配的内存都使用 `fitgen_free()` 释放；
 * - C API 内部不允许异常跨越 C 边界（若发生异常，将转为 `fitgen.c_api` 错误）。
 *
 * 注意：
 * - 本库实现基于 C++20；C 工程链接时通常需要用 C++ 链接器。
 * - 所有函数都可以在任意线程并发调用（编码器无共享可变状态）。
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* C API 版本（用于 ABI 变更时做兼容分支） */
#define FITGEN_C_API_VERSION 1

/* ----------------------------- 错误与内存 ----------------------------- */

/*
 * `fitgen_error_t` 对应 C++ 的 std::error_code。
 *
 * - value==0 表示成功；
 * - category 指向一个静态字符串（生命周期贯穿整个进程），典型值：
 *   - "fitgen.c_api"（本 C API 自身的错误域）
 *   - "fitgen.core" / "fitgen.fit"
 */
typedef struct fitgen_error {
    int value;
    const char *category;
} fitgen_error_t;

static inline int fitgen_error_is_ok(fitgen_error_t err) {
    return err.value == 0;
}

/* 本 C API 自身的错误码（category="fitgen.c_api"） */
typedef enum fitgen_c_api_errc {
    FITGEN_C_API_OK = 0,
    FITGEN_C_API_INVALID_ARGUMENT = 1,
    FITGEN_C_API_OUT_OF_MEMORY = 2,
    FITGEN_C_API_EXCEPTION = 3
} fitgen_c_api_errc_t;

void *fitgen_malloc(size_t n);
void fitgen_free(void *p);

/* 生成可读错误信息（返回的字符串需用 fitgen_free 释放）。 */
char *fitgen_error_message(fitgen_error_t err);

/* 版本信息（静态字符串，勿释放）。 */
const char *fitgen_version_string(void);

/* 日志级别：0=trace 1=debug 2=info 3=warn 4=error 5=critical 6=off */
fitgen_error_t fitgen_set_log_level(int level);

/* ----------------------------- 编码 ----------------------------- */

/*
 * 单个训练步骤。
 *
 * - type：步骤类型标签（NULL 视为 "Step"，步骤名为 "Step <序号>"，强度为 active）；
 * - duration：时长字符串，如 "5min" / "2:30" / "90"（NULL 视为无法解析，
 *   按默认 60 秒处理）。
 */
typedef struct fitgen_step {
    const char *type;
    const char *duration;
} fitgen_step_t;

/*
 * 编码 workout 文件（time_created 取当前时间）。
 *
 * - name 不得为 NULL；steps 可以为 NULL（此时 n 必须为 0）；
 * - 成功时 *out_bytes 指向完整文件（需 fitgen_free 释放），*out_n 为字节数；
 * - 失败时 *out_bytes=NULL，*out_n=0。
 */
fitgen_error_t fitgen_encode_workout(const char *name,
                                     const fitgen_step_t *steps,
                                     size_t n,
                                     uint8_t **out_bytes,
                                     size_t *out_n);

/* 同上，但固定 time_created（FIT 纪元起的秒数），便于得到可复现的输出。 */
fitgen_error_t fitgen_encode_workout_at(const char *name,
                                        const fitgen_step_t *steps,
                                        size_t n,
                                        uint32_t time_created,
                                        uint8_t **out_bytes,
                                        size_t *out_n);

/* ----------------------------- 辅助 ----------------------------- */

/* 时长字符串 -> 秒（永不失败；text==NULL 返回默认 60）。 */
uint32_t fitgen_parse_duration(const char *text);

/* 步骤类型 -> 强度（0=rest 1=warmup/cooldown 2=active）。 */
fitgen_error_t fitgen_classify_intensity(const char *label, uint8_t *out);

/*
 * FIT 16 位校验。
 *
 * - n==0 时返回 0（bytes 可为 NULL）；
 * - bytes==NULL 且 n!=0 属于调用方错误：不读取任何内存，同样返回 0。
 *   0 也是合法的校验值，调用方需自行保证参数有效，不能用返回值判断错误。
 */
uint16_t fitgen_crc16(const uint8_t *bytes, size_t n);

#ifdef __cplusplus
}
#endif
