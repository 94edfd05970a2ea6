#include "fitgen/fit/file.hpp"

#include "fitgen/core/error.hpp"
#include "fitgen/fit/crc.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <limits>
#include <new>
#include <utility>

namespace fitgen::fit {
namespace {

void put_le16(byte *p, std::uint16_t v) noexcept {
    p[0] = static_cast<byte>(v & 0xFF);
    p[1] = static_cast<byte>((v >> 8) & 0xFF);
}

void put_le32(byte *p, std::uint32_t v) noexcept {
    for (std::size_t i = 0; i < 4; ++i) {
        p[i] = static_cast<byte>((v >> (8u * i)) & 0xFF);
    }
}

void append_record(const Record &rec, std::vector<byte> &out) {
    out.insert(out.end(), rec.definition.begin(), rec.definition.end());
    out.insert(out.end(), rec.data.begin(), rec.data.end());
}

// 记录区：file_id、workout、逐个 workout_step，依次追加到 records。
std::error_code encode_records(const workout::WorkoutSpec &spec,
                               std::uint32_t time_created,
                               std::size_t records_size,
                               std::vector<byte> &records) {
    records.reserve(records_size);

    Record rec;
    auto ec = make_file_id_record(time_created, rec);
    if (ec) {
        return ec;
    }
    append_record(rec, records);

    ec = make_workout_record(spec.name, spec.steps.size(), rec);
    if (ec) {
        return ec;
    }
    append_record(rec, records);

    for (std::size_t i = 0; i < spec.steps.size(); ++i) {
        ec = make_workout_step_record(i, spec.steps[i], rec);
        if (ec) {
            return ec;
        }
        append_record(rec, records);
    }
    return {};
}

std::error_code encode_file(const workout::WorkoutSpec &spec,
                            std::vector<byte> &out,
                            const EncodeOptions &options) {
    std::size_t total = 0;
    auto ec = encoded_size(spec, total);
    if (ec) {
        return ec;
    }
    const auto records_size = total - kFileHeaderSize - kFileCrcSize;
    if (records_size > std::numeric_limits<std::uint32_t>::max()) {
        return make_error_code(errc::file_too_large);
    }

    const auto time_created = options.time_created.value_or(
        fit_timestamp(std::chrono::system_clock::now()));

    std::vector<byte> records;
    ec = encode_records(spec, time_created, records_size, records);
    if (ec) {
        return ec;
    }
    if (records.size() != records_size) {
        // 布局表与实际写入不一致，属于内部错误。
        return make_error_code(errc::field_mismatch);
    }

    const auto header =
        encode_file_header(static_cast<std::uint32_t>(records.size()));

    std::vector<byte> file;
    file.reserve(total);
    file.insert(file.end(), header.begin(), header.end());
    file.insert(file.end(), records.begin(), records.end());

    const auto file_crc = crc16(core::bytes_view{file.data(), file.size()});
    file.push_back(static_cast<byte>(file_crc & 0xFF));
    file.push_back(static_cast<byte>((file_crc >> 8) & 0xFF));

    out = std::move(file);
    return {};
}

} // namespace

FileHeaderBytes encode_file_header(std::uint32_t data_size) noexcept {
    FileHeaderBytes h{};
    h[0] = static_cast<byte>(kFileHeaderSize);
    h[1] = kProtocolVersion;
    put_le16(&h[2], kProfileVersion);
    put_le32(&h[4], data_size);
    std::copy(kFileSignature.begin(), kFileSignature.end(), h.begin() + 8);

    const auto crc = crc16(core::bytes_view{h.data(), 12});
    put_le16(&h[12], crc);
    return h;
}

std::error_code encoded_size(const workout::WorkoutSpec &spec,
                             std::size_t &out_size) noexcept {
    if (spec.steps.size() > std::numeric_limits<std::uint16_t>::max()) {
        return make_error_code(errc::too_many_steps);
    }
    out_size = kFileHeaderSize + record_size(kFileIdLayout) +
               record_size(kWorkoutLayout) +
               spec.steps.size() * record_size(kWorkoutStepLayout) +
               kFileCrcSize;
    return {};
}

std::error_code encode_workout_file(const workout::WorkoutSpec &spec,
                                    std::vector<byte> &out,
                                    const EncodeOptions &options) noexcept {
    out.clear();
    std::error_code ec;
    try {
        spdlog::debug("fitgen: encoding workout '{}' ({} steps)", spec.name,
                      spec.steps.size());
        ec = encode_file(spec, out, options);
    } catch (const std::bad_alloc &) {
        ec = core::make_error_code(core::errc::encode_failed);
    } catch (const std::exception &e) {
        spdlog::error("fitgen: exception while encoding workout: {}", e.what());
        ec = core::make_error_code(core::errc::encode_failed);
    }

    if (ec) {
        out.clear();
        spdlog::error("fitgen: encode failed: [{}] {}", ec.category().name(),
                      ec.message());
        return ec;
    }
    spdlog::debug("fitgen: encoded {} bytes", out.size());
    return {};
}

std::string download_name(std::string_view workout_name) {
    std::string name{workout_name};
    name.append(kFileExtension);
    return name;
}

} // namespace fitgen::fit
