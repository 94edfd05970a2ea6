#include "fitgen/fit/crc.hpp"

namespace fitgen::fit {
namespace {

[[nodiscard]] constexpr std::uint16_t
update_nibble(std::uint16_t crc, std::uint8_t nibble) noexcept {
    const auto tmp = kCrcTable[crc & 0x0F];
    crc = static_cast<std::uint16_t>((crc >> 4) & 0x0FFF);
    return static_cast<std::uint16_t>(crc ^ tmp ^ kCrcTable[nibble & 0x0F]);
}

} // namespace

std::uint16_t crc16_update(std::uint16_t crc, core::byte b) noexcept {
    // 低 4 位在前，高 4 位在后。
    crc = update_nibble(crc, static_cast<std::uint8_t>(b & 0x0F));
    return update_nibble(crc, static_cast<std::uint8_t>((b >> 4) & 0x0F));
}

std::uint16_t crc16(core::bytes_view bytes) noexcept {
    std::uint16_t crc = 0;
    for (const auto b : bytes) {
        crc = crc16_update(crc, b);
    }
    return crc;
}

} // namespace fitgen::fit
