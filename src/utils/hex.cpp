#include "fitgen/utils/hex.hpp"

#include <algorithm>
#include <new>

namespace fitgen::utils {
namespace {

constexpr char kDigits[] = "0123456789abcdef";

[[nodiscard]] int nibble_of_(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_ignorable_(char c) noexcept {
    switch (c) {
    case ' ':
    case '\t':
    case '\r':
    case '\n':
    case ',':
    case ':':
    case '-':
    case '_':
        return true;
    default:
        return false;
    }
}

void append_byte_(std::string &s, core::byte b) {
    s.push_back(kDigits[(b >> 4) & 0x0F]);
    s.push_back(kDigits[b & 0x0F]);
}

void append_offset_(std::string &s, std::size_t offset) {
    // 4 位偏移（超过 0xFFFF 时自然变宽）。
    std::string digits;
    do {
        digits.push_back(kDigits[offset & 0x0F]);
        offset >>= 4;
    } while (offset != 0);
    while (digits.size() < 4) {
        digits.push_back('0');
    }
    s.append(digits.rbegin(), digits.rend());
    s.append(": ");
}

} // namespace

std::string to_hex(core::bytes_view bytes) {
    std::string s;
    if (bytes.empty()) {
        return s;
    }
    s.reserve(bytes.size() * 3);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) {
            s.push_back(' ');
        }
        append_byte_(s, bytes[i]);
    }
    return s;
}

std::string hex_dump(core::bytes_view bytes, HexDumpOptions options) {
    const std::size_t per_line =
        options.bytes_per_line == 0 ? 16 : options.bytes_per_line;
    const std::size_t shown = options.max_bytes == 0
                                  ? bytes.size()
                                  : std::min(bytes.size(), options.max_bytes);

    std::string s;
    for (std::size_t offset = 0; offset < shown; offset += per_line) {
        const auto line = bytes.subspan(offset, std::min(per_line, shown - offset));

        if (options.show_offset) {
            append_offset_(s, offset);
        }
        s.append(to_hex(line));

        if (options.show_ascii) {
            // 短行补齐，让 ASCII 列对齐。
            s.append((per_line - line.size()) * 3 + 2, ' ');
            for (const auto b : line) {
                s.push_back(b >= 0x20 && b <= 0x7E ? static_cast<char>(b) : '.');
            }
        }
        s.push_back('\n');
    }

    if (shown < bytes.size()) {
        s.append("... (truncated, total=");
        s.append(std::to_string(bytes.size()));
        s.append(" bytes)\n");
    }
    return s;
}

std::error_code parse_hex(std::string_view text,
                          std::vector<core::byte> &out) noexcept {
    out.clear();
    try {
        int high = -1;
        for (std::size_t i = 0; i < text.size(); ++i) {
            const char c = text[i];
            if (is_ignorable_(c)) {
                continue;
            }
            // 0x / 0X 前缀仅在一个字节的起始位置生效。
            if (high < 0 && c == '0' && i + 1 < text.size() &&
                (text[i + 1] == 'x' || text[i + 1] == 'X')) {
                ++i;
                continue;
            }
            const int v = nibble_of_(c);
            if (v < 0) {
                out.clear();
                return core::make_error_code(core::errc::invalid_argument);
            }
            if (high < 0) {
                high = v;
                continue;
            }
            out.push_back(static_cast<core::byte>((high << 4) | v));
            high = -1;
        }
        if (high >= 0) {
            out.clear();
            return core::make_error_code(core::errc::invalid_argument);
        }
    } catch (const std::bad_alloc &) {
        out.clear();
        return core::make_error_code(core::errc::buffer_overflow);
    }
    return {};
}

} // namespace fitgen::utils
