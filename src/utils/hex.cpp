#include "jsonb/utils/hex.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace jsonb::utils {
namespace {

[[nodiscard]] int hex_value_(char c) noexcept {
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

[[nodiscard]] bool is_separator_(char c) noexcept {
    switch (c) {
    case ' ':
    case '\t':
    case '\r':
    case '\n':
    case ',':
    case ':':
    case '-':
    case '_':
    case '[':
    case ']':
    case '"':
    case '\'':
        return true;
    default:
        return false;
    }
}

[[nodiscard]] char printable_(jsonb::core::byte b) noexcept {
    return (b >= 0x20 && b <= 0x7E) ? static_cast<char>(b) : '.';
}

} // namespace

std::string hex_dump(jsonb::core::bytes_view bytes, HexDumpOptions options) {
    std::ostringstream oss;

    const std::size_t total = bytes.size();
    const std::size_t shown =
        (options.max_bytes == 0 ? total : std::min(total, options.max_bytes));
    const std::size_t per_line =
        (options.bytes_per_line == 0 ? std::size_t{16} : options.bytes_per_line);

    for (std::size_t offset = 0; offset < shown; offset += per_line) {
        const std::size_t line_n = std::min(per_line, shown - offset);

        if (options.show_offset) {
            oss << std::setw(4) << std::setfill('0') << std::hex << offset
                << ": ";
        }
        for (std::size_t i = 0; i < per_line; ++i) {
            if (i < line_n) {
                oss << std::setw(2) << std::setfill('0') << std::hex
                    << static_cast<int>(bytes[offset + i]);
            } else if (options.show_ascii) {
                oss << "  ";
            } else {
                break;
            }
            if (i + 1 != per_line && (i + 1 < line_n || options.show_ascii)) {
                oss << ' ';
            }
        }
        if (options.show_ascii) {
            oss << "  |";
            for (std::size_t i = 0; i < line_n; ++i) {
                oss << printable_(bytes[offset + i]);
            }
            oss << '|';
        }
        oss << '\n';
    }

    if (shown < total) {
        oss << "... (truncated, total=" << std::dec << total << " bytes)\n";
    }
    return oss.str();
}

std::error_code parse_hex(std::string_view text,
                          std::vector<jsonb::core::byte> &out) noexcept {
    out.clear();

    int hi_nibble = -1;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (is_separator_(c)) {
            if (hi_nibble >= 0) {
                // 分隔符不能把一个字节拆成两半。
                return jsonb::core::make_error_code(jsonb::core::errc::invalid_argument);
            }
            continue;
        }

        // 字节前缀：0x / 0X / \x，只允许出现在字节边界。
        if (hi_nibble < 0 && i + 1 < text.size() &&
            ((c == '0' && (text[i + 1] == 'x' || text[i + 1] == 'X')) ||
             (c == '\\' && text[i + 1] == 'x'))) {
            ++i;
            continue;
        }

        const int v = hex_value_(c);
        if (v < 0) {
            return jsonb::core::make_error_code(jsonb::core::errc::invalid_argument);
        }
        if (hi_nibble < 0) {
            hi_nibble = v;
            continue;
        }
        out.push_back(static_cast<jsonb::core::byte>((hi_nibble << 4) | v));
        hi_nibble = -1;
    }

    if (hi_nibble >= 0) {
        return jsonb::core::make_error_code(jsonb::core::errc::invalid_argument);
    }
    return {};
}

} // namespace jsonb::utils
