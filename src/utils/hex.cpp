#include "uuidcat/utils/hex.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace uuidcat::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *dim = "\033[2m";
    static constexpr const char *bytes = "\033[1;33m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

[[nodiscard]] int hex_value_(unsigned char c) noexcept {
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

[[nodiscard]] bool is_separator_(unsigned char c) noexcept {
    if (std::isspace(c) != 0) {
        return true;
    }
    switch (c) {
    case ',':
    case ';':
    case ':':
    case '-':
    case '_':
    case '{':
    case '}':
    case '[':
    case ']':
        return true;
    default:
        return false;
    }
}

} // namespace

std::string hex_dump(uuidcat::core::bytes_view bytes, HexDumpOptions options) {
    std::ostringstream oss;
    const auto *reset = ansi_(options.enable_color, Ansi::reset);
    const auto *dim = ansi_(options.enable_color, Ansi::dim);
    const auto *bytes_color = ansi_(options.enable_color, Ansi::bytes);

    const std::size_t per_line =
        options.bytes_per_line == 0 ? static_cast<std::size_t>(16) : options.bytes_per_line;

    for (std::size_t offset = 0; offset < bytes.size(); offset += per_line) {
        const std::size_t line_n = std::min(per_line, bytes.size() - offset);

        if (options.show_offset) {
            oss << dim << std::setw(4) << std::setfill('0') << std::hex << offset << ": " << reset;
        }

        oss << bytes_color;
        for (std::size_t i = 0; i < line_n; ++i) {
            oss << std::setw(2) << std::setfill('0') << std::hex
                << static_cast<int>(bytes[offset + i]);
            if (i + 1 != line_n) {
                oss << ' ';
            }
        }
        oss << reset << '\n';
    }
    return oss.str();
}

std::error_code parse_hex(std::string_view text,
                          std::vector<uuidcat::core::byte> &out) noexcept {
    out.clear();

    int hi_nibble = -1;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);

        if (is_separator_(c)) {
            continue;
        }

        // 可选 0x/0X 前缀：仅在一个字节的起始位置识别。
        if (hi_nibble < 0 && c == '0' && (i + 1) < text.size()) {
            const auto n = static_cast<unsigned char>(text[i + 1]);
            if (n == 'x' || n == 'X') {
                ++i;
                continue;
            }
        }

        const int v = hex_value_(c);
        if (v < 0) {
            return uuidcat::core::make_error_code(uuidcat::core::errc::invalid_argument);
        }
        if (hi_nibble < 0) {
            hi_nibble = v;
            continue;
        }
        out.push_back(static_cast<uuidcat::core::byte>((hi_nibble << 4) | v));
        hi_nibble = -1;
    }

    // 奇数个 nibble 无法组成完整字节。
    if (hi_nibble >= 0) {
        return uuidcat::core::make_error_code(uuidcat::core::errc::invalid_argument);
    }
    return {};
}

} // namespace uuidcat::utils
