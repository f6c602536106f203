#include "benc/utils/hex.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace benc::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *dim = "\033[2m";
    static constexpr const char *bytes = "\033[1;33m";
    static constexpr const char *ascii = "\033[1;32m";
    static constexpr const char *error = "\033[1;31m";
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
    constexpr std::string_view kSeparators = ",;:-_|/\\[](){}<>'\"";
    return kSeparators.find(static_cast<char>(c)) != std::string_view::npos;
}

[[nodiscard]] char to_printable_(benc::core::byte b) noexcept {
    return (b >= 0x20 && b <= 0x7E) ? static_cast<char>(b) : '.';
}

void append_line_(std::ostringstream &oss,
                  benc::core::bytes_view line,
                  std::size_t offset,
                  std::size_t per_line,
                  const HexDumpOptions &options) {
    const bool color = options.enable_color;
    const auto *reset = ansi_(color, Ansi::reset);

    if (options.show_offset) {
        oss << ansi_(color, Ansi::dim) << std::setw(4) << std::setfill('0')
            << std::hex << offset << ": " << reset;
    }

    oss << ansi_(color, Ansi::bytes);
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (i != 0) {
            oss << ' ';
        }
        oss << std::setw(2) << std::setfill('0') << std::hex
            << static_cast<int>(line[i]);
    }
    oss << reset;

    if (options.show_ascii) {
        // 补齐短行，使 ASCII 侧栏对齐（每个字节占 "HH " 三列）。
        oss << std::string((per_line - line.size()) * 3 + 2, ' ');
        oss << '|' << ansi_(color, Ansi::ascii);
        for (auto b : line) {
            oss << to_printable_(b);
        }
        oss << reset << '|';
    }
    oss << '\n';
}

} // namespace

std::string hex_dump(benc::core::bytes_view bytes, HexDumpOptions options) {
    std::ostringstream oss;

    const std::size_t total = bytes.size();
    const std::size_t shown =
        (options.max_bytes == 0 ? total : std::min(total, options.max_bytes));
    const std::size_t per_line =
        (options.bytes_per_line == 0 ? std::size_t{16} : options.bytes_per_line);

    for (std::size_t offset = 0; offset < shown; offset += per_line) {
        const std::size_t n = std::min(per_line, shown - offset);
        append_line_(oss, bytes.subspan(offset, n), offset, per_line, options);
    }

    if (shown < total) {
        oss << ansi_(options.enable_color, Ansi::error)
            << "... (truncated, total=" << std::dec << total << " bytes)"
            << ansi_(options.enable_color, Ansi::reset) << '\n';
    }

    return oss.str();
}

std::error_code parse_hex(std::string_view text,
                          std::vector<benc::core::byte> &out) noexcept {
    out.clear();

    int hi_nibble = -1;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);

        if (is_separator_(c)) {
            continue;
        }

        // 可选 0x/0X 前缀：只在字节边界上识别，避免误吞 "0x" 之外的 '0'。
        if (hi_nibble < 0 && c == '0' && (i + 1) < text.size() &&
            (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            continue;
        }

        const int v = hex_value_(c);
        if (v < 0) {
            out.clear();
            return benc::core::make_error_code(benc::core::errc::invalid_argument);
        }

        if (hi_nibble < 0) {
            hi_nibble = v;
            continue;
        }
        out.push_back(static_cast<benc::core::byte>((hi_nibble << 4) | v));
        hi_nibble = -1;
    }

    // 必须是完整字节（两个 nibble 组成一个 byte）。
    if (hi_nibble >= 0) {
        out.clear();
        return benc::core::make_error_code(benc::core::errc::invalid_argument);
    }
    return {};
}

} // namespace benc::utils
