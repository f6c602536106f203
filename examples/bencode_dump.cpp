// 读取 bencode 数据并打印解码后的树（或解码错误）。
//
// 用法：
//   bencode_dump <file>                 读取文件的原始字节
//   bencode_dump --hex "64 33 3a ..."   解析 16 进制文本
//
// 选项：
//   --max-depth N   解码嵌套深度上限（默认 64，最大 1024）
//   --raw           同时输出 hexdump
//   --color         输出 ANSI 颜色
//   --verbose       打开 debug 日志（可看到解码失败的偏移）

#include <benc/codec/codec.hpp>
#include <benc/core/log.hpp>
#include <benc/utils/hex.hpp>
#include <benc/utils/value_dump.hpp>

#include <charconv>
#include <system_error>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace {

// 解码是递归实现，深度上限过大时恶意输入可能耗尽栈。
constexpr std::size_t kMaxDepthOption = 1024;

bool parse_depth(std::string_view text, std::size_t &out) {
    std::size_t value = 0;
    const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc{} || res.ptr != text.data() + text.size()) {
        return false;
    }
    if (value > kMaxDepthOption) {
        return false;
    }
    out = value;
    return true;
}

void print_usage(const char *argv0) {
    std::cerr << "usage: " << argv0
              << " [--max-depth N] [--raw] [--color] [--verbose] (<file> | --hex <text>)\n";
}

bool read_file(const std::string &path, std::vector<benc::core::byte> &out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

} // namespace

int main(int argc, char **argv) {
    benc::codec::DecodeLimits limits{};
    benc::utils::ValueDumpOptions dump_options{};
    benc::utils::HexDumpOptions hex_options{};
    bool show_raw = false;
    std::string hex_text;
    std::string path;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--hex" && i + 1 < argc) {
            hex_text = argv[++i];
        } else if (arg == "--max-depth" && i + 1 < argc) {
            const std::string_view text = argv[++i];
            if (!parse_depth(text, limits.max_depth)) {
                std::cerr << "invalid --max-depth: " << text << " (expected 0.." << kMaxDepthOption
                          << ")\n";
                return 2;
            }
        } else if (arg == "--raw") {
            show_raw = true;
        } else if (arg == "--color") {
            dump_options.enable_color = true;
            hex_options.enable_color = true;
        } else if (arg == "--verbose") {
            benc::core::set_log_level(benc::core::LogLevel::debug);
        } else if (!arg.empty() && arg.front() != '-' && path.empty()) {
            path = std::string(arg);
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    std::vector<benc::core::byte> data;
    if (!hex_text.empty()) {
        const auto ec = benc::utils::parse_hex(hex_text, data);
        if (ec) {
            std::cerr << "invalid hex input: " << ec.message() << "\n";
            return 2;
        }
    } else if (!path.empty()) {
        if (!read_file(path, data)) {
            std::cerr << "cannot read " << path << "\n";
            return 2;
        }
    } else {
        print_usage(argv[0]);
        return 2;
    }

    const benc::core::bytes_view bytes{data.data(), data.size()};
    if (show_raw) {
        std::cout << benc::utils::hex_dump(bytes, hex_options);
    }

    auto value = benc::codec::Value::integer(0);
    const auto ec = benc::codec::decode(bytes, value, limits);
    if (ec) {
        std::cerr << "decode failed: [" << ec.category().name() << "] " << ec.message() << "\n";
        return 1;
    }

    std::cout << benc::utils::dump_value(value, dump_options) << "\n";
    return 0;
}
