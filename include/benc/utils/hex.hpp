#pragma once

#include "benc/core/common.hpp"
#include "benc/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace benc::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 把日志里的 “64 33 3a 63 ...” 还原成 bytes 再交给解码器；
 * - 编码结果里混有非打印字节时，以 hexdump 形式人工排查。
 */

struct HexDumpOptions final {
    // 每行字节数（典型 16/32）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏（bencode 大部分是可打印字符，默认打开）。
    bool show_ascii{true};

    // 是否输出 ANSI 颜色控制码（写入日志/文件时建议关闭）。
    bool enable_color{false};
};

[[nodiscard]] std::string hex_dump(benc::core::bytes_view bytes,
                                   HexDumpOptions options = {});

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 支持大小写、常见分隔符（空白、逗号、冒号、连字符等）以及可选的 0x/0X 前缀。
 * 失败返回 core::errc::invalid_argument，out 被清空。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<benc::core::byte> &out) noexcept;

} // namespace benc::utils
