#pragma once

#include "benc/codec/value.hpp"

#include <cstddef>
#include <string>

namespace benc::utils {

/**
 * @brief Value 树的可读化输出（调试/日志用途）。
 *
 * 输出形如：
 *
 *     D[2] {
 *       "cow": S[3] "moo"
 *       "spam": L[2] { I 1, I -2 }
 *     }
 *
 * 说明：
 * - 不是 bencode 本身，也不保证可逆；需要字节级结果请用 codec::encode；
 * - 字典 key 按规范顺序（字节序）输出，与插入顺序无关；
 * - 默认会对超长内容做截断，避免日志被巨量 payload 淹没。
 */
struct ValueDumpOptions final {
    // 递归最大深度（0 表示只输出根节点）。
    std::size_t max_depth{16};

    // List/Dictionary 最大输出元素数（0 表示不限制）。
    std::size_t max_items{128};

    // 字节串/key 最大输出字节数（0 表示不限制）。
    std::size_t max_string_bytes{256};

    // 容器是否使用多行缩进格式。
    bool multiline{true};

    // 每层缩进空格数（multiline=true 时生效）。
    std::size_t indent_spaces{2};

    // 是否输出 ANSI 颜色控制码。
    bool enable_color{false};
};

[[nodiscard]] std::string dump_value(const benc::codec::Value &value,
                                     ValueDumpOptions options = {});

} // namespace benc::utils
