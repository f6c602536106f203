#include "benc/utils/value_dump.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace benc::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *type = "\033[1;35m";
    static constexpr const char *string = "\033[1;32m";
    static constexpr const char *value = "\033[1;33m";
    static constexpr const char *key = "\033[1;36m";
    static constexpr const char *dim = "\033[2m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

struct DumpContext final {
    std::ostringstream oss;
    ValueDumpOptions options{};

    [[nodiscard]] const char *color(const char *code) const noexcept {
        return ansi_(options.enable_color, code);
    }
};

[[nodiscard]] std::string indent_(std::size_t depth, std::size_t spaces) {
    return std::string(depth * spaces, ' ');
}

void append_quoted_(DumpContext &ctx, const std::string &s, const char *code) {
    const std::size_t total = s.size();
    const std::size_t max_bytes = ctx.options.max_string_bytes;
    const std::size_t n = (max_bytes == 0 ? total : std::min(total, max_bytes));

    ctx.oss << ctx.color(code) << '"';
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c == '\\' || c == '"') {
            ctx.oss << '\\' << static_cast<char>(c);
        } else if (c >= 0x20 && c <= 0x7E) {
            ctx.oss << static_cast<char>(c);
        } else {
            // 非可打印字节：用 \xHH。
            ctx.oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(c) << std::dec;
        }
    }
    if (n < total) {
        ctx.oss << "...";
    }
    ctx.oss << '"' << ctx.color(Ansi::reset);
}

void append_value_(DumpContext &ctx, const benc::codec::Value &value, std::size_t depth);

// 容器的公共输出逻辑：header、截断、单行/多行布局。
// append_element(i) 负责输出第 i 个元素（不含分隔符与缩进）。
template <class AppendElement>
void append_container_(DumpContext &ctx,
                       const char *tag,
                       std::size_t total,
                       std::size_t depth,
                       AppendElement &&append_element) {
    const auto &opt = ctx.options;
    const auto *reset = ctx.color(Ansi::reset);
    const auto *dim = ctx.color(Ansi::dim);

    ctx.oss << ctx.color(Ansi::type) << tag << '[' << total << ']' << reset;
    if (total == 0) {
        return;
    }
    if (depth >= opt.max_depth) {
        ctx.oss << ' ' << dim << "..." << reset;
        return;
    }

    const std::size_t n =
        (opt.max_items == 0 ? total : std::min(total, opt.max_items));
    const bool truncated = n < total;

    if (!opt.multiline) {
        ctx.oss << ' ' << dim << "{ " << reset;
        for (std::size_t i = 0; i < n; ++i) {
            if (i != 0) {
                ctx.oss << ", ";
            }
            append_element(i);
        }
        if (truncated) {
            ctx.oss << ", " << dim << "..." << reset;
        }
        ctx.oss << ' ' << dim << '}' << reset;
        return;
    }

    ctx.oss << ' ' << dim << "{\n" << reset;
    for (std::size_t i = 0; i < n; ++i) {
        ctx.oss << indent_(depth + 1, opt.indent_spaces);
        append_element(i);
        ctx.oss << '\n';
    }
    if (truncated) {
        ctx.oss << indent_(depth + 1, opt.indent_spaces) << dim << "..."
                << reset << '\n';
    }
    ctx.oss << indent_(depth, opt.indent_spaces) << dim << '}' << reset;
}

void append_value_(DumpContext &ctx, const benc::codec::Value &value, std::size_t depth) {
    std::visit(
        [&](const auto &v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, benc::codec::ByteString>) {
                ctx.oss << ctx.color(Ansi::type) << "S[" << v.value.size() << ']'
                        << ctx.color(Ansi::reset) << ' ';
                append_quoted_(ctx, v.value, Ansi::string);
            } else if constexpr (std::is_same_v<T, benc::codec::Integer>) {
                ctx.oss << ctx.color(Ansi::type) << 'I' << ctx.color(Ansi::reset)
                        << ' ' << ctx.color(Ansi::value) << v.value
                        << ctx.color(Ansi::reset);
            } else if constexpr (std::is_same_v<T, benc::codec::List>) {
                append_container_(ctx, "L", v.size(), depth, [&](std::size_t i) {
                    append_value_(ctx, v[i], depth + 1);
                });
            } else {
                const auto entries = v.sorted_entries();
                append_container_(ctx, "D", entries.size(), depth, [&](std::size_t i) {
                    append_quoted_(ctx, entries[i]->first, Ansi::key);
                    ctx.oss << ": ";
                    append_value_(ctx, entries[i]->second, depth + 1);
                });
            }
        },
        value.storage());
}

} // namespace

std::string dump_value(const benc::codec::Value &value, ValueDumpOptions options) {
    DumpContext ctx;
    ctx.options = options;

    append_value_(ctx, value, 0);
    return ctx.oss.str();
}

} // namespace benc::utils
