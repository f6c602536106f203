#include "benc/codec/codec.hpp"

#include "benc/core/error.hpp"
#include "core/log_internal.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <string>
#include <type_traits>

namespace benc::codec {
namespace {

class benc_codec_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "benc.codec"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::unexpected_eof:
        return "unexpected end of input";
      case errc::invalid_length:
        return "invalid string length prefix";
      case errc::invalid_integer:
        return "invalid integer";
      case errc::invalid_type_prefix:
        return "invalid type prefix";
      case errc::unterminated_container:
        return "unterminated list or dictionary";
      case errc::non_string_dict_key:
        return "dictionary key is not a byte string";
      case errc::unsorted_or_duplicate_key:
        return "dictionary keys not in strictly ascending order";
      case errc::trailing_data:
        return "trailing data after value";
      case errc::nesting_too_deep:
        return "nesting too deep";
      case errc::integer_overflow:
        return "integer out of 64-bit range";
      default:
        return "unknown benc.codec error";
    }
  }
};

// int64 最大位数为 19（负号另计），size_t 长度前缀最多 20 位。
constexpr std::size_t kMaxDecimalChars = 24;

constexpr bool is_digit(byte c) noexcept { return c >= '0' && c <= '9'; }

std::size_t decimal_width(std::uint64_t v) noexcept {
  std::size_t n = 1;
  while (v >= 10) {
    v /= 10;
    ++n;
  }
  return n;
}

std::size_t integer_width(std::int64_t v) noexcept {
  if (v >= 0) {
    return decimal_width(static_cast<std::uint64_t>(v));
  }
  // -(v + 1) + 1 避免 INT64_MIN 取反溢出。
  const auto magnitude = static_cast<std::uint64_t>(-(v + 1)) + 1u;
  return 1 + decimal_width(magnitude);
}

// 调用方已按 encoded_size 分配好空间，SpanWriter 不做越界检查。
class SpanWriter final {
 public:
  explicit SpanWriter(mutable_bytes_view out) : out_(out) {}

  [[nodiscard]] std::size_t written() const noexcept { return written_; }

  void write_u8(byte v) noexcept { out_[written_++] = v; }

  void write_bytes(const std::string& v) noexcept {
    std::copy(v.begin(), v.end(), out_.begin() + static_cast<std::ptrdiff_t>(written_));
    written_ += v.size();
  }

  template <class Int>
  void write_decimal(Int v) noexcept {
    char buf[kMaxDecimalChars];
    const auto res = std::to_chars(buf, buf + sizeof(buf), v);
    for (const char* p = buf; p != res.ptr; ++p) {
      out_[written_++] = static_cast<byte>(*p);
    }
  }

 private:
  mutable_bytes_view out_{};
  std::size_t written_{0};
};

class SpanReader final {
 public:
  explicit SpanReader(bytes_view in) : in_(in) {}

  [[nodiscard]] bool at_end() const noexcept { return pos_ >= in_.size(); }
  [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return pos_; }

  // 调用方保证 !at_end()。
  [[nodiscard]] byte peek() const noexcept { return in_[pos_]; }
  void skip() noexcept { ++pos_; }

  std::error_code read_payload(std::size_t n, bytes_view& out) noexcept {
    if (remaining() < n) {
      return make_error_code(errc::unexpected_eof);
    }
    out = in_.subspan(pos_, n);
    pos_ += n;
    return {};
  }

 private:
  bytes_view in_{};
  std::size_t pos_{0};
};

// ---------------------------------------------------------------------------
// 编码
// ---------------------------------------------------------------------------

std::size_t string_size(std::size_t length) noexcept {
  return decimal_width(length) + 1 + length;
}

std::size_t encoded_size_impl(const Value& value) noexcept {
  return std::visit(
    [](const auto& v) -> std::size_t {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, ByteString>) {
        return string_size(v.value.size());
      } else if constexpr (std::is_same_v<T, Integer>) {
        return 2 + integer_width(v.value);
      } else if constexpr (std::is_same_v<T, List>) {
        std::size_t total = 2;
        for (const auto& child : v) {
          total += encoded_size_impl(child);
        }
        return total;
      } else {
        std::size_t total = 2;
        for (const auto& entry : v) {
          total += string_size(entry.first.size()) + encoded_size_impl(entry.second);
        }
        return total;
      }
    },
    value.storage());
}

void encode_string(const std::string& s, SpanWriter& w) {
  w.write_decimal(s.size());
  w.write_u8(':');
  w.write_bytes(s);
}

void encode_value(const Value& value, SpanWriter& w) {
  std::visit(
    [&](const auto& v) {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, ByteString>) {
        encode_string(v.value, w);
      } else if constexpr (std::is_same_v<T, Integer>) {
        w.write_u8('i');
        w.write_decimal(v.value);
        w.write_u8('e');
      } else if constexpr (std::is_same_v<T, List>) {
        w.write_u8('l');
        for (const auto& child : v) {
          encode_value(child, w);
        }
        w.write_u8('e');
      } else {
        // 规范形式：无论插入顺序如何，一律按 key 字节序输出。
        w.write_u8('d');
        for (const auto* entry : v.sorted_entries()) {
          encode_string(entry->first, w);
          encode_value(entry->second, w);
        }
        w.write_u8('e');
      }
    },
    value.storage());
}

// ---------------------------------------------------------------------------
// 解码
// ---------------------------------------------------------------------------

std::error_code decode_value(SpanReader& r, Value& out, std::size_t depth, const DecodeLimits& limits) noexcept;

// <digits>:，首字节已确认是数字。
std::error_code decode_length(SpanReader& r, std::size_t& out) noexcept {
  std::size_t value = 0;
  std::size_t digits = 0;
  bool leading_zero = false;
  for (;;) {
    if (r.at_end()) {
      return make_error_code(errc::unexpected_eof);
    }
    const byte c = r.peek();
    if (c == ':') {
      r.skip();
      break;
    }
    if (!is_digit(c) || leading_zero) {
      return make_error_code(errc::invalid_length);
    }
    const auto d = static_cast<std::size_t>(c - '0');
    if (value > (std::numeric_limits<std::size_t>::max() - d) / 10) {
      return make_error_code(errc::invalid_length);
    }
    value = value * 10 + d;
    leading_zero = (digits == 0 && c == '0');
    ++digits;
    r.skip();
  }
  out = value;
  return {};
}

std::error_code decode_string(SpanReader& r, std::string& out) noexcept {
  std::size_t length = 0;
  auto ec = decode_length(r, length);
  if (ec) {
    return ec;
  }
  bytes_view payload{};
  ec = r.read_payload(length, payload);
  if (ec) {
    return ec;
  }
  out.assign(reinterpret_cast<const char*>(payload.data()), payload.size());
  return {};
}

// i<['-']digits>e，首字节 'i' 已确认。
std::error_code decode_integer(SpanReader& r, std::int64_t& out) noexcept {
  r.skip();

  bool negative = false;
  if (!r.at_end() && r.peek() == '-') {
    negative = true;
    r.skip();
  }

  // 负数允许的绝对值比正数多 1（INT64_MIN）。
  const std::uint64_t limit = negative
    ? static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1u
    : static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

  std::uint64_t magnitude = 0;
  std::size_t digits = 0;
  for (;;) {
    if (r.at_end()) {
      return make_error_code(errc::unexpected_eof);
    }
    const byte c = r.peek();
    if (c == 'e') {
      r.skip();
      break;
    }
    if (!is_digit(c)) {
      return make_error_code(errc::invalid_integer);
    }
    if (digits == 1 && magnitude == 0) {
      return make_error_code(errc::invalid_integer);  // 前导 0
    }
    const auto d = static_cast<std::uint64_t>(c - '0');
    if (magnitude > (limit - d) / 10) {
      return make_error_code(errc::integer_overflow);
    }
    magnitude = magnitude * 10 + d;
    ++digits;
    r.skip();
  }

  if (digits == 0) {
    return make_error_code(errc::invalid_integer);
  }
  if (negative && magnitude == 0) {
    return make_error_code(errc::invalid_integer);  // "-0"
  }

  if (!negative) {
    out = static_cast<std::int64_t>(magnitude);
  } else if (magnitude == limit) {
    out = std::numeric_limits<std::int64_t>::min();
  } else {
    out = -static_cast<std::int64_t>(magnitude);
  }
  return {};
}

std::error_code decode_list(SpanReader& r, Value& out, std::size_t depth, const DecodeLimits& limits) noexcept {
  r.skip();

  List items;
  for (;;) {
    if (r.at_end()) {
      return make_error_code(errc::unterminated_container);
    }
    if (r.peek() == 'e') {
      r.skip();
      break;
    }
    Value child = Value::integer(0);  // 占位，后续会被覆盖
    auto ec = decode_value(r, child, depth, limits);
    if (ec) {
      return ec;
    }
    items.push_back(std::move(child));
  }
  out = Value(std::move(items));
  return {};
}

std::error_code decode_dictionary(
  SpanReader& r,
  Value& out,
  std::size_t depth,
  const DecodeLimits& limits) noexcept {
  r.skip();

  Dictionary dict;
  for (;;) {
    if (r.at_end()) {
      return make_error_code(errc::unterminated_container);
    }
    const byte c = r.peek();
    if (c == 'e') {
      r.skip();
      break;
    }
    if (!is_digit(c)) {
      return make_error_code(errc::non_string_dict_key);
    }

    std::string key;
    auto ec = decode_string(r, key);
    if (ec) {
      return ec;
    }
    // 严格升序：同时拒绝乱序与重复 key。
    if (!dict.empty() && !key_less(std::prev(dict.end())->first, key)) {
      return make_error_code(errc::unsorted_or_duplicate_key);
    }

    if (r.at_end()) {
      return make_error_code(errc::unexpected_eof);
    }
    Value child = Value::integer(0);
    ec = decode_value(r, child, depth, limits);
    if (ec) {
      return ec;
    }
    dict.insert(std::move(key), std::move(child));
  }
  out = Value(std::move(dict));
  return {};
}

std::error_code decode_value(SpanReader& r, Value& out, std::size_t depth, const DecodeLimits& limits) noexcept {
  if (r.at_end()) {
    return make_error_code(errc::unexpected_eof);
  }

  const byte c = r.peek();
  if (is_digit(c)) {
    std::string s;
    auto ec = decode_string(r, s);
    if (ec) {
      return ec;
    }
    out = Value(ByteString{std::move(s)});
    return {};
  }

  switch (c) {
    case 'i': {
      std::int64_t v = 0;
      auto ec = decode_integer(r, v);
      if (ec) {
        return ec;
      }
      out = Value(Integer{v});
      return {};
    }
    case 'l':
    case 'd':
      // 进入容器前检查深度：递归层数不会超过 max_depth。
      if (depth >= limits.max_depth) {
        return make_error_code(errc::nesting_too_deep);
      }
      if (c == 'l') {
        return decode_list(r, out, depth + 1, limits);
      }
      return decode_dictionary(r, out, depth + 1, limits);
    default:
      return make_error_code(errc::invalid_type_prefix);
  }
}

void log_decode_failure(const std::error_code& ec, std::size_t offset, std::size_t total) noexcept {
  benc::core::detail::logger().debug(
    "bencode decode failed at offset {}/{}: {}", offset, total, ec.message());
}

}  // namespace

const std::error_category& error_category() noexcept {
  static benc_codec_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

bool is_truncation(const std::error_code& ec) noexcept {
  return ec == make_error_code(errc::unexpected_eof) || ec == make_error_code(errc::unterminated_container);
}

std::size_t encoded_size(const Value& value) noexcept {
  return encoded_size_impl(value);
}

void encode(const Value& value, std::vector<byte>& out) {
  const auto size = encoded_size(value);
  const auto offset = out.size();
  out.resize(offset + size);

  SpanWriter w(mutable_bytes_view{out.data() + offset, size});
  encode_value(value, w);
}

std::vector<byte> encode(const Value& value) {
  std::vector<byte> out;
  encode(value, out);
  return out;
}

std::error_code encode_to(mutable_bytes_view out, const Value& value, std::size_t& written) noexcept {
  written = 0;
  const auto size = encoded_size(value);
  if (size > out.size()) {
    return benc::core::make_error_code(benc::core::errc::buffer_overflow);
  }
  SpanWriter w(out.first(size));
  encode_value(value, w);
  written = w.written();
  return {};
}

std::error_code decode_one(
  bytes_view in,
  Value& out,
  std::size_t& consumed,
  const DecodeLimits& limits) noexcept {
  consumed = 0;
  SpanReader r(in);
  Value result = Value::integer(0);
  auto ec = decode_value(r, result, 0, limits);
  if (ec) {
    log_decode_failure(ec, r.consumed(), in.size());
    return ec;
  }
  consumed = r.consumed();
  out = std::move(result);
  return {};
}

std::error_code decode(bytes_view in, Value& out, const DecodeLimits& limits) noexcept {
  SpanReader r(in);
  Value result = Value::integer(0);
  auto ec = decode_value(r, result, 0, limits);
  if (!ec && !r.at_end()) {
    ec = make_error_code(errc::trailing_data);
  }
  if (ec) {
    log_decode_failure(ec, r.consumed(), in.size());
    return ec;
  }
  benc::core::detail::logger().trace(
    "bencode decoded {} ({} bytes)", to_string(result.kind()), in.size());
  out = std::move(result);
  return {};
}

}  // namespace benc::codec
