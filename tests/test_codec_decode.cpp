#include "benc/codec/codec.hpp"

#include "test_main.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace {

using benc::codec::byte;
using benc::codec::bytes_view;
using benc::codec::ByteString;
using benc::codec::decode;
using benc::codec::decode_one;
using benc::codec::DecodeLimits;
using benc::codec::Dictionary;
using benc::codec::errc;
using benc::codec::Integer;
using benc::codec::is_truncation;
using benc::codec::List;
using benc::codec::make_error_code;
using benc::codec::Value;

bytes_view as_bytes(std::string_view s) {
    return bytes_view{reinterpret_cast<const byte *>(s.data()), s.size()};
}

Value placeholder_value() { return Value::string("placeholder"); }

Value decode_ok(std::string_view in, const DecodeLimits &limits = {}) {
    Value out = placeholder_value();
    TEST_EXPECT_OK(decode(as_bytes(in), out, limits));
    return out;
}

std::error_code decode_err(std::string_view in, const DecodeLimits &limits = {}) {
    Value out = placeholder_value();
    const auto ec = decode(as_bytes(in), out, limits);
    TEST_EXPECT(static_cast<bool>(ec));
    // 失败时不得留下部分结果
    TEST_EXPECT(out == placeholder_value());
    return ec;
}

void test_basic_decode() {
    TEST_EXPECT(decode_ok("4:spam") == Value::string("spam"));
    TEST_EXPECT(decode_ok("i-10e") == Value::integer(-10));
    TEST_EXPECT(decode_ok("l4:spam4:eggse") ==
                Value::list({Value::string("spam"), Value::string("eggs")}));
    TEST_EXPECT(decode_ok("d3:cow3:moo4:spam4:eggse") ==
                Value::dictionary({{"cow", Value::string("moo")}, {"spam", Value::string("eggs")}}));
}

void test_scalars() {
    TEST_EXPECT(decode_ok("0:") == Value::string(""));
    TEST_EXPECT(decode_ok("i0e") == Value::integer(0));
    TEST_EXPECT(decode_ok("i123456789e") == Value::integer(123456789));
    TEST_EXPECT(decode_ok("i-123e") == Value::integer(-123));
    TEST_EXPECT(decode_ok("i9223372036854775807e") ==
                Value::integer(std::numeric_limits<std::int64_t>::max()));
    TEST_EXPECT(decode_ok("i-9223372036854775808e") ==
                Value::integer(std::numeric_limits<std::int64_t>::min()));

    // 字节串内容是任意字节，包括结构字符和 NUL
    TEST_EXPECT(decode_ok("5:i1e:e") == Value::string("i1e:e"));
    const std::string with_nul("3:a\0b", 5);
    TEST_EXPECT(decode_ok(with_nul) == Value::string(std::string("a\0b", 3)));
    TEST_EXPECT(decode_ok("10:0123456789") == Value::string("0123456789"));
}

void test_containers() {
    TEST_EXPECT(decode_ok("le") == Value::list({}));
    TEST_EXPECT(decode_ok("de") == Value::dictionary({}));
    TEST_EXPECT(decode_ok("ll5:helloee") ==
                Value::list({Value::list({Value::string("hello")})}));
    TEST_EXPECT(decode_ok("ll5:helloei-10ee") ==
                Value::list({Value::list({Value::string("hello")}), Value::integer(-10)}));

    const auto complex = decode_ok("d4:key16:value14:key26:value22:okll5:helloei-10eee");
    const auto *dict = complex.get_if<Dictionary>();
    TEST_EXPECT(dict != nullptr);
    TEST_EXPECT_EQ(dict->size(), 3u);
    TEST_EXPECT(*dict->find("key1") == Value::string("value1"));
    TEST_EXPECT(*dict->find("key2") == Value::string("value2"));
    TEST_EXPECT(*dict->find("ok") ==
                Value::list({Value::list({Value::string("hello")}), Value::integer(-10)}));

    // 解码出的字典保持 wire 上的升序
    auto it = dict->begin();
    TEST_EXPECT_EQ(it->first, std::string("key1"));
    ++it;
    TEST_EXPECT_EQ(it->first, std::string("key2"));
    ++it;
    TEST_EXPECT_EQ(it->first, std::string("ok"));

    // 空 key 排在最前，是合法的
    TEST_EXPECT(decode_ok("d0:i1e1:ai2ee") ==
                Value::dictionary({{"", Value::integer(1)}, {"a", Value::integer(2)}}));
}

void test_integer_errors() {
    TEST_EXPECT_ERR(decode_err("i03e"), errc::invalid_integer);
    TEST_EXPECT_ERR(decode_err("i-0e"), errc::invalid_integer);
    TEST_EXPECT_ERR(decode_err("i-03e"), errc::invalid_integer);
    TEST_EXPECT_ERR(decode_err("i00e"), errc::invalid_integer);
    TEST_EXPECT_ERR(decode_err("ie"), errc::invalid_integer);
    TEST_EXPECT_ERR(decode_err("i-e"), errc::invalid_integer);
    TEST_EXPECT_ERR(decode_err("i+1e"), errc::invalid_integer);
    TEST_EXPECT_ERR(decode_err("i1x2e"), errc::invalid_integer);
    TEST_EXPECT_ERR(decode_err("i--1e"), errc::invalid_integer);
    TEST_EXPECT_ERR(decode_err("i 1e"), errc::invalid_integer);

    TEST_EXPECT_ERR(decode_err("i"), errc::unexpected_eof);
    TEST_EXPECT_ERR(decode_err("i-"), errc::unexpected_eof);
    TEST_EXPECT_ERR(decode_err("i12"), errc::unexpected_eof);

    TEST_EXPECT_ERR(decode_err("i9223372036854775808e"), errc::integer_overflow);
    TEST_EXPECT_ERR(decode_err("i-9223372036854775809e"), errc::integer_overflow);
    TEST_EXPECT_ERR(decode_err("i99999999999999999999999e"), errc::integer_overflow);
}

void test_string_errors() {
    TEST_EXPECT_ERR(decode_err("5:shor"), errc::unexpected_eof);
    TEST_EXPECT_ERR(decode_err("4"), errc::unexpected_eof);
    TEST_EXPECT_ERR(decode_err("12"), errc::unexpected_eof);
    TEST_EXPECT_ERR(decode_err("1:"), errc::unexpected_eof);

    TEST_EXPECT_ERR(decode_err("03:abc"), errc::invalid_length);
    TEST_EXPECT_ERR(decode_err("00:"), errc::invalid_length);
    TEST_EXPECT_ERR(decode_err("3x:abc"), errc::invalid_length);
    TEST_EXPECT_ERR(decode_err("3-:abc"), errc::invalid_length);
    TEST_EXPECT_ERR(decode_err("999999999999999999999999:x"), errc::invalid_length);
}

void test_structure_errors() {
    TEST_EXPECT_ERR(decode_err(""), errc::unexpected_eof);
    TEST_EXPECT_ERR(decode_err("x"), errc::invalid_type_prefix);
    TEST_EXPECT_ERR(decode_err("e"), errc::invalid_type_prefix);
    TEST_EXPECT_ERR(decode_err("-1"), errc::invalid_type_prefix);
    TEST_EXPECT_ERR(decode_err("lxe"), errc::invalid_type_prefix);

    TEST_EXPECT_ERR(decode_err("l"), errc::unterminated_container);
    TEST_EXPECT_ERR(decode_err("l4:spam"), errc::unterminated_container);
    TEST_EXPECT_ERR(decode_err("d"), errc::unterminated_container);
    TEST_EXPECT_ERR(decode_err("d3:cow3:moo"), errc::unterminated_container);
    TEST_EXPECT_ERR(decode_err("l4:spa"), errc::unexpected_eof);

    TEST_EXPECT_ERR(decode_err("di1e3:fooe"), errc::non_string_dict_key);
    TEST_EXPECT_ERR(decode_err("dl1:ae3:fooe"), errc::non_string_dict_key);
    TEST_EXPECT_ERR(decode_err("d3:cow"), errc::unexpected_eof);  // key 之后缺 value
    TEST_EXPECT_ERR(decode_err("d3:cowe"), errc::invalid_type_prefix);

    TEST_EXPECT_ERR(decode_err("i1ei2e"), errc::trailing_data);
    TEST_EXPECT_ERR(decode_err("4:spamx"), errc::trailing_data);
    TEST_EXPECT_ERR(decode_err("lee"), errc::trailing_data);
}

void test_dictionary_key_order() {
    TEST_EXPECT_ERR(decode_err("d4:spam4:eggs3:cow3:mooe"), errc::unsorted_or_duplicate_key);
    TEST_EXPECT_ERR(decode_err("d3:cow3:moo3:cow3:mooe"), errc::unsorted_or_duplicate_key);
    TEST_EXPECT_ERR(decode_err("d1:bi1e1:ai2ee"), errc::unsorted_or_duplicate_key);
    // 无符号字节序："\x80" 大于 "z"
    TEST_EXPECT(decode_ok("d1:zi1e1:\x80i2ee").is_dictionary());
    TEST_EXPECT_ERR(decode_err("d1:\x80i2e1:zi1ee"), errc::unsorted_or_duplicate_key);
    // 前缀短的 key 排在前面
    TEST_EXPECT(decode_ok("d1:ai1e2:aai2ee").is_dictionary());
    TEST_EXPECT_ERR(decode_err("d2:aai2e1:ai1ee"), errc::unsorted_or_duplicate_key);

    // 嵌套字典同样检查
    TEST_EXPECT_ERR(decode_err("d1:ad1:bi1e1:ai2eee"), errc::unsorted_or_duplicate_key);
}

void test_depth_guard() {
    DecodeLimits limits{};
    limits.max_depth = 8;

    // N <= max_depth：深度检查通过，最终因缺少 'e' 失败
    TEST_EXPECT_ERR(decode_err(std::string(8, 'l'), limits), errc::unterminated_container);
    TEST_EXPECT(is_truncation(decode_err(std::string(8, 'l'), limits)));
    // N > max_depth：在继续递归之前拒绝
    TEST_EXPECT_ERR(decode_err(std::string(9, 'l'), limits), errc::nesting_too_deep);

    const std::string ok_nested = std::string(8, 'l') + std::string(8, 'e');
    TEST_EXPECT(decode_ok(ok_nested, limits).is_list());
    const std::string too_deep = std::string(9, 'l') + std::string(9, 'e');
    TEST_EXPECT_ERR(decode_err(too_deep, limits), errc::nesting_too_deep);

    // 字典也计入深度
    TEST_EXPECT_ERR(decode_err("d1:ad1:ad1:ai1eeee", DecodeLimits{2}), errc::nesting_too_deep);
    TEST_EXPECT(decode_ok("d1:ad1:ai1eee", DecodeLimits{2}).is_dictionary());

    // max_depth = 0：只接受标量
    TEST_EXPECT(decode_ok("i1e", DecodeLimits{0}) == Value::integer(1));
    TEST_EXPECT_ERR(decode_err("le", DecodeLimits{0}), errc::nesting_too_deep);

    // 默认限制下的超深输入：不会栈溢出
    const std::string hostile(1'000'000, 'l');
    TEST_EXPECT_ERR(decode_err(hostile), errc::nesting_too_deep);

    const std::string at_default(benc::codec::kDefaultMaxDepth, 'l');
    TEST_EXPECT_ERR(decode_err(at_default), errc::unterminated_container);
}

void test_decode_one_walks_concatenated_values() {
    const std::string_view in = "i1e4:spamle";
    auto rest = as_bytes(in);

    std::vector<Value> values;
    while (!rest.empty()) {
        Value v = placeholder_value();
        std::size_t consumed = 0;
        const auto ec = decode_one(rest, v, consumed);
        TEST_EXPECT_OK(ec);
        if (ec) {
            break;
        }
        TEST_EXPECT(consumed > 0);
        values.push_back(std::move(v));
        rest = rest.subspan(consumed);
    }

    TEST_EXPECT_EQ(values.size(), 3u);
    if (values.size() == 3u) {
        TEST_EXPECT(values[0] == Value::integer(1));
        TEST_EXPECT(values[1] == Value::string("spam"));
        TEST_EXPECT(values[2] == Value::list({}));
    }

    // 失败时 consumed 归零、out 不变
    Value out = placeholder_value();
    std::size_t consumed = 42;
    TEST_EXPECT_ERR(decode_one(as_bytes("i1"), out, consumed), errc::unexpected_eof);
    TEST_EXPECT_EQ(consumed, 0u);
    TEST_EXPECT(out == placeholder_value());
}

void test_error_category_and_messages() {
    const auto &category = benc::codec::error_category();
    TEST_EXPECT_EQ(std::string_view(category.name()), "benc.codec");

    TEST_EXPECT_EQ(make_error_code(errc::ok).message(), "ok");
    TEST_EXPECT_EQ(make_error_code(errc::unexpected_eof).message(), "unexpected end of input");
    TEST_EXPECT_EQ(make_error_code(errc::invalid_length).message(), "invalid string length prefix");
    TEST_EXPECT_EQ(make_error_code(errc::invalid_integer).message(), "invalid integer");
    TEST_EXPECT_EQ(make_error_code(errc::invalid_type_prefix).message(), "invalid type prefix");
    TEST_EXPECT_EQ(make_error_code(errc::unterminated_container).message(),
                   "unterminated list or dictionary");
    TEST_EXPECT_EQ(make_error_code(errc::non_string_dict_key).message(),
                   "dictionary key is not a byte string");
    TEST_EXPECT_EQ(make_error_code(errc::unsorted_or_duplicate_key).message(),
                   "dictionary keys not in strictly ascending order");
    TEST_EXPECT_EQ(make_error_code(errc::trailing_data).message(), "trailing data after value");
    TEST_EXPECT_EQ(make_error_code(errc::nesting_too_deep).message(), "nesting too deep");
    TEST_EXPECT_EQ(make_error_code(errc::integer_overflow).message(), "integer out of 64-bit range");

    std::error_code unknown(9999, category);
    TEST_EXPECT_EQ(unknown.message(), "unknown benc.codec error");

    TEST_EXPECT(is_truncation(make_error_code(errc::unexpected_eof)));
    TEST_EXPECT(is_truncation(make_error_code(errc::unterminated_container)));
    TEST_EXPECT(!is_truncation(make_error_code(errc::trailing_data)));
    TEST_EXPECT(!is_truncation(std::error_code{}));
}

} // namespace

int main() {
    test_basic_decode();
    test_scalars();
    test_containers();
    test_integer_errors();
    test_string_errors();
    test_structure_errors();
    test_dictionary_key_order();
    test_depth_guard();
    test_decode_one_walks_concatenated_values();
    test_error_category_and_messages();
    return ::benc::tests::run_and_report();
}
