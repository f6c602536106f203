#include <iostream>
#include <benc/codec/codec.hpp>
#include <benc/utils/value_dump.hpp>

using namespace benc::codec;

int main() {
    std::cout << "=== bencode 编解码简单示例 ===\n\n";

    // 构造字典（故意按非字节序插入）
    Dictionary info;
    info.insert("name", Value::string("example.iso"));
    info.insert("length", Value::integer(1048576));

    Dictionary root;
    root.insert("info", Value(std::move(info)));
    root.insert("announce", Value::string("http://tracker.example/announce"));
    root.insert("tags", Value::list({Value::string("linux"), Value::string("iso")}));

    const Value msg(std::move(root));

    // 编码：字典 key 自动按字节序输出
    const auto encoded = encode(msg);
    std::cout << "编码成功: " << encoded.size() << " 字节\n";
    std::cout << std::string(reinterpret_cast<const char*>(encoded.data()), encoded.size()) << "\n\n";

    // 解码
    Value decoded = Value::integer(0); // 临时初始值
    auto ec = decode(bytes_view{encoded.data(), encoded.size()}, decoded);
    if (ec) {
        std::cerr << "解码失败: " << ec.message() << "\n";
        return 1;
    }

    std::cout << benc::utils::dump_value(decoded) << "\n";

    if (decoded != msg) {
        std::cerr << "往返结果不一致\n";
        return 1;
    }

    if (const auto* dict = decoded.get_if<Dictionary>()) {
        if (const auto* announce = dict->find("announce")) {
            std::cout << "announce = " << announce->get_if<ByteString>()->value << "\n";
        }
    }

    return 0;
}
