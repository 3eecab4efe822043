/**
 * @file jsonb_hex_dump.cpp
 * @brief 演示 jsonb::utils 的结构化 dump 与 Visitor 解码输出
 *
 * 典型用途：
 * - 从 SQLite 的 jsonb() 结果（例如 `SELECT hex(jsonb('...'))`）复制十六进制字符串，
 *   查看每个元素的头部与 payload，并输出解码后的值。
 *
 * 运行：
 * - 无参数：运行内置示例
 * - 指定输入：./build/examples/jsonb_hex_dump "<hex>" [--no-hex] [--trace]
 * - 从标准输入读取：./build/examples/jsonb_hex_dump - [--no-hex] [--trace]
 */

#include <jsonb/codec/decoder.hpp>
#include <jsonb/codec/visitor.hpp>
#include <jsonb/core/common.hpp>
#include <jsonb/core/log.hpp>
#include <jsonb/utils/element_dump.hpp>
#include <jsonb/utils/hex.hpp>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace jsonb;

namespace {

[[nodiscard]] bool has_flag(int argc, char **argv, std::string_view flag) {
    for (int i = 0; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

void print_usage(const char *argv0) {
    std::cout << "用法:\n";
    std::cout << "  " << argv0 << "\n";
    std::cout << "  " << argv0 << " \"<hex>\" [--no-hex] [--trace]\n";
    std::cout << "  " << argv0 << " - [--no-hex] [--trace]   (从标准输入读取十六进制文本)\n";
}

[[nodiscard]] core::bytes_view as_view(const std::vector<core::byte> &bytes) {
    return core::bytes_view{bytes.data(), bytes.size()};
}

// 把 Visitor 回调直接渲染成紧凑的 JSON 文本（不构造中间 Value）。
class JsonPrinter final : public codec::Visitor {
public:
    std::error_code on_null() override { return scalar("null"); }
    std::error_code on_bool(bool value) override {
        return scalar(value ? "true" : "false");
    }
    std::error_code on_i64(std::int64_t value) override {
        return scalar(std::to_string(value));
    }
    std::error_code on_u64(std::uint64_t value) override {
        return scalar(std::to_string(value));
    }
    std::error_code on_f64(double value) override {
        std::ostringstream oss;
        oss << value;
        return scalar(oss.str());
    }
    std::error_code on_string(std::string_view value) override {
        return scalar(quote(value));
    }

    std::error_code begin_array() override {
        separator();
        out_ << '[';
        first_.push_back(true);
        return {};
    }
    std::error_code end_array() override {
        out_ << ']';
        first_.pop_back();
        return {};
    }
    std::error_code begin_object() override {
        separator();
        out_ << '{';
        first_.push_back(true);
        return {};
    }
    std::error_code on_key(std::string_view key) override {
        separator();
        out_ << quote(key) << ':';
        after_key_ = true;
        return {};
    }
    std::error_code end_object() override {
        out_ << '}';
        first_.pop_back();
        return {};
    }

    [[nodiscard]] std::string str() const { return out_.str(); }

private:
    std::error_code scalar(const std::string &text) {
        separator();
        out_ << text;
        return {};
    }

    void separator() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (first_.empty()) {
            return;
        }
        if (!first_.back()) {
            out_ << ',';
        }
        first_.back() = false;
    }

    static std::string quote(std::string_view s) {
        std::string out = "\"";
        for (char c : s) {
            switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out.push_back(c);
            }
        }
        out.push_back('"');
        return out;
    }

    std::ostringstream out_;
    std::vector<bool> first_;
    bool after_key_{false};
};

int run_dump(const std::vector<core::byte> &bytes, bool include_hex) {
    if (include_hex) {
        utils::HexDumpOptions hex;
        hex.max_bytes = 256;
        hex.show_ascii = true;
        std::cout << "hex:\n" << utils::hex_dump(as_view(bytes), hex) << "\n";
    }

    utils::ElementDumpOptions opt;
    opt.max_payload_bytes = 64;
    std::cout << "elements:\n" << utils::dump_elements(as_view(bytes), opt) << "\n";

    JsonPrinter printer;
    const auto ec = codec::decode(as_view(bytes), codec::Shape::Any, printer);
    if (ec) {
        std::cerr << "decode 失败: [" << ec.category().name() << "] "
                  << ec.message() << "\n";
        return 1;
    }
    std::cout << "value:\n" << printer.str() << "\n";
    return 0;
}

int run_dump_from_hex(std::string_view hex_text, bool include_hex) {
    std::vector<core::byte> bytes;
    const auto ec = utils::parse_hex(hex_text, bytes);
    if (ec) {
        std::cerr << "parse_hex 失败: " << ec.message() << "\n";
        return 2;
    }
    return run_dump(bytes, include_hex);
}

void demo() {
    std::cout << "\n====================\n";
    std::cout << "示例：{\"a\":[1,2.5,\"x\"],\"ok\":true}\n";
    std::cout << "====================\n";

    // 对象 payload：键 "a" + 数组 [1, 2.5, "x"] + 键 "ok" + true
    const std::string_view hex_text =
        "cc 0f 17 61 8b 13 31 35 32 2e 35 17 78 27 6f 6b 01";
    std::cout << "输入: " << hex_text << "\n\n";
    run_dump_from_hex(hex_text, true);

    std::cout << "\n====================\n";
    std::cout << "示例：非最简头部 + 尾随数据\n";
    std::cout << "====================\n";
    run_dump_from_hex("f3 00 00 00 00 00 00 00 01 37 00", false);
}

} // namespace

int main(int argc, char **argv) {
    if (has_flag(argc, argv, "--trace")) {
        core::set_log_level(core::LogLevel::trace);
    }

    if (argc >= 2) {
        const std::string_view input = argv[1];
        if (input.rfind("--", 0) == 0) {
            print_usage(argv[0]);
            return 2;
        }
        const bool include_hex = !has_flag(argc, argv, "--no-hex");

        if (input == "-") {
            const std::string text((std::istreambuf_iterator<char>(std::cin)),
                                   std::istreambuf_iterator<char>());
            return run_dump_from_hex(text, include_hex);
        }
        const int rc = run_dump_from_hex(input, include_hex);
        if (rc == 2) {
            print_usage(argv[0]);
        }
        return rc;
    }

    std::cout << "=== jsonb::utils dump 工具示例 ===\n";
    demo();

    std::cout << "\n提示：你也可以把 SQLite 输出的十六进制字符串直接喂给本程序。\n";
    std::cout << "例如：\n";
    std::cout << "  " << argv[0] << " \"cc 03 17 61 00\"\n";
    return 0;
}
