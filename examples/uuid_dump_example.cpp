/**
 * @file uuid_dump_example.cpp
 * @brief 解析命令行给出的 UUID 文本，输出分类与位域信息
 *
 * 运行：
 * - 无参数：以当前注册表的最后一个分类生成一个 UUID 并输出
 * - 指定输入：
 *   - ./build/examples/uuid_dump_example "<uuid>" [--categories A,B,C] [--no-fields] [--hex] [--color]
 *
 * --categories 以逗号分隔，按顺序分配分类码（未指定时使用默认分类）。
 */

#include <uuidcat/category/categorized.hpp>
#include <uuidcat/category/registry.hpp>
#include <uuidcat/id/uuid.hpp>
#include <uuidcat/utils/uuid_dump.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace uuidcat;

namespace {

[[nodiscard]] bool has_flag(int argc, char **argv, std::string_view flag) {
    for (int i = 0; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] const char *flag_value(int argc, char **argv, std::string_view flag) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == flag) {
            return argv[i + 1];
        }
    }
    return nullptr;
}

[[nodiscard]] std::vector<std::string> split_csv(std::string_view text) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto pos = text.find(',', start);
        const auto end = (pos == std::string_view::npos) ? text.size() : pos;
        if (end > start) {
            out.emplace_back(text.substr(start, end - start));
        }
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return out;
}

void print_usage(const char *argv0) {
    std::cout << "用法:\n";
    std::cout << "  " << argv0 << "\n";
    std::cout << "  " << argv0
              << " \"<uuid>\" [--categories A,B,C] [--no-fields] [--hex] [--color]\n";
}

} // namespace

int main(int argc, char **argv) {
    if (has_flag(argc, argv, "-h") || has_flag(argc, argv, "--help")) {
        print_usage(argv[0]);
        return 0;
    }

    auto &registry = category::global_registry();
    if (const auto *csv = flag_value(argc, argv, "--categories")) {
        auto ec = registry.set_categories(split_csv(csv));
        if (ec) {
            std::cerr << "分类配置无效: " << ec.message() << "\n";
            return 2;
        }
    }

    utils::UuidDumpOptions options;
    options.include_fields = !has_flag(argc, argv, "--no-fields");
    options.include_hex = has_flag(argc, argv, "--hex");
    options.enable_color = has_flag(argc, argv, "--color");

    if (argc < 2 || std::string_view(argv[1]).starts_with("--")) {
        id::Uuid uuid;
        auto ec = category::generate(registry, registry.categories().back(), uuid);
        if (ec) {
            std::cerr << "生成失败: " << ec.message() << "\n";
            return 1;
        }
        std::cout << id::to_string(uuid) << "\n";
        std::cout << utils::describe(registry, uuid, options);
        std::cout << "\n";
        return 0;
    }

    std::cout << utils::describe_text(registry, argv[1], options) << "\n";

    std::string name;
    auto ec = category::extract_text(registry, argv[1], name);
    return ec ? 1 : 0;
}
