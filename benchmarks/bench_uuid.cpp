#include "bench_main.hpp"
#include "uuidcat/category/categorized.hpp"
#include "uuidcat/category/registry.hpp"
#include "uuidcat/id/uuid.hpp"

#include <string>
#include <vector>

using namespace uuidcat;

static void bench_plain_generate() {
    constexpr std::size_t ops = 100'000;
    id::Uuid u;

    BENCH_RUN("UUIDv7: generate (getrandom)", ops, 3, {
        for (std::size_t i = 0; i < ops; ++i) {
            if (id::generate(u)) {
                std::cerr << "generate failed at " << i << "\n";
                break;
            }
        }
    });
}

static void bench_categorized_round_trip() {
    // 满容量注册表：code_of 走 std::map 查找，最坏情况接近 log2(4096) 次比较。
    constexpr std::size_t ops = 100'000;
    std::vector<std::string> names;
    names.reserve(category::kMaxCategories);
    for (std::size_t i = 0; i < category::kMaxCategories; ++i) {
        names.push_back("category_" + std::to_string(i));
    }
    category::CategoryRegistry reg;
    if (reg.set_categories(names)) {
        std::cerr << "set_categories failed\n";
        return;
    }

    id::Uuid u;
    std::string out;
    BENCH_RUN("Categorized: generate + extract (4096 categories)", ops, 3, {
        for (std::size_t i = 0; i < ops; ++i) {
            const auto &name = names[i % names.size()];
            if (category::generate(reg, name, u) || category::extract(reg, u, out)) {
                std::cerr << "round trip failed at " << i << "\n";
                break;
            }
        }
    });
}

static void bench_parse_string() {
    constexpr std::size_t ops = 200'000;
    id::Uuid u;
    if (id::generate(u)) {
        return;
    }
    const auto text = id::to_string(u);
    id::Uuid parsed;

    BENCH_RUN("UUIDv7: parse_string (canonical text)", ops, 3, {
        for (std::size_t i = 0; i < ops; ++i) {
            if (id::parse_string(text, parsed)) {
                std::cerr << "parse failed at " << i << "\n";
                break;
            }
        }
    });
}

int main() {
    bench_plain_generate();
    bench_categorized_round_trip();
    bench_parse_string();
    ::uuidcat::benchmarks::print_results();
    return 0;
}
