#pragma once

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace uuidcat::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    std::size_t ops;
    double elapsed_ms;
    double ns_per_op;
};

class BenchmarkTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }

    void stop() { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsed_ms() const {
        auto duration =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end_ - start_);
        return static_cast<double>(duration.count()) / 1'000'000.0;
    }

private:
    std::chrono::time_point<std::chrono::steady_clock> start_;
    std::chrono::time_point<std::chrono::steady_clock> end_;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

// 每轮执行 ops 次操作，重复 rounds 轮取平均，结果以 ns/op 表示。
template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t ops,
                          int rounds,
                          Func &&func) {
    double total_ms = 0.0;
    for (int i = 0; i < rounds; ++i) {
        BenchmarkTimer timer;
        timer.start();
        func();
        timer.stop();
        total_ms += timer.elapsed_ms();
    }
    const double avg_ms = rounds > 0 ? total_ms / rounds : 0.0;
    const double ns_per_op =
        ops > 0 ? (avg_ms * 1'000'000.0) / static_cast<double>(ops) : 0.0;
    results().push_back({name, ops, avg_ms, ns_per_op});
}

inline void print_results() {
    std::cout << "\n";
    std::cout << std::string(90, '=') << "\n";
    std::cout << "BENCHMARK RESULTS\n";
    std::cout << std::string(90, '=') << "\n";
    std::cout << std::left << std::setw(50) << "Benchmark" << std::setw(12)
              << "Ops" << std::setw(14) << "Time (ms)" << std::setw(14)
              << "ns/op"
              << "\n";
    std::cout << std::string(90, '-') << "\n";

    for (const auto &result : results()) {
        std::cout << std::left << std::setw(50) << result.name << std::setw(12)
                  << result.ops << std::fixed << std::setprecision(3)
                  << std::setw(14) << result.elapsed_ms << std::setw(14)
                  << result.ns_per_op << "\n";
    }

    std::cout << std::string(90, '=') << "\n\n";
}

} // namespace uuidcat::benchmarks

#define BENCH_RUN(name, ops, rounds, code)                                     \
    ::uuidcat::benchmarks::run_benchmark(name, ops, rounds, [&]() { code; })
