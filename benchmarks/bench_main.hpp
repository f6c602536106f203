#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace benc::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    std::size_t data_size;
    int iterations;
    double avg_ms;
    double min_ms;
    double throughput_mbps;
};

class BenchmarkTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }

    void stop() { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsed_ms() const {
        const auto ns =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end_ - start_);
        return static_cast<double>(ns.count()) / 1'000'000.0;
    }

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point end_;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

// 吞吐按最快一次计算：受调度抖动影响最小。
template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t data_size,
                          int iterations,
                          Func &&func) {
    if (iterations <= 0) {
        iterations = 1;
    }

    double total_ms = 0.0;
    double min_ms = 0.0;
    for (int i = 0; i < iterations; ++i) {
        BenchmarkTimer timer;
        timer.start();
        func();
        timer.stop();
        const double t = timer.elapsed_ms();
        total_ms += t;
        min_ms = (i == 0 ? t : std::min(min_ms, t));
    }

    double throughput_mbps = 0.0;
    if (min_ms > 0.0) {
        const double mb = static_cast<double>(data_size) / (1024.0 * 1024.0);
        throughput_mbps = mb / (min_ms / 1000.0);
    }

    results().push_back(
        {name, data_size, iterations, total_ms / iterations, min_ms, throughput_mbps});
}

inline std::string format_size(std::size_t bytes) {
    if (bytes >= 1024 * 1024) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    if (bytes >= 1024) {
        return std::to_string(bytes / 1024) + " KB";
    }
    return std::to_string(bytes) + " B";
}

inline void print_results() {
    const std::string rule(104, '=');
    std::cout << "\n" << rule << "\n";
    std::cout << "BENCHMARK RESULTS\n";
    std::cout << rule << "\n";
    std::cout << std::left << std::setw(48) << "Benchmark" << std::setw(12)
              << "Size" << std::setw(8) << "Iters" << std::setw(12) << "Avg (ms)"
              << std::setw(12) << "Min (ms)" << "Throughput (MB/s)\n";
    std::cout << std::string(104, '-') << "\n";

    for (const auto &r : results()) {
        std::cout << std::left << std::setw(48) << r.name << std::setw(12)
                  << format_size(r.data_size) << std::setw(8) << r.iterations
                  << std::fixed << std::setprecision(3) << std::setw(12)
                  << r.avg_ms << std::setw(12) << r.min_ms;
        if (r.throughput_mbps > 0.0) {
            std::cout << r.throughput_mbps;
        } else {
            std::cout << "N/A";
        }
        std::cout << "\n";
    }

    std::cout << rule << "\n\n";
}

} // namespace benc::benchmarks

#define BENCH_RUN(name, size, iterations, code)                                \
    ::benc::benchmarks::run_benchmark(name, size, iterations, [&]() { code; })
