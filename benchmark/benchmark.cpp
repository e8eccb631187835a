/*
 * hybridsort - Benchmark Suite
 *
 * Compares hybridsort against std::sort, std::stable_sort and std::nth_element.
 * Run with: g++ -std=c++17 -O3 -Iinclude -o benchmark benchmark/benchmark.cpp && ./benchmark [n]
 */

#include "hybridsort.hpp"
#include <iostream>
#include <vector>
#include <random>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <string>
#include <functional>
#include <limits>
#include <cstdint>
#include <utility>

using Data = std::vector<int32_t>;
using Generator = std::function<Data(size_t)>;

// =============================================================================
// Timing
// =============================================================================

// Best of several runs on a fresh copy of the input, in microseconds.
template<typename Sorter>
double best_of_us(const Data& input, Sorter&& sorter, int runs = 5) {
    double best = std::numeric_limits<double>::max();
    for (int i = 0; i < runs; i++) {
        Data copy = input;
        auto start = std::chrono::steady_clock::now();
        sorter(copy);
        auto stop = std::chrono::steady_clock::now();
        best = std::min(best, std::chrono::duration<double, std::micro>(stop - start).count());
    }
    return best;
}

// =============================================================================
// Inputs
// =============================================================================

// Keys drawn from `distinct` values. Few values means long pivot-equal runs,
// which the quicksort and quickselect skip in one partition_left pass.
Data gen_distinct(size_t n, uint32_t distinct, uint32_t seed = 12345) {
    std::mt19937 rng(seed);
    Data data(n);
    for (auto& x : data) x = static_cast<int32_t>(rng() % distinct);
    return data;
}

Data gen_random(size_t n) {
    return gen_distinct(n, std::numeric_limits<uint32_t>::max());
}

Data gen_ascending(size_t n) {
    Data data(n);
    for (size_t i = 0; i < n; i++) data[i] = static_cast<int32_t>(i);
    return data;
}

Data gen_descending(size_t n) {
    Data data = gen_ascending(n);
    std::reverse(data.begin(), data.end());
    return data;
}

// Up then down: the median-of-three samples land on both slopes.
Data gen_organ_pipe(size_t n) {
    Data data(n);
    for (size_t i = 0; i < n; i++) data[i] = static_cast<int32_t>(std::min(i, n - 1 - i));
    return data;
}

// =============================================================================
// Report
// =============================================================================

void print_banner(const std::string& title) {
    std::cout << "\n========================================\n";
    std::cout << "     " << title << "\n";
    std::cout << "========================================\n\n";
}

void print_row(const std::string& label, const std::vector<double>& times_us) {
    std::cout << std::setw(18) << label;
    for (double t : times_us) {
        std::cout << std::setw(13) << std::fixed << std::setprecision(0) << t << " us";
    }
    std::cout << "\n";
}

void print_columns(const std::string& first, const std::vector<std::string>& rest) {
    std::cout << std::setw(18) << first;
    for (const auto& c : rest) std::cout << std::setw(16) << c;
    std::cout << "\n" << std::string(18 + 16 * rest.size(), '-') << "\n";
}

// =============================================================================
// Benchmarks
// =============================================================================

void run_patterns(size_t n) {
    print_banner("Input patterns (n = " + std::to_string(n) + ")");
    print_columns("Pattern", {"std::sort", "hybrid::sort", "std::stable", "hybrid stable"});

    const std::vector<std::pair<std::string, Generator>> patterns = {
        {"Random", gen_random},
        {"Ascending", gen_ascending},
        {"Descending", gen_descending},
        {"Organ pipe", gen_organ_pipe},
        {"100 distinct", [](size_t m) { return gen_distinct(m, 100); }},
    };

    for (const auto& pattern : patterns) {
        Data input = pattern.second(n);
        print_row(pattern.first, {
            best_of_us(input, [](Data& d) { std::sort(d.begin(), d.end()); }),
            best_of_us(input, [](Data& d) { hybrid::sort(d.begin(), d.end()); }),
            best_of_us(input, [](Data& d) { std::stable_sort(d.begin(), d.end()); }),
            best_of_us(input, [](Data& d) { hybrid::stable_sort(d.begin(), d.end()); }),
        });
    }
}

// Sorting and median selection as the number of distinct keys shrinks.
void run_duplicate_runs(size_t n) {
    print_banner("Duplicate runs (n = " + std::to_string(n) + ")");
    print_columns("Distinct keys", {"std::sort", "hybrid::sort", "nth_element", "by_rank"});

    for (uint32_t distinct : {1u, 2u, 16u, 1000u, 1000000u}) {
        Data input = gen_distinct(n, distinct);
        size_t k = n / 2;
        print_row(std::to_string(distinct), {
            best_of_us(input, [](Data& d) { std::sort(d.begin(), d.end()); }),
            best_of_us(input, [](Data& d) { hybrid::sort(d.begin(), d.end()); }),
            best_of_us(input, [k](Data& d) { std::nth_element(d.begin(), d.begin() + k, d.end()); }),
            best_of_us(input, [k](Data& d) { hybrid::partition_by_rank(d.begin(), d.end(), k); }),
        });
    }
}

void run_scaling() {
    print_banner("Scaling (random input)");
    print_columns("Size", {"std::sort", "hybrid::sort", "nth_element", "by_rank"});

    for (size_t n : {1000, 10000, 100000, 1000000}) {
        Data input = gen_random(n);
        size_t k = n / 2;
        print_row(std::to_string(n), {
            best_of_us(input, [](Data& d) { std::sort(d.begin(), d.end()); }),
            best_of_us(input, [](Data& d) { hybrid::sort(d.begin(), d.end()); }),
            best_of_us(input, [k](Data& d) { std::nth_element(d.begin(), d.begin() + k, d.end()); }),
            best_of_us(input, [k](Data& d) { hybrid::partition_by_rank(d.begin(), d.end(), k); }),
        });
    }
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    size_t n = 100000;
    if (argc > 1) {
        n = std::stoull(argv[1]);
    }
    if (n == 0) {
        std::cerr << "n must be positive\n";
        return 1;
    }

    std::cout << "========================================\n";
    std::cout << "       hybridsort Benchmark Suite\n";
    std::cout << "========================================\n";

    run_patterns(n);
    run_duplicate_runs(n);
    run_scaling();

    std::cout << "\n========================================\n";
    std::cout << "             Benchmark Complete\n";
    std::cout << "========================================\n";

    return 0;
}
