/**
 * @file bench.cpp
 * @brief Throughput benchmarks for pointpack unpack/repack.
 *
 * Measures batch unpack and repack throughput on synthetic LAS records for
 * regression testing during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/pointpack_bench                 # 100 iterations, 1M records
 *   ./build/pointpack_bench 1000 250000     # custom iterations and records
 */

#include <pointpack/pointpack.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace pointpack;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t DEFAULT_RECORDS = 1000000;

/**
 * @brief Fill a physical batch with a deterministic bit pattern.
 */
static std::vector<std::uint8_t> make_records(const PointFormat& format, std::size_t count) {
    std::vector<std::uint8_t> bytes(format.record_size() * count);
    std::uint32_t state = 2463534242U;
    for (auto& b : bytes) {
        // xorshift32
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        b = static_cast<std::uint8_t>(state);
    }
    return bytes;
}

static void print_result(const char* name, double total_us, int iterations,
                         std::size_t num_records) {
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_record_ns = per_iter_us * 1000.0 / static_cast<double>(num_records);
    double mrecords_per_s = static_cast<double>(num_records) / per_iter_us;

    std::printf("%-20s %10.2f µs/iter  %6.2f ns/rec  %8.1f Mrec/s\n", name, per_iter_us,
                per_record_ns, mrecords_per_s);
}

static int bench_format(int id, std::size_t num_records, int iterations) {
    PointFormat format;
    if (las_point_format(id, format) != Error::Ok) {
        std::fprintf(stderr, "Error: Unknown point format %d\n", id);
        return 1;
    }

    auto bytes = make_records(format, num_records);
    RecordBatch physical;
    auto result = RecordBatch::from_records(format.physical_schema(), bytes.data(), bytes.size(),
                                            physical);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", error_string(result));
        return 1;
    }

    // Warmup run
    RecordBatch expanded;
    RecordBatch repacked;
    ErrorDetail detail;
    if (unpack_sub_fields(physical, format, expanded, &detail) != Error::Ok ||
        repack_sub_fields(expanded, format, repacked, &detail) != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", detail.message().c_str());
        return 1;
    }

    char name[32];

    // Unpack
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        if (unpack_sub_fields(physical, format, expanded) != Error::Ok) {
            return 1;
        }
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::snprintf(name, sizeof(name), "unpack fmt %d", id);
    print_result(name, std::chrono::duration<double, std::micro>(end - start).count(),
                 iterations, num_records);

    // Repack
    start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        if (repack_sub_fields(expanded, format, repacked) != Error::Ok) {
            return 1;
        }
    }
    end = std::chrono::high_resolution_clock::now();
    std::snprintf(name, sizeof(name), "repack fmt %d", id);
    print_result(name, std::chrono::duration<double, std::micro>(end - start).count(),
                 iterations, num_records);

    if (repacked != physical) {
        std::fprintf(stderr, "Error: Round trip mismatch for point format %d\n", id);
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;
    std::size_t num_records = DEFAULT_RECORDS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }
    if (argc >= 3) {
        long records = std::atol(argv[2]);
        if (records > 0) {
            num_records = static_cast<std::size_t>(records);
        }
    }

    std::printf("pointpack Benchmarks (v%s)\n", version());
    std::printf("==========================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Records:    %zu\n\n", num_records);

    std::printf("%-20s %16s  %12s  %14s\n", "Test", "Time", "Per-Record", "Throughput");
    std::printf("%-20s %16s  %12s  %14s\n", "----", "----", "----------", "----------");

    int status = 0;
    status |= bench_format(1, num_records, iterations);
    status |= bench_format(6, num_records, iterations);

    std::printf("\nNote: Use these results for relative comparisons only.\n");

    return status;
}
