/**
 * @file bench.cpp
 * @brief Performance benchmarks for polyline encoding and decoding.
 *
 * Measures throughput on synthetic routes for regression testing during
 * development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/polyline_bench              # Run with default 100 iterations
 *   ./build/polyline_bench 1000         # Run with custom iteration count
 */

#include <polyline/polyline.hpp>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace polyline;

static constexpr int DEFAULT_ITERATIONS = 100;

/**
 * @brief Deterministic wiggly route starting at a given origin.
 *
 * @param step Distance between points in degrees
 */
static std::vector<Coordinate> make_route(std::size_t num_points, double origin_lng,
                                          double origin_lat, double step) {
    std::vector<Coordinate> points;
    points.reserve(num_points);

    for (std::size_t i = 0; i < num_points; ++i) {
        double t = static_cast<double>(i);
        points.push_back(Coordinate{origin_lng + (t * step) + (0.3 * step * std::sin(t * 0.7)),
                                    origin_lat + (0.5 * t * step) + (step * std::cos(t * 0.3))});
    }
    return points;
}

static void bench_encode(const char* name, const std::vector<Coordinate>& points, int precision,
                         int iterations) {
    std::string encoded;

    // Warmup run
    if (encode(points, encoded, precision) != Error::Ok) {
        std::printf("%-20s FAIL (encode error)\n", name);
        return;
    }

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    Error status = Error::Ok;
    for (int i = 0; i < iterations && status == Error::Ok; i++) {
        status = encode(points, encoded, precision);
    }

    auto end = std::chrono::high_resolution_clock::now();

    if (status != Error::Ok) {
        std::printf("%-20s FAIL (%s)\n", name, error_string(status));
        return;
    }

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_point_ns = (per_iter_us * 1000.0) / static_cast<double>(points.size());
    double chars_per_point = static_cast<double>(encoded.size()) /
                             static_cast<double>(points.size());

    std::printf("%-20s %8.2f µs/iter  %7.1f ns/pt  %6.2f chr/pt  (%zu pts)\n", name, per_iter_us,
                per_point_ns, chars_per_point, points.size());
}

static void bench_decode(const char* name, const std::vector<Coordinate>& points, int precision,
                         int iterations) {
    // First encode the route
    std::string encoded;
    if (encode(points, encoded, precision) != Error::Ok) {
        std::printf("%-20s FAIL (encode error)\n", name);
        return;
    }

    std::vector<Coordinate> output;

    // Warmup run
    if (decode(encoded, output, precision) != Error::Ok) {
        std::printf("%-20s FAIL (decode error)\n", name);
        return;
    }

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    Error status = Error::Ok;
    for (int i = 0; i < iterations && status == Error::Ok; i++) {
        status = decode(encoded, output, precision);
    }

    auto end = std::chrono::high_resolution_clock::now();

    if (status != Error::Ok) {
        std::printf("%-20s FAIL (%s)\n", name, error_string(status));
        return;
    }

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_point_ns = (per_iter_us * 1000.0) / static_cast<double>(points.size());
    double throughput_mbps = static_cast<double>(encoded.size()) / per_iter_us;

    std::printf("%-20s %8.2f µs/iter  %7.1f ns/pt  %6.1f MB/s    (%zu pts)\n", name, per_iter_us,
                per_point_ns, throughput_mbps, points.size());
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("Encoded Polyline Benchmarks (C++ Implementation)\n");
    std::printf("================================================\n");
    std::printf("Iterations: %d\n\n", iterations);

    // City-scale road geometry, a country-scale trip, and a coarse overview
    auto city = make_route(1000, 4.3517, 50.8465, 0.0002);
    auto country = make_route(50000, 4.3517, 50.8465, 0.00005);
    auto overview = make_route(200, -120.2, 38.5, 0.05);

    // Encoding benchmarks
    std::printf("Encoding:\n");
    bench_encode("city (1e5)", city, 5, iterations);
    bench_encode("country (1e5)", country, 5, iterations);
    bench_encode("country (1e6)", country, 6, iterations);
    bench_encode("overview (1e5)", overview, 5, iterations);

    // Decoding benchmarks
    std::printf("\nDecoding:\n");
    bench_decode("city (1e5)", city, 5, iterations);
    bench_decode("country (1e5)", country, 5, iterations);
    bench_decode("country (1e6)", country, 6, iterations);
    bench_decode("overview (1e5)", overview, 5, iterations);

    std::printf("\nUse these results for relative comparisons only.\n");

    return 0;
}
