/**
 * @file test_edge_cases.cpp
 * @brief Edge case tests for the polyline codec.
 *
 * Tests boundary coordinates, long lines, precision limits and concurrent
 * use.
 */

#include <catch2/catch.hpp>
#include <polyline/polyline.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace polyline;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Boundary Coordinates
// ============================================================================

TEST_CASE("boundary coordinates", "[edge]") {
    std::string encoded;
    std::vector<Coordinate> decoded;

    SECTION("poles and antimeridian") {
        std::vector<Coordinate> points{Coordinate{-180.0, -90.0}, Coordinate{180.0, 90.0},
                                       Coordinate{0.0, 0.0}, Coordinate{-180.0, 90.0}};
        REQUIRE(encode(points, encoded) == Error::Ok);
        REQUIRE(decode(encoded, decoded) == Error::Ok);
        REQUIRE(decoded == points);
    }

    SECTION("repeated point encodes as zero deltas") {
        std::vector<Coordinate> points{Coordinate{4.3517, 50.8465}, Coordinate{4.3517, 50.8465}};
        REQUIRE(encode(points, encoded) == Error::Ok);
        REQUIRE(encoded.substr(encoded.size() - 2) == "??");
    }

    SECTION("out of range coordinates are not rejected") {
        // Plausibility is up to the caller
        std::vector<Coordinate> points{Coordinate{500.0, -300.0}};
        REQUIRE(encode(points, encoded) == Error::Ok);
        REQUIRE(decode(encoded, decoded) == Error::Ok);
        REQUIRE_THAT(decoded[0].lng, WithinAbs(500.0, 1e-9));
        REQUIRE_THAT(decoded[0].lat, WithinAbs(-300.0, 1e-9));
    }

    SECTION("negative zero") {
        REQUIRE(encode({Coordinate{-0.0, -0.0}}, encoded) == Error::Ok);
        REQUIRE(encoded == "??");
    }

    SECTION("half-grid values round away from zero") {
        REQUIRE(encode({Coordinate{0.0, 0.000025}}, encoded) == Error::Ok);
        REQUIRE(decode(encoded, decoded) == Error::Ok);
        REQUIRE_THAT(decoded[0].lat, WithinAbs(0.00003, 1e-12));
    }
}

// ============================================================================
// Long Lines
// ============================================================================

TEST_CASE("long lines", "[edge]") {
    SECTION("traversal order is preserved") {
        std::vector<Coordinate> points;
        for (int i = 0; i < 10000; ++i) {
            points.push_back(Coordinate{i * 0.001, -i * 0.0005});
        }

        std::string encoded;
        REQUIRE(encode(points, encoded) == Error::Ok);
        REQUIRE(count_points(encoded) == points.size());

        std::vector<Coordinate> decoded;
        REQUIRE(decode(encoded, decoded) == Error::Ok);
        REQUIRE(decoded.size() == points.size());
        for (std::size_t i = 0; i < points.size(); ++i) {
            REQUIRE_THAT(decoded[i].lng, WithinAbs(points[i].lng, 0.5e-5 + 1e-12));
            REQUIRE_THAT(decoded[i].lat, WithinAbs(points[i].lat, 0.5e-5 + 1e-12));
        }
    }

    SECTION("totals may exceed 32 bits") {
        // Every delta is INT32_MAX; the running total grows past it
        std::string encoded;
        for (int i = 0; i < 4; ++i) {
            encoded += "}~~~~~B?";
        }

        std::vector<Coordinate> decoded;
        REQUIRE(decode(encoded, decoded) == Error::Ok);
        REQUIRE(decoded.size() == 4);
        REQUIRE_THAT(decoded[3].lat, WithinAbs(4.0 * 2147483647.0 / 1e5, 1e-6));
        REQUIRE_THAT(decoded[3].lng, WithinAbs(0.0, 1e-12));
    }
}

// ============================================================================
// Precision Limits
// ============================================================================

TEST_CASE("precision limits", "[edge]") {
    std::vector<Coordinate> points{Coordinate{12.3456789, -45.6789012}};
    std::string encoded;
    std::vector<Coordinate> decoded;

    SECTION("precision 0 keeps whole degrees") {
        REQUIRE(encode(points, encoded, 0) == Error::Ok);
        REQUIRE(decode(encoded, decoded, 0) == Error::Ok);
        REQUIRE_THAT(decoded[0].lng, WithinAbs(12.0, 1e-12));
        REQUIRE_THAT(decoded[0].lat, WithinAbs(-46.0, 1e-12));
    }

    SECTION("precision 7") {
        REQUIRE(encode(points, encoded, 7) == Error::Ok);
        REQUIRE(decode(encoded, decoded, 7) == Error::Ok);
        REQUIRE_THAT(decoded[0].lng, WithinAbs(12.3456789, 1e-9));
        REQUIRE_THAT(decoded[0].lat, WithinAbs(-45.6789012, 1e-9));
    }

    SECTION("mismatched precision scales by ten") {
        REQUIRE(encode(points, encoded, 5) == Error::Ok);
        REQUIRE(decode(encoded, decoded, 6) == Error::Ok);
        REQUIRE_THAT(decoded[0].lng, WithinAbs(1.234568, 1e-12));
    }
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("concurrent decoding", "[edge][concurrency]") {
    const std::string encoded = "_p~iF~ps|U_ulLnnqC_mqNvxq`@";
    constexpr int NUM_THREADS = 8;

    std::vector<int> failures(NUM_THREADS, 0);
    std::vector<std::thread> threads;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&encoded, &failures, t]() {
            Codec codec;
            for (int i = 0; i < 1000; ++i) {
                std::vector<Coordinate> points;
                if (codec.decode(encoded, points) != Error::Ok || points.size() != 3 ||
                    points[2].lat != 43.252) {
                    ++failures[static_cast<std::size_t>(t)];
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int count : failures) {
        REQUIRE(count == 0);
    }
}
