/**
 * @file cli.cpp
 * @brief Encoded polyline command line interface.
 *
 * Decodes, encodes and checks encoded polylines, and builds route geometry
 * with a waypoint fallback.
 */

#include <polyline/polyline.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

using namespace polyline;

static void print_version() {
    std::printf("polyline %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nEncoded Polyline Codec (v%s C++)\n", version());
    std::printf("================================\n\n");
    std::printf("References:\n");
    std::printf("  https://developers.google.com/maps/documentation/utilities/polylinealgorithm\n\n");
    std::printf("Usage:\n");
    std::printf("  %s decode [-p N] <encoded>\n", prog_name);
    std::printf("  %s encode [-p N] <lng,lat> [<lng,lat> ...]\n", prog_name);
    std::printf("  %s check <encoded>\n", prog_name);
    std::printf("  %s route [-p N] [-V] <encoded|-> [<lng,lat> ...]\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -p N           Precision in decimal digits 0-7 (default %d)\n",
                DEFAULT_PRECISION);
    std::printf("  -V, --verbose  Report polyline fallbacks on stderr\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Output:\n");
    std::printf("  decode: one 'lng,lat' line per point\n");
    std::printf("  encode: the encoded polyline\n");
    std::printf("  check:  'valid' (exit 0) or 'invalid' (exit 1)\n");
    std::printf("  route:  geometry source, then one 'lng,lat' line per point\n\n");
    std::printf("Examples:\n");
    std::printf("  %s decode '_p~iF~ps|U_ulLnnqC_mqNvxq`@'\n", prog_name);
    std::printf("  %s encode -120.2,38.5 -120.95,40.7 -126.453,43.252\n", prog_name);
    std::printf("  %s route - 4.3517,50.8465 4.4051,51.2213\n\n", prog_name);
}

static void stderr_sink(const std::string& message) {
    std::fprintf(stderr, "polyline: %s\n", message.c_str());
}

static bool parse_coordinate(const char* text, Coordinate& point) {
    char* end = nullptr;
    errno = 0;
    double lng = std::strtod(text, &end);
    if (end == text || *end != ',' || errno != 0) {
        return false;
    }

    const char* lat_text = end + 1;
    double lat = std::strtod(lat_text, &end);
    if (end == lat_text || *end != '\0' || errno != 0) {
        return false;
    }

    point = Coordinate{lng, lat};
    return true;
}

static bool parse_coordinates(int argc, char** argv, int first, std::vector<Coordinate>& points) {
    for (int i = first; i < argc; ++i) {
        Coordinate point;
        if (!parse_coordinate(argv[i], point)) {
            std::fprintf(stderr, "Error: Expected <lng,lat>, got: %s\n", argv[i]);
            return false;
        }
        points.push_back(point);
    }
    return true;
}

static void print_points(const std::vector<Coordinate>& points, int precision) {
    for (const auto& point : points) {
        std::printf("%.*f,%.*f\n", precision, point.lng, precision, point.lat);
    }
}

static int do_decode(const char* encoded, int precision) {
    std::vector<Coordinate> points;
    auto result = decode(encoded, points, precision);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Decoding failed after %zu points: %s\n", points.size(),
                     error_string(result));
        return 1;
    }

    print_points(points, precision);
    return 0;
}

static int do_encode(const std::vector<Coordinate>& points, int precision) {
    std::string encoded;
    auto result = encode(points, encoded, precision);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Encoding failed: %s\n", error_string(result));
        return 1;
    }

    std::printf("%s\n", encoded.c_str());
    return 0;
}

static int do_check(const char* encoded) {
    bool valid = is_valid_encoding(Input{std::string(encoded)});
    std::printf("%s\n", valid ? "valid" : "invalid");
    return valid ? 0 : 1;
}

static int do_route(const char* encoded, const std::vector<Coordinate>& waypoints,
                    int precision, bool verbose) {
    std::optional<std::string> polyline_text;
    if (std::strcmp(encoded, "-") != 0) {
        polyline_text = encoded;
    }

    auto geometry = route_geometry(polyline_text, waypoints, precision,
                                   verbose ? DiagnosticSink(stderr_sink) : DiagnosticSink());
    std::printf("source: %s (%zu points)\n", source_string(geometry.source),
                geometry.coordinates.size());
    print_points(geometry.coordinates, precision);

    return (geometry.source == GeometrySource::None) ? 1 : 0;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    const char* command = argv[1];
    int arg_offset = 2;
    int precision = DEFAULT_PRECISION;
    bool verbose = false;

    // Options come right after the command
    while (arg_offset < argc && argv[arg_offset][0] == '-' && argv[arg_offset][1] != '\0' &&
           std::strcmp(argv[arg_offset], "-") != 0) {
        const char* option = argv[arg_offset];
        if (std::strcmp(option, "-p") == 0) {
            if (arg_offset + 1 >= argc) {
                std::fprintf(stderr, "Error: -p requires a value\n");
                return 1;
            }
            precision = std::atoi(argv[arg_offset + 1]);
            arg_offset += 2;
        } else if (std::strcmp(option, "-V") == 0 || std::strcmp(option, "--verbose") == 0) {
            verbose = true;
            ++arg_offset;
        } else if (std::strcmp(command, "encode") == 0 || std::strcmp(command, "route") == 0) {
            // Negative longitudes look like options
            break;
        } else {
            std::fprintf(stderr, "Error: Unknown option: %s\n", option);
            return 1;
        }
    }

    // Validate parameters
    if (!is_valid_precision(precision)) {
        std::fprintf(stderr, "Error: precision must be 0-%d\n", MAX_PRECISION);
        return 1;
    }

    if (std::strcmp(command, "decode") == 0) {
        if (argc - arg_offset != 1) {
            std::fprintf(stderr, "Usage: %s decode [-p N] <encoded>\n", argv[0]);
            return 1;
        }
        return do_decode(argv[arg_offset], precision);
    }

    if (std::strcmp(command, "encode") == 0) {
        if (argc - arg_offset < 1) {
            std::fprintf(stderr, "Usage: %s encode [-p N] <lng,lat> [<lng,lat> ...]\n", argv[0]);
            return 1;
        }
        std::vector<Coordinate> points;
        if (!parse_coordinates(argc, argv, arg_offset, points)) {
            return 1;
        }
        return do_encode(points, precision);
    }

    if (std::strcmp(command, "check") == 0) {
        if (argc - arg_offset != 1) {
            std::fprintf(stderr, "Usage: %s check <encoded>\n", argv[0]);
            return 1;
        }
        return do_check(argv[arg_offset]);
    }

    if (std::strcmp(command, "route") == 0) {
        if (argc - arg_offset < 1) {
            std::fprintf(stderr, "Usage: %s route [-p N] [-V] <encoded|-> [<lng,lat> ...]\n",
                         argv[0]);
            return 1;
        }
        std::vector<Coordinate> waypoints;
        if (!parse_coordinates(argc, argv, arg_offset + 1, waypoints)) {
            return 1;
        }
        return do_route(argv[arg_offset], waypoints, precision, verbose);
    }

    std::fprintf(stderr, "Error: Unknown command: %s\n", command);
    print_help(argv[0]);
    return 1;
}
