/**
 * @file geometry.cpp
 * @brief Route line geometry from a polyline or from waypoints.
 */

#include <polyline/decoder.hpp>
#include <polyline/geometry.hpp>
#include <polyline/validator.hpp>

#include <cstdio>
#include <utility>

namespace polyline {

RouteGeometry route_geometry(const std::optional<std::string>& encoded,
                             const std::vector<Coordinate>& waypoints, int precision,
                             const DiagnosticSink& report) {
    RouteGeometry geometry;
    char message[160];

    if (encoded.has_value() && valid_characters(*encoded)) {
        std::vector<Coordinate> points;
        auto status = decode(*encoded, points, precision);
        if (status == Error::Ok && !points.empty()) {
            geometry.source = GeometrySource::Polyline;
            geometry.coordinates = std::move(points);
            return geometry;
        }
        if (status != Error::Ok && report) {
            std::snprintf(message, sizeof(message),
                          "polyline decode failed (%s) after %zu points, using %zu waypoints",
                          error_string(status), points.size(), waypoints.size());
            report(message);
        }
    } else if (encoded.has_value() && report) {
        std::snprintf(message, sizeof(message),
                      "ignoring empty or non-polyline string, using %zu waypoints",
                      waypoints.size());
        report(message);
    }

    // A line needs two points
    if (waypoints.size() > 1) {
        geometry.source = GeometrySource::Waypoints;
        geometry.coordinates = waypoints;
    }
    return geometry;
}

} // namespace polyline
