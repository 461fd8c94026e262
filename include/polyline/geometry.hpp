/**
 * @file geometry.hpp
 * @brief Route line geometry from a polyline or from waypoints.
 *
 * Routing responses may or may not carry an encoded polyline for a route.
 * route_geometry() prefers the decoded polyline and otherwise falls back to
 * straight segments through the route's waypoints.
 */

#ifndef POLYLINE_GEOMETRY_HPP
#define POLYLINE_GEOMETRY_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "coordinate.hpp"

namespace polyline {

/**
 * @brief Receives one diagnostic line (no trailing newline).
 */
using DiagnosticSink = std::function<void(const std::string& message)>;

/**
 * @brief Where a route geometry came from.
 */
enum class GeometrySource {
    None,     ///< Neither a usable polyline nor two waypoints
    Polyline, ///< Decoded from the encoded polyline
    Waypoints ///< Straight line through the fallback waypoints
};

/**
 * @brief Ordered line geometry of one route.
 */
struct RouteGeometry {
    GeometrySource source = GeometrySource::None;
    std::vector<Coordinate> coordinates;
};

/**
 * @brief Build the line geometry of a route.
 *
 * Uses @p encoded when it is present, passes the character check, decodes
 * without error and yields at least one point. Otherwise returns
 * @p waypoints in order, provided there are at least two of them; a single
 * point is not a line, so one or zero waypoints give GeometrySource::None.
 * A polyline that is rejected or fails to decode is reported to @p report.
 *
 * @param encoded Encoded polyline, if the route has one
 * @param waypoints Fallback points (start, visits, end) in route order
 * @param precision Decimal digits of the encoding
 * @param report Receives fallback diagnostics; empty to discard them
 * @return Route geometry and its source
 */
RouteGeometry route_geometry(const std::optional<std::string>& encoded,
                             const std::vector<Coordinate>& waypoints,
                             int precision = DEFAULT_PRECISION,
                             const DiagnosticSink& report = {});

/**
 * @brief Get a display name for a geometry source.
 */
inline const char* source_string(GeometrySource source) noexcept {
    switch (source) {
    case GeometrySource::None:
        return "none";
    case GeometrySource::Polyline:
        return "polyline";
    case GeometrySource::Waypoints:
        return "waypoints";
    default:
        return "unknown";
    }
}

} // namespace polyline

#endif // POLYLINE_GEOMETRY_HPP
