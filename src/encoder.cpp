/**
 * @file encoder.cpp
 * @brief Point-level polyline encoding.
 *
 * @see include/polyline/encoder.hpp for value-level encoding
 */

#include <polyline/encoder.hpp>

#include <cmath>
#include <limits>
#include <utility>

namespace polyline {

namespace {

/**
 * @brief Round a coordinate onto the precision grid.
 *
 * @return false if the value is not finite or does not fit 32 bits
 */
bool to_grid(double degrees, double factor, std::int64_t& scaled) noexcept {
    if (!std::isfinite(degrees)) {
        return false;
    }

    double rounded = std::round(degrees * factor);
    if (rounded < static_cast<double>(std::numeric_limits<std::int32_t>::min()) ||
        rounded > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
        return false;
    }

    scaled = static_cast<std::int64_t>(rounded);
    return true;
}

bool fits_int32(std::int64_t value) noexcept {
    return value >= std::numeric_limits<std::int32_t>::min() &&
           value <= std::numeric_limits<std::int32_t>::max();
}

} // namespace

Error encode(const std::vector<Coordinate>& points, std::string& encoded, int precision) {
    if (!is_valid_precision(precision)) {
        return Error::InvalidArg;
    }
    const double factor = precision_factor(precision);

    std::string output;
    // Typical road geometry needs 4-8 characters per point
    output.reserve(points.size() * 8);

    std::int64_t prev_lat = 0;
    std::int64_t prev_lng = 0;

    for (const auto& point : points) {
        std::int64_t lat = 0;
        std::int64_t lng = 0;
        if (!to_grid(point.lat, factor, lat) || !to_grid(point.lng, factor, lng)) {
            return Error::InvalidArg;
        }

        std::int64_t delta_lat = lat - prev_lat;
        std::int64_t delta_lng = lng - prev_lng;
        if (!fits_int32(delta_lat) || !fits_int32(delta_lng)) {
            return Error::InvalidArg;
        }

        value_encode(output, static_cast<std::int32_t>(delta_lat));
        value_encode(output, static_cast<std::int32_t>(delta_lng));

        prev_lat = lat;
        prev_lng = lng;
    }

    encoded = std::move(output);
    return Error::Ok;
}

} // namespace polyline
