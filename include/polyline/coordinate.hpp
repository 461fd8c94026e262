/**
 * @file coordinate.hpp
 * @brief Geographic coordinate pair.
 */

#ifndef POLYLINE_COORDINATE_HPP
#define POLYLINE_COORDINATE_HPP

#include <cstddef>

namespace polyline {

/**
 * @brief A (longitude, latitude) pair in degrees.
 *
 * Longitude comes first, as in GeoJSON. The encoded form stores latitude
 * first; the swap happens only inside the encoder and decoder.
 */
struct Coordinate {
    double lng = 0.0; ///< Longitude, index 0
    double lat = 0.0; ///< Latitude, index 1

    /**
     * @brief Positional access: 0 is longitude, 1 is latitude.
     *
     * @param index 0 or 1; any other index is a precondition violation and
     *        its result is unspecified
     */
    double operator[](std::size_t index) const noexcept {
        return (index == 0) ? lng : lat;
    }

    static constexpr std::size_t size() noexcept {
        return 2;
    }

    bool operator==(const Coordinate&) const = default;
};

} // namespace polyline

#endif // POLYLINE_COORDINATE_HPP
