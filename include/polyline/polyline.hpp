/**
 * @file polyline.hpp
 * @brief High-level encoded polyline API.
 *
 * Pulls in the whole library and adds throwing convenience wrappers for
 * callers that prefer exceptions over error codes.
 *
 * @see https://developers.google.com/maps/documentation/utilities/polylinealgorithm
 */

#ifndef POLYLINE_HPP
#define POLYLINE_HPP

#include <string>
#include <string_view>
#include <vector>

#include "charreader.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "coordinate.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "geometry.hpp"
#include "validator.hpp"

namespace polyline {

#if !POLYLINE_NO_EXCEPTIONS

/**
 * @brief Decode an encoded polyline, throwing on failure.
 *
 * @param encoded Encoded polyline
 * @param precision Decimal digits of the encoding
 * @return Decoded points
 * @throws TruncatedException, InvalidDataException, OverflowException,
 *         InvalidArgumentException
 */
inline std::vector<Coordinate> decode_or_throw(std::string_view encoded,
                                               int precision = DEFAULT_PRECISION) {
    std::vector<Coordinate> points;
    throw_if_error(decode(encoded, points, precision), "decode");
    return points;
}

/**
 * @brief Encode coordinates, throwing on failure.
 *
 * @param points Points as (longitude, latitude) degrees
 * @param precision Decimal digits to keep
 * @return Encoded polyline
 * @throws InvalidArgumentException
 */
inline std::string encode_or_throw(const std::vector<Coordinate>& points,
                                   int precision = DEFAULT_PRECISION) {
    std::string encoded;
    throw_if_error(encode(points, encoded, precision), "encode");
    return encoded;
}

#endif // !POLYLINE_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace polyline

#endif // POLYLINE_HPP
