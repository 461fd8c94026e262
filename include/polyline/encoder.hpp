/**
 * @file encoder.hpp
 * @brief Encoded polyline encoding.
 *
 * Value-level encoding (zigzag, chunk emission) is inline here; the
 * point-level encode() lives in encoder.cpp.
 */

#ifndef POLYLINE_ENCODER_HPP
#define POLYLINE_ENCODER_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "coordinate.hpp"
#include "error.hpp"

namespace polyline {

/**
 * @brief Zigzag encoding.
 *
 * Maps 0, -1, 1, -2, 2, ... to 0, 1, 2, 3, 4, ... so small magnitudes of
 * either sign stay small.
 * - v >= 0 → v << 1
 * - v < 0  → ~(v << 1)
 */
[[nodiscard]] constexpr std::uint32_t zigzag_encode(std::int32_t value) noexcept {
    auto shifted = static_cast<std::uint32_t>(value) << 1;
    return (value < 0) ? ~shifted : shifted;
}

/**
 * @brief Encode one signed value.
 *
 * Emits 5-bit chunks lowest first, with the continuation bit on every chunk
 * but the last, each offset by '?'.
 *
 * @param output String to append the encoded value to
 * @param value Delta to encode
 */
inline void value_encode(std::string& output, std::int32_t value) {
    std::uint32_t v = zigzag_encode(value);

    while (v >= CONTINUATION_BIT) {
        output.push_back(static_cast<char>((CONTINUATION_BIT | (v & CHUNK_MASK)) + CHAR_OFFSET));
        v >>= CHUNK_BITS;
    }
    output.push_back(static_cast<char>(v + CHAR_OFFSET));
}

/**
 * @brief Encode coordinates as an encoded polyline.
 *
 * Each coordinate is rounded to the precision grid first and the delta
 * between rounded values is encoded, latitude before longitude.
 *
 * @param points Points as (longitude, latitude) degrees
 * @param[out] encoded Encoded polyline, unchanged on error
 * @param precision Decimal digits to keep (5 for 1e5)
 * @return Error::Ok on success, Error::InvalidArg for a bad precision, a
 *         non-finite coordinate, or a coordinate or delta outside 32 bits
 */
Error encode(const std::vector<Coordinate>& points, std::string& encoded,
             int precision = DEFAULT_PRECISION);

} // namespace polyline

#endif // POLYLINE_ENCODER_HPP
