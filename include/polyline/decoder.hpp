/**
 * @file decoder.hpp
 * @brief Encoded polyline decoding.
 *
 * Value-level decoding (chunk assembly, zigzag) is inline here; the
 * point-level decode() lives in decoder.cpp.
 */

#ifndef POLYLINE_DECODER_HPP
#define POLYLINE_DECODER_HPP

#include <string_view>
#include <vector>

#include "charreader.hpp"
#include "config.hpp"
#include "coordinate.hpp"
#include "error.hpp"

namespace polyline {

/**
 * @brief Zigzag decoding.
 *
 * Maps 0, 1, 2, 3, 4, ... back to 0, -1, 1, -2, 2, ...
 * - even raw → raw / 2
 * - odd raw  → ~(raw / 2)
 */
[[nodiscard]] constexpr std::int32_t zigzag_decode(std::uint32_t raw) noexcept {
    auto half = static_cast<std::int32_t>(raw >> 1);
    return (raw & 1U) ? ~half : half;
}

/**
 * @brief Decode one signed value.
 *
 * Reads chunks least-significant group first while the continuation bit
 * is set, then un-zigzags the assembled value.
 *
 * @param reader Char reader positioned at the first chunk of a value
 * @param[out] value Decoded delta, untouched on error
 * @return Error::Ok on success, Error::Truncated if the input ends with the
 *         continuation bit set, Error::InvalidData for a character outside
 *         the alphabet, Error::Overflow if the value exceeds 32 bits
 */
inline Error value_decode(CharReader& reader, std::int32_t& value) noexcept {
    std::uint32_t result = 0;
    std::uint32_t shift = 0;

    for (std::size_t i = 0; i < MAX_CHUNKS; ++i) {
        int chunk = reader.read_chunk();
        if (chunk == -1) [[unlikely]] {
            return Error::Truncated;
        }
        if (chunk < 0) [[unlikely]] {
            return Error::InvalidData;
        }

        auto bits = static_cast<std::uint32_t>(chunk) & CHUNK_MASK;

        // Seventh chunk only has room for the two top bits
        if (shift == 30 && bits > 0x3U) [[unlikely]] {
            return Error::Overflow;
        }
        result |= bits << shift;

        if ((static_cast<std::uint32_t>(chunk) & CONTINUATION_BIT) == 0) {
            value = zigzag_decode(result);
            return Error::Ok;
        }
        shift += CHUNK_BITS;
    }

    return Error::Overflow;
}

/**
 * @brief Decode an encoded polyline into coordinates.
 *
 * Points come out in traversal order as (longitude, latitude) degrees.
 * An empty string yields no points. When decoding fails, @p points keeps
 * every complete point read before the failure; the incomplete trailing
 * point is dropped.
 *
 * @param encoded Encoded polyline
 * @param[out] points Decoded points (cleared first)
 * @param precision Decimal digits of the encoding (5 for 1e5)
 * @return Error::Ok on success, Error::InvalidArg for a bad precision,
 *         otherwise the first error reported by value_decode()
 */
Error decode(std::string_view encoded, std::vector<Coordinate>& points,
             int precision = DEFAULT_PRECISION);

/**
 * @brief Count the points an encoded polyline holds without decoding them.
 *
 * A point is two values; a value ends at each character without the
 * continuation bit.
 *
 * @param encoded Encoded polyline
 * @return Number of complete points
 */
std::size_t count_points(std::string_view encoded) noexcept;

} // namespace polyline

#endif // POLYLINE_DECODER_HPP
