/**
 * @file codec.hpp
 * @brief Polyline codec bound to one precision.
 */

#ifndef POLYLINE_CODEC_HPP
#define POLYLINE_CODEC_HPP

#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "coordinate.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "validator.hpp"

namespace polyline {

/**
 * @brief Encoded polyline codec.
 *
 * Stateless apart from its precision: every call keeps its accumulators
 * local, so one instance can be shared between threads.
 */
class Codec {
public:
    /**
     * @brief Construct a codec.
     *
     * @param precision Decimal digits (5 for the common 1e5 format, 6 for
     *        Valhalla/OSRM); an out-of-range value makes every encode and
     *        decode return Error::InvalidArg
     */
    explicit Codec(int precision = DEFAULT_PRECISION) noexcept : precision_(precision) {}

    /**
     * @brief Decode an encoded polyline.
     * @see polyline::decode()
     */
    Error decode(std::string_view encoded, std::vector<Coordinate>& points) const {
        return polyline::decode(encoded, points, precision_);
    }

    /**
     * @brief Encode coordinates.
     * @see polyline::encode()
     */
    Error encode(const std::vector<Coordinate>& points, std::string& encoded) const {
        return polyline::encode(points, encoded, precision_);
    }

    /**
     * @brief Character-class check, independent of precision.
     * @see polyline::is_valid_encoding()
     */
    static bool is_valid_encoding(const Input& input) noexcept {
        return polyline::is_valid_encoding(input);
    }

    [[nodiscard]] int precision() const noexcept {
        return precision_;
    }

private:
    int precision_;
};

} // namespace polyline

#endif // POLYLINE_CODEC_HPP
