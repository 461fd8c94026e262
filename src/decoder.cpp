/**
 * @file decoder.cpp
 * @brief Point-level polyline decoding.
 *
 * @see include/polyline/decoder.hpp for value-level decoding
 */

#include <polyline/decoder.hpp>

namespace polyline {

Error decode(std::string_view encoded, std::vector<Coordinate>& points, int precision) {
    points.clear();

    if (!is_valid_precision(precision)) {
        return Error::InvalidArg;
    }
    const double factor = precision_factor(precision);

    // Each value takes at least one character, each point two values
    points.reserve(encoded.size() / 2);

    CharReader reader(encoded);

    // Running totals on the precision grid; 64 bits so long lines of
    // 32-bit deltas cannot overflow
    std::int64_t lat = 0;
    std::int64_t lng = 0;

    while (!reader.at_end()) {
        std::int32_t delta_lat = 0;
        auto status = value_decode(reader, delta_lat);
        if (status != Error::Ok) {
            return status;
        }

        // A latitude at the very end has no longitude to pair with
        std::int32_t delta_lng = 0;
        status = value_decode(reader, delta_lng);
        if (status != Error::Ok) {
            return status;
        }

        lat += delta_lat;
        lng += delta_lng;

        points.push_back(Coordinate{static_cast<double>(lng) / factor,
                                    static_cast<double>(lat) / factor});
    }

    return Error::Ok;
}

std::size_t count_points(std::string_view encoded) noexcept {
    std::size_t values = 0;
    for (char ch : encoded) {
        int c = static_cast<unsigned char>(ch);
        if (c < MIN_CHAR || c > MAX_CHAR) {
            continue;
        }
        if ((static_cast<std::uint32_t>(c - CHAR_OFFSET) & CONTINUATION_BIT) == 0) {
            ++values;
        }
    }
    return values / 2;
}

} // namespace polyline
