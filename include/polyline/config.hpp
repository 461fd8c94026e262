/**
 * @file config.hpp
 * @brief Encoded polyline compile-time configuration.
 *
 * Format constants of the encoded polyline algorithm: every signed value is
 * zigzag-mapped, split into 5-bit chunks (lowest first), flagged with a
 * continuation bit and shifted into the printable range starting at '?'.
 *
 * @see https://developers.google.com/maps/documentation/utilities/polylinealgorithm
 */

#ifndef POLYLINE_CONFIG_HPP
#define POLYLINE_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace polyline {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup format Format Constants
 * @{
 */

/// Offset added to every 6-bit chunk ('?')
inline constexpr int CHAR_OFFSET = 63;

/// Lowest and highest byte of the encoding alphabet ('?' and '~')
inline constexpr int MIN_CHAR = 0x3F;
inline constexpr int MAX_CHAR = 0x7E;

/// Payload bits per chunk
inline constexpr std::uint32_t CHUNK_BITS = 5U;
inline constexpr std::uint32_t CHUNK_MASK = 0x1FU;

/// Set on every chunk except the last one of a value
inline constexpr std::uint32_t CONTINUATION_BIT = 0x20U;

/// Chunks needed for a 32-bit zigzag value (7 * 5 >= 32)
inline constexpr std::size_t MAX_CHUNKS = 7U;

/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Decimal digits kept per coordinate (format default: 5, i.e. 1e5)
#ifndef POLYLINE_DEFAULT_PRECISION
#define POLYLINE_DEFAULT_PRECISION 5
#endif

inline constexpr int DEFAULT_PRECISION = POLYLINE_DEFAULT_PRECISION;
inline constexpr int MAX_PRECISION = 7;

static_assert(DEFAULT_PRECISION >= 0 && DEFAULT_PRECISION <= MAX_PRECISION,
              "POLYLINE_DEFAULT_PRECISION must be in 0..7");

namespace detail {
inline constexpr double PRECISION_FACTORS[MAX_PRECISION + 1] = {
    1e0, 1e1, 1e2, 1e3, 1e4, 1e5, 1e6, 1e7
};
} // namespace detail

/**
 * @brief Check a precision (number of decimal digits).
 */
[[nodiscard]] constexpr bool is_valid_precision(int precision) noexcept {
    return precision >= 0 && precision <= MAX_PRECISION;
}

/**
 * @brief Scale factor for a precision (5 -> 1e5).
 *
 * @param precision Decimal digits, must satisfy is_valid_precision()
 */
[[nodiscard]] constexpr double precision_factor(int precision) noexcept {
    return detail::PRECISION_FACTORS[precision];
}

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define POLYLINE_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * @{
 */
#ifndef POLYLINE_NO_EXCEPTIONS
#define POLYLINE_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace polyline

#endif // POLYLINE_CONFIG_HPP
