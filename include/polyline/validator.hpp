/**
 * @file validator.hpp
 * @brief Character-class check for encoded polylines.
 *
 * A cheap syntactic filter: it accepts a string when every character is in
 * the '?'..'~' alphabet. It never decodes, so an accepted string may still
 * be truncated.
 */

#ifndef POLYLINE_VALIDATOR_HPP
#define POLYLINE_VALIDATOR_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace polyline {

/**
 * @brief Placeholder for a structured (non-scalar) value.
 */
struct Object {};

/**
 * @brief A value of unknown kind handed to the validator.
 *
 * std::monostate stands for an absent value (null). Only the std::string
 * alternative can be a valid encoding.
 */
using Input = std::variant<std::monostate, std::string, std::int64_t, double, bool, Object>;

/**
 * @brief Check that every character lies in '?'..'~'.
 *
 * @param encoded Candidate string
 * @return true if non-empty and made only of alphabet characters
 */
[[nodiscard]] bool valid_characters(std::string_view encoded) noexcept;

/**
 * @brief Check whether a value looks like an encoded polyline.
 *
 * @param input Any value
 * @return true iff @p input holds a non-empty string of alphabet
 *         characters; false for every other alternative
 */
[[nodiscard]] bool is_valid_encoding(const Input& input) noexcept;

} // namespace polyline

#endif // POLYLINE_VALIDATOR_HPP
