/**
 * @file validator.cpp
 * @brief Character-class check for encoded polylines.
 */

#include <polyline/config.hpp>
#include <polyline/validator.hpp>

namespace polyline {

bool valid_characters(std::string_view encoded) noexcept {
    if (encoded.empty()) {
        return false;
    }
    for (char ch : encoded) {
        int c = static_cast<unsigned char>(ch);
        if (c < MIN_CHAR || c > MAX_CHAR) {
            return false;
        }
    }
    return true;
}

bool is_valid_encoding(const Input& input) noexcept {
    const auto* text = std::get_if<std::string>(&input);
    return text != nullptr && valid_characters(*text);
}

} // namespace polyline
