/**
 * @file charreader.hpp
 * @brief Sequential chunk reading from an encoded polyline.
 *
 * The char reader provides stateful access to the characters of an
 * encoded polyline, one 6-bit chunk per character.
 */

#ifndef POLYLINE_CHARREADER_HPP
#define POLYLINE_CHARREADER_HPP

#include <string_view>

#include "config.hpp"

namespace polyline {

/**
 * @brief Sequential reader for encoded polyline characters.
 *
 * Tracks position within the encoded string. Used during decoding to
 * pull one chunk at a time.
 */
class CharReader {
public:
    /**
     * @brief Construct a char reader.
     *
     * @param data Encoded polyline; must outlive the reader
     */
    explicit CharReader(std::string_view data) noexcept : data_(data), pos_(0) {}

    /**
     * @brief Read a single character.
     *
     * @return Byte value (0-255), or -1 if no characters remaining
     */
    inline int read_char() noexcept {
        if (pos_ >= data_.size()) [[unlikely]] {
            return -1;
        }
        return static_cast<unsigned char>(data_[pos_++]);
    }

    /**
     * @brief Read one 6-bit chunk.
     *
     * Removes the '?' offset from the next character.
     *
     * @return Chunk value (0-63), -1 at end of input, -2 if the character
     *         lies outside '?'..'~' (the reader still advances past it)
     */
    inline int read_chunk() noexcept {
        int c = read_char();
        if (c < 0) [[unlikely]] {
            return -1;
        }
        if (c < MIN_CHAR || c > MAX_CHAR) [[unlikely]] {
            return -2;
        }
        return c - CHAR_OFFSET;
    }

    /**
     * @brief Get current position.
     *
     * @return Number of characters already read
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining characters.
     *
     * @return Number of characters remaining to read
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (pos_ < data_.size()) ? (data_.size() - pos_) : 0;
    }

    /**
     * @brief Check whether all characters have been read.
     */
    [[nodiscard]] bool at_end() const noexcept {
        return pos_ >= data_.size();
    }

private:
    std::string_view data_;
    std::size_t pos_;
};

} // namespace polyline

#endif // POLYLINE_CHARREADER_HPP
