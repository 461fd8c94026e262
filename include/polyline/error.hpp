/**
 * @file error.hpp
 * @brief Encoded polyline error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions).
 */

#ifndef POLYLINE_ERROR_HPP
#define POLYLINE_ERROR_HPP

#include "config.hpp"

#if !POLYLINE_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace polyline {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,          ///< Success
    InvalidArg = -1, ///< Invalid argument (precision, non-finite coordinate)
    Overflow = -2,   ///< Value does not fit 32 bits
    Truncated = -3,  ///< Input ended inside a value or a point
    InvalidData = -4 ///< Byte outside the '?'..'~' alphabet
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Overflow:
        return "Value overflow";
    case Error::Truncated:
        return "Truncated polyline";
    case Error::InvalidData:
        return "Invalid polyline character";
    default:
        return "Unknown error";
    }
}

#if !POLYLINE_NO_EXCEPTIONS

/**
 * @brief Base exception for polyline errors.
 */
class PolylineException : public std::runtime_error {
public:
    explicit PolylineException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public PolylineException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : PolylineException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for values wider than 32 bits.
 */
class OverflowException : public PolylineException {
public:
    explicit OverflowException(const std::string& message)
        : PolylineException(message, Error::Overflow) {}
};

/**
 * @brief Exception for input that ends mid-value or mid-point.
 */
class TruncatedException : public PolylineException {
public:
    explicit TruncatedException(const std::string& message)
        : PolylineException(message, Error::Truncated) {}
};

/**
 * @brief Exception for bytes outside the encoding alphabet.
 */
class InvalidDataException : public PolylineException {
public:
    explicit InvalidDataException(const std::string& message)
        : PolylineException(message, Error::InvalidData) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * Does nothing for Error::Ok.
 *
 * @param error Error code
 * @param context Prefix for the exception message
 */
inline void throw_if_error(Error error, const std::string& context) {
    const std::string message = context + ": " + error_string(error);
    switch (error) {
    case Error::Ok:
        return;
    case Error::Overflow:
        throw OverflowException(message);
    case Error::Truncated:
        throw TruncatedException(message);
    case Error::InvalidData:
        throw InvalidDataException(message);
    case Error::InvalidArg:
    default:
        throw InvalidArgumentException(message);
    }
}

#endif // !POLYLINE_NO_EXCEPTIONS

} // namespace polyline

#endif // POLYLINE_ERROR_HPP
