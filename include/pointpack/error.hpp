/**
 * @file error.hpp
 * @brief pointpack error handling.
 *
 * Provides both exception-based and error-code-based error handling.
 * Every fallible operation returns an Error; the by-value convenience
 * overloads throw the exception types below instead.
 */

#ifndef POINTPACK_ERROR_HPP
#define POINTPACK_ERROR_HPP

#include "config.hpp"

#include <string>

#if !POINTPACK_NO_EXCEPTIONS
#include <stdexcept>
#endif

namespace pointpack {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,              ///< Success
    InvalidArg = -1,     ///< Invalid argument (length or type mismatch)
    InvalidMask = -2,    ///< Zero mask, or mask outside the container
    RangeViolation = -3, ///< Sub-field value exceeds what its mask can hold
    SchemaMismatch = -4  ///< Field expected by the format missing from a batch
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
    case Error::InvalidMask:
        return "Invalid mask";
    case Error::RangeViolation:
        return "Value out of range for mask";
    case Error::SchemaMismatch:
        return "Schema mismatch";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Offending value of a failed pack.
 *
 * value is the maximum of the sub-field column, max_allowed is mask >> shift.
 */
struct RangeError {
    std::uint64_t value = 0;
    std::uint64_t max_allowed = 0;
};

/**
 * @brief Context attached to an error by the batch-level operations.
 *
 * field names the composed or plain field being processed, sub_field the
 * sub-field (empty when not applicable). value/max_allowed are only
 * meaningful for Error::RangeViolation, expected for Error::SchemaMismatch
 * on a column of the wrong type or length.
 */
struct ErrorDetail {
    Error code = Error::Ok;
    std::string field;
    std::string sub_field;
    std::uint64_t value = 0;
    std::uint64_t max_allowed = 0;
    std::string expected;

    /**
     * @brief Build a one-line description of the error.
     */
    [[nodiscard]] std::string message() const {
        if (code == Error::RangeViolation) {
            std::string msg = "value (" + std::to_string(value) +
                              ") is greater than allowed (max: " + std::to_string(max_allowed) +
                              ")";
            if (!sub_field.empty()) {
                msg = "error repacking " + sub_field + " into " + field + ": " + msg;
            }
            return msg;
        }

        std::string msg = error_string(code);
        if (!field.empty()) {
            msg += ": ";
            msg += field;
            if (!sub_field.empty()) {
                msg += ".";
                msg += sub_field;
            }
        }
        if (!expected.empty()) {
            msg += " (expected ";
            msg += expected;
            msg += ")";
        }
        return msg;
    }
};

namespace detail {

inline void set_detail(ErrorDetail* detail, Error code, const std::string& field,
                       const std::string& sub_field = std::string()) {
    if (detail == nullptr) {
        return;
    }
    detail->code = code;
    detail->field = field;
    detail->sub_field = sub_field;
    detail->value = 0;
    detail->max_allowed = 0;
    detail->expected.clear();
}

} // namespace detail

#if !POINTPACK_NO_EXCEPTIONS

/**
 * @brief Base exception for pointpack errors.
 */
class PointPackException : public std::runtime_error {
public:
    explicit PointPackException(const std::string& message, Error code = Error::InvalidArg)
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
class InvalidArgumentException : public PointPackException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : PointPackException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for zero or out-of-container masks.
 */
class InvalidMaskException : public PointPackException {
public:
    explicit InvalidMaskException(const std::string& message)
        : PointPackException(message, Error::InvalidMask) {}
};

/**
 * @brief Exception for sub-field values that do not fit their mask.
 */
class RangeViolationException : public PointPackException {
public:
    explicit RangeViolationException(const ErrorDetail& detail)
        : PointPackException(detail.message(), Error::RangeViolation),
          value_(detail.value),
          max_allowed_(detail.max_allowed),
          field_(detail.field),
          sub_field_(detail.sub_field) {}

    std::uint64_t value() const noexcept { return value_; }
    std::uint64_t max_allowed() const noexcept { return max_allowed_; }
    const std::string& field() const noexcept { return field_; }
    const std::string& sub_field() const noexcept { return sub_field_; }

private:
    std::uint64_t value_;
    std::uint64_t max_allowed_;
    std::string field_;
    std::string sub_field_;
};

/**
 * @brief Exception for batches that do not match the point format.
 */
class SchemaMismatchException : public PointPackException {
public:
    explicit SchemaMismatchException(const std::string& message)
        : PointPackException(message, Error::SchemaMismatch) {}
};

/**
 * @brief Throw the exception matching an error detail.
 * @param detail Filled error detail (code must not be Error::Ok)
 */
[[noreturn]] inline void throw_error(const ErrorDetail& detail) {
    switch (detail.code) {
    case Error::InvalidMask:
        throw InvalidMaskException(detail.message());
    case Error::RangeViolation:
        throw RangeViolationException(detail);
    case Error::SchemaMismatch:
        throw SchemaMismatchException(detail.message());
    case Error::InvalidArg:
        throw InvalidArgumentException(detail.message());
    default:
        throw PointPackException(detail.message(), detail.code);
    }
}

#endif // !POINTPACK_NO_EXCEPTIONS

} // namespace pointpack

#endif // POINTPACK_ERROR_HPP
