/**
 * @file domain_exception.h
 * @brief Domain exception hierarchy for ULN validation
 */

#pragma once

#include <stdexcept>
#include <string>

#include "uln/exception/error_codes.h"

namespace uln {
namespace exception {

/**
 * @brief Exception for domain layer errors
 *
 * Used when a ULN invariant is violated. Callers may catch this base class
 * and switch on getCode(), or catch one of the concrete kinds below.
 *
 * getCode() is the errorCodeToString() name of an ErrorCode; pass it to
 * errorCodeFromString() to recover the enum.
 */
class DomainException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

public:
    /**
     * @brief Construct a new Domain Exception
     * @param code Error code (e.g., "INVALID_VALUE")
     * @param message Human-readable error message
     */
    DomainException(std::string code, std::string message)
        : std::runtime_error(message),
          code_(std::move(code)),
          message_(std::move(message)) {}

    /**
     * @brief Get the error code
     */
    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    /**
     * @brief Get the error message
     */
    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }
};

/**
 * @brief An absent value was supplied where a string or Uln was required
 */
class NullInputException : public DomainException {
public:
    explicit NullInputException(const std::string& message)
        : DomainException(errorCodeToString(ErrorCode::NULL_INPUT), message) {}
};

/**
 * @brief Candidate is not exactly 10 ASCII digit characters
 */
class InvalidFormatException : public DomainException {
public:
    explicit InvalidFormatException(const std::string& message)
        : DomainException(errorCodeToString(ErrorCode::INVALID_FORMAT), message) {}
};

/**
 * @brief Candidate failed checksum validation
 */
class InvalidValueException : public DomainException {
public:
    explicit InvalidValueException(const std::string& message)
        : DomainException(errorCodeToString(ErrorCode::INVALID_VALUE), message) {}
};

} // namespace exception
} // namespace uln
