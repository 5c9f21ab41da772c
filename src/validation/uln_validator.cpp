/**
 * @file uln_validator.cpp
 * @brief ULN format and checksum validation implementation
 */

#include "uln/validation/uln_validator.h"
#include "uln/exception/domain_exception.h"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace uln {
namespace validation {

namespace {

bool isAsciiDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

bool isDigitString(const std::string& str, size_t length) noexcept {
    return str.length() == length && std::all_of(str.begin(), str.end(), isAsciiDigit);
}

} // anonymous namespace

bool hasUlnFormat(const std::string& candidate) noexcept {
    return isDigitString(candidate, ULN_LENGTH);
}

int calculateWeightedSum(const std::string& payload) {
    if (!isDigitString(payload, ULN_PAYLOAD_LENGTH)) {
        throw exception::InvalidFormatException("ULN payload must be exactly 9 digits");
    }

    int sum = 0;
    for (size_t i = 0; i < payload.length(); ++i) {
        sum += static_cast<int>(ULN_LENGTH - i) * (payload[i] - '0');
    }
    return sum;
}

std::optional<int> calculateCheckDigit(const std::string& payload) {
    int remainder = calculateWeightedSum(payload) % ULN_MODULUS;

    // No check digit satisfies a zero remainder
    if (remainder == 0) {
        return std::nullopt;
    }
    return 10 - remainder;
}

bool isValidUln(const std::optional<std::string>& candidate) {
    if (!candidate) {
        throw exception::NullInputException("ULN value cannot be null");
    }

    const std::string& value = *candidate;
    if (!hasUlnFormat(value)) {
        spdlog::debug("ULN format check failed: length={}", value.length());
        throw exception::InvalidFormatException("Invalid ULN format");
    }

    auto expected = calculateCheckDigit(value.substr(0, ULN_PAYLOAD_LENGTH));
    if (!expected) {
        spdlog::debug("ULN {} rejected: checksum remainder is 0", value);
        return false;
    }

    int actual = value[ULN_PAYLOAD_LENGTH] - '0';
    if (*expected != actual) {
        spdlog::debug("ULN {} rejected: expected check digit {}, found {}",
                      value, *expected, actual);
        return false;
    }
    return true;
}

std::string requireValidUln(const std::optional<std::string>& candidate) {
    if (!candidate) {
        throw exception::NullInputException("ULN value cannot be null");
    }

    bool valid = false;
    try {
        valid = isValidUln(candidate);
    } catch (const exception::InvalidFormatException& e) {
        throw exception::InvalidValueException(std::string("Invalid ULN value: ") + e.what());
    }

    if (!valid) {
        throw exception::InvalidValueException("Invalid ULN value");
    }
    return *candidate;
}

domain::Uln requireValidUln(const std::optional<domain::Uln>& uln) {
    if (!uln) {
        throw exception::NullInputException("ULN object cannot be null");
    }
    return *uln;
}

} // namespace validation
} // namespace uln
