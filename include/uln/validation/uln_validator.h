/**
 * @file uln_validator.h
 * @brief ULN format and checksum validation
 *
 * Stateless validation of Unique Learner Numbers. A ULN is a 10-digit
 * numeric string, padded with leading zeroes, whose last digit is a
 * weighted mod-11 check digit over the first nine.
 *
 * Absent input is modelled as an empty std::optional and always raises
 * NullInputException.
 *
 * @see https://assets.publishing.service.gov.uk/media/5cb0e65ce5274a76c9b3299a/WSLP02_ULN_Validation_v3.pdf
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "uln/domain/uln.h"

namespace uln {
namespace validation {

/// Total number of characters in a ULN
constexpr size_t ULN_LENGTH = 10;

/// Number of leading digits covered by the check digit
constexpr size_t ULN_PAYLOAD_LENGTH = 9;

/// Checksum modulus
constexpr int ULN_MODULUS = 11;

/**
 * @brief Check whether a candidate has the ULN shape (exactly 10 ASCII digits)
 *
 * Non-throwing structural check; does not look at the check digit.
 */
bool hasUlnFormat(const std::string& candidate) noexcept;

/**
 * @brief Compute the weighted sum of the 9-digit payload
 *
 * Weights are 10, 9, ..., 2 applied left to right.
 *
 * @param payload Exactly 9 ASCII digits
 * @throws exception::InvalidFormatException if payload is not 9 digits
 */
int calculateWeightedSum(const std::string& payload);

/**
 * @brief Compute the expected check digit for a 9-digit payload
 * @return Check digit 0-9, or std::nullopt when the remainder is 0
 *         (no check digit can make such a ULN valid)
 * @throws exception::InvalidFormatException if payload is not 9 digits
 */
std::optional<int> calculateCheckDigit(const std::string& payload);

/**
 * @brief Validate format and checksum of a candidate ULN
 *
 * @param candidate ULN string
 * @return true if the check digit matches; false for a well-formed string
 *         that fails the checksum
 * @throws exception::NullInputException if candidate is absent
 * @throws exception::InvalidFormatException if candidate is not 10 digits
 */
bool isValidUln(const std::optional<std::string>& candidate);

/**
 * @brief Require a valid ULN string
 *
 * @param candidate ULN string
 * @return The candidate unchanged
 * @throws exception::NullInputException if candidate is absent
 * @throws exception::InvalidValueException if candidate is malformed or
 *         fails the checksum
 */
std::string requireValidUln(const std::optional<std::string>& candidate);

/**
 * @brief Require a present Uln
 *
 * A Uln is valid by construction, so this only enforces presence.
 *
 * @throws exception::NullInputException if uln is absent
 */
domain::Uln requireValidUln(const std::optional<domain::Uln>& uln);

} // namespace validation
} // namespace uln
