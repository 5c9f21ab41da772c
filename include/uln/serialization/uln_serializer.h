/**
 * @file uln_serializer.h
 * @brief Binary and JSON serialization of Uln values
 *
 * Binary record layout (14 bytes):
 *   [0..2]  magic "ULN"
 *   [3]     format version (0x01)
 *   [4..13] ten ASCII digits
 *
 * Deserialization always re-enters Uln::fromString(), so a record can never
 * produce an invalid Uln.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <json/json.h>

#include "uln/domain/uln.h"

namespace uln {
namespace serialization {

constexpr uint8_t FORMAT_VERSION = 0x01;
constexpr size_t RECORD_SIZE = 14;

/// JSON member holding the digit string
constexpr const char* JSON_FIELD = "uln";

/**
 * @brief Encode a Uln as a binary record
 */
std::vector<uint8_t> toBytes(const domain::Uln& uln);

/**
 * @brief Decode a binary record
 * @throws exception::InvalidFormatException on wrong size, magic or version
 * @throws exception::InvalidValueException if the digits fail validation
 */
domain::Uln fromBytes(const std::vector<uint8_t>& bytes);

/**
 * @brief Convert to JSON: {"uln": "0000000042"}
 */
Json::Value toJson(const domain::Uln& uln);

/**
 * @brief Parse from JSON object
 * @throws exception::NullInputException if the member is missing or null
 * @throws exception::InvalidFormatException if json is not an object or the
 *         member is not a string
 * @throws exception::InvalidValueException if the digits fail validation
 */
domain::Uln fromJson(const Json::Value& json);

/**
 * @brief Compact JSON text form
 */
std::string toJsonString(const domain::Uln& uln);

/**
 * @brief Parse compact or pretty JSON text
 * @throws exception::InvalidFormatException if text is not valid JSON
 */
domain::Uln fromJsonString(const std::string& text);

} // namespace serialization
} // namespace uln
