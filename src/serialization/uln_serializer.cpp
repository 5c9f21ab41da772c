/**
 * @file uln_serializer.cpp
 * @brief Binary and JSON serialization of Uln values
 */

#include "uln/serialization/uln_serializer.h"
#include "uln/exception/domain_exception.h"

#include <algorithm>
#include <memory>
#include <spdlog/spdlog.h>

namespace uln {
namespace serialization {

namespace {

constexpr uint8_t MAGIC[] = {'U', 'L', 'N'};
constexpr size_t MAGIC_SIZE = sizeof(MAGIC);
constexpr size_t HEADER_SIZE = MAGIC_SIZE + 1;

} // anonymous namespace

std::vector<uint8_t> toBytes(const domain::Uln& uln) {
    std::vector<uint8_t> bytes;
    bytes.reserve(RECORD_SIZE);
    bytes.insert(bytes.end(), MAGIC, MAGIC + MAGIC_SIZE);
    bytes.push_back(FORMAT_VERSION);

    const std::string& value = uln.getValue();
    bytes.insert(bytes.end(), value.begin(), value.end());
    return bytes;
}

domain::Uln fromBytes(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != RECORD_SIZE) {
        throw exception::InvalidFormatException(
            "ULN record must be " + std::to_string(RECORD_SIZE) +
            " bytes, got " + std::to_string(bytes.size()));
    }

    if (!std::equal(MAGIC, MAGIC + MAGIC_SIZE, bytes.begin())) {
        throw exception::InvalidFormatException("ULN record has bad magic");
    }

    if (bytes[MAGIC_SIZE] != FORMAT_VERSION) {
        throw exception::InvalidFormatException(
            "Unsupported ULN record version: " + std::to_string(bytes[MAGIC_SIZE]));
    }

    std::string digits(bytes.begin() + HEADER_SIZE, bytes.end());
    return domain::Uln::fromString(digits);
}

Json::Value toJson(const domain::Uln& uln) {
    Json::Value json;
    json[JSON_FIELD] = uln.getValue();
    return json;
}

domain::Uln fromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw exception::InvalidFormatException("ULN JSON must be an object");
    }

    const Json::Value& field = json[JSON_FIELD];
    if (field.isNull()) {
        throw exception::NullInputException(std::string("ULN JSON is missing '") + JSON_FIELD + "'");
    }
    if (!field.isString()) {
        throw exception::InvalidFormatException(std::string("ULN JSON '") + JSON_FIELD + "' must be a string");
    }

    return domain::Uln::fromString(field.asString());
}

std::string toJsonString(const domain::Uln& uln) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, toJson(uln));
}

domain::Uln fromJsonString(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value json;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &json, &errors)) {
        spdlog::debug("ULN JSON parse failed: {}", errors);
        throw exception::InvalidFormatException("Invalid ULN JSON: " + errors);
    }
    return fromJson(json);
}

} // namespace serialization
} // namespace uln
