/**
 * @file test_uln_serializer.cpp
 * @brief Unit tests for Uln binary and JSON serialization
 */

#include <gtest/gtest.h>
#include <uln/exception/domain_exception.h>
#include <uln/serialization/uln_serializer.h>

#include <cstdint>
#include <vector>

using namespace uln::serialization;
using uln::domain::Uln;
using uln::exception::InvalidFormatException;
using uln::exception::InvalidValueException;
using uln::exception::NullInputException;

class UlnSerializerTest : public ::testing::Test {
protected:
    Uln uln42 = Uln::fromString("0000000042");
};

// Binary form
TEST_F(UlnSerializerTest, ToBytes_Layout) {
    auto bytes = toBytes(uln42);
    ASSERT_EQ(bytes.size(), RECORD_SIZE);
    EXPECT_EQ(bytes[0], 'U');
    EXPECT_EQ(bytes[1], 'L');
    EXPECT_EQ(bytes[2], 'N');
    EXPECT_EQ(bytes[3], FORMAT_VERSION);
    EXPECT_EQ(std::string(bytes.begin() + 4, bytes.end()), "0000000042");
}

TEST_F(UlnSerializerTest, Bytes_RoundTrip) {
    EXPECT_EQ(fromBytes(toBytes(uln42)), uln42);
}

TEST_F(UlnSerializerTest, FromBytes_Empty) {
    EXPECT_THROW(fromBytes({}), InvalidFormatException);
}

TEST_F(UlnSerializerTest, FromBytes_Truncated) {
    auto bytes = toBytes(uln42);
    bytes.pop_back();
    EXPECT_THROW(fromBytes(bytes), InvalidFormatException);
}

TEST_F(UlnSerializerTest, FromBytes_BadMagic) {
    auto bytes = toBytes(uln42);
    bytes[0] = 'X';
    EXPECT_THROW(fromBytes(bytes), InvalidFormatException);
}

TEST_F(UlnSerializerTest, FromBytes_UnsupportedVersion) {
    auto bytes = toBytes(uln42);
    bytes[3] = 0x02;
    EXPECT_THROW(fromBytes(bytes), InvalidFormatException);
}

TEST_F(UlnSerializerTest, FromBytes_TamperedCheckDigit) {
    auto bytes = toBytes(uln42);
    bytes.back() = '3';
    EXPECT_THROW(fromBytes(bytes), InvalidValueException);
}

// JSON form
TEST_F(UlnSerializerTest, ToJson) {
    auto json = toJson(uln42);
    ASSERT_TRUE(json.isObject());
    EXPECT_EQ(json["uln"].asString(), "0000000042");
}

TEST_F(UlnSerializerTest, Json_RoundTrip) {
    EXPECT_EQ(fromJson(toJson(uln42)), uln42);
}

TEST_F(UlnSerializerTest, JsonString_Compact) {
    EXPECT_EQ(toJsonString(uln42), "{\"uln\":\"0000000042\"}");
}

TEST_F(UlnSerializerTest, JsonString_RoundTrip) {
    EXPECT_EQ(fromJsonString(toJsonString(uln42)), uln42);
}

TEST_F(UlnSerializerTest, FromJsonString_Pretty) {
    EXPECT_EQ(fromJsonString("{\n  \"uln\" : \"0000000042\"\n}"), uln42);
}

TEST_F(UlnSerializerTest, FromJson_MissingField) {
    Json::Value json(Json::objectValue);
    EXPECT_THROW(fromJson(json), NullInputException);
}

TEST_F(UlnSerializerTest, FromJson_NullField) {
    Json::Value json;
    json["uln"] = Json::Value();
    EXPECT_THROW(fromJson(json), NullInputException);
}

TEST_F(UlnSerializerTest, FromJson_NotObject) {
    EXPECT_THROW(fromJson(Json::Value("0000000042")), InvalidFormatException);
}

TEST_F(UlnSerializerTest, FromJson_NumericField) {
    Json::Value json;
    json["uln"] = 42;
    EXPECT_THROW(fromJson(json), InvalidFormatException);
}

TEST_F(UlnSerializerTest, FromJson_InvalidValue) {
    Json::Value json;
    json["uln"] = "9999999999";
    EXPECT_THROW(fromJson(json), InvalidValueException);
}

TEST_F(UlnSerializerTest, FromJsonString_Garbage) {
    EXPECT_THROW(fromJsonString("{\"uln\": "), InvalidFormatException);
}
