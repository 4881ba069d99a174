/**
 * @file RecordValidatorTest.cpp
 * @brief Unit tests for section validation
 */

#include "parser/RecordValidator.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <type_traits>

using parser::RecordValidator;
using parser::RejectReason;

namespace {

auto RejectCode(RejectReason reason) -> int {
    return static_cast<int>(reason);
}

}  // namespace

TEST(RecordValidatorTest, DeviceRecord_OnlyConstructibleThroughValidate) {
    static_assert(!std::is_default_constructible_v<DeviceRecord>);

    auto record = RecordValidator::validate(
        MakeRawRecord({{RecordField::IDENTIFIER, "disk1"}, {RecordField::TEMPERATURE, "0"}}));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->identifier(), "disk1");
    EXPECT_EQ(record->temperature(), 0);
}

TEST(RecordValidatorTest, Validate_CompleteRecord_CopiesAllFields) {
    auto raw = MakeRawRecord({{RecordField::IDENTIFIER, "disk1"},
                              {RecordField::SECONDARY_ID, "WD-1"},
                              {RecordField::TEMPERATURE, "38"},
                              {RecordField::TYPE, "Data"},
                              {RecordField::DEVICE_PATH, "sdc"},
                              {RecordField::TRANSPORT, "ata"},
                              {RecordField::ROTATIONAL, "1"}});

    auto record = RecordValidator::validate(raw);

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->identifier(), "disk1");
    EXPECT_EQ(record->secondary_id(), "WD-1");
    EXPECT_EQ(record->temperature(), 38);
    EXPECT_EQ(record->type(), "Data");
    EXPECT_EQ(record->device_path(), "sdc");
    EXPECT_EQ(record->transport(), "ata");
    EXPECT_EQ(record->rotational(), RotationalState::ROTATING);
}

TEST(RecordValidatorTest, Validate_MinimalRecord_OptionalFieldsEmpty) {
    auto record = RecordValidator::validate(
        MakeRawRecord({{RecordField::IDENTIFIER, "disk1"}, {RecordField::TEMPERATURE, "0"}}));

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->temperature(), 0);
    EXPECT_TRUE(record->secondary_id().empty());
    EXPECT_TRUE(record->type().empty());
    EXPECT_EQ(record->rotational(), RotationalState::UNKNOWN);
}

TEST(RecordValidatorTest, Validate_MissingIdentifier_Rejected) {
    auto record = RecordValidator::validate(MakeRawRecord({{RecordField::TEMPERATURE, "38"}}));

    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, RejectCode(RejectReason::MISSING_IDENTIFIER));
}

TEST(RecordValidatorTest, Validate_EmptyIdentifier_Rejected) {
    auto record = RecordValidator::validate(
        MakeRawRecord({{RecordField::IDENTIFIER, ""}, {RecordField::TEMPERATURE, "38"}}));

    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, RejectCode(RejectReason::MISSING_IDENTIFIER));
}

TEST(RecordValidatorTest, Validate_MissingTemperature_Rejected) {
    auto record = RecordValidator::validate(MakeRawRecord({{RecordField::IDENTIFIER, "disk1"}}));

    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, RejectCode(RejectReason::MISSING_TEMPERATURE));
}

TEST(RecordValidatorTest, Validate_IdentifierCheckedBeforeTemperature) {
    auto record = RecordValidator::validate(RawRecord{});

    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, RejectCode(RejectReason::MISSING_IDENTIFIER));
}

TEST(RecordValidatorTest, Validate_StarTemperature_RejectedAsNonNumeric) {
    auto record = RecordValidator::validate(
        MakeRawRecord({{RecordField::IDENTIFIER, "flash"}, {RecordField::TEMPERATURE, "*"}}));

    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, RejectCode(RejectReason::NON_NUMERIC_TEMPERATURE));
    EXPECT_NE(record.error().message.find("flash"), std::string::npos);
}

TEST(RecordValidatorTest, Validate_NonDigitTemperatures_Rejected) {
    for (const auto* temp : {"-5", "38.5", "38C", " 38", "+38", "0x26"}) {
        auto record = RecordValidator::validate(
            MakeRawRecord({{RecordField::IDENTIFIER, "disk1"}, {RecordField::TEMPERATURE, temp}}));

        ASSERT_FALSE(record.has_value()) << temp;
        EXPECT_EQ(record.error().code, RejectCode(RejectReason::NON_NUMERIC_TEMPERATURE)) << temp;
    }
}

TEST(RecordValidatorTest, Validate_HugeTemperature_RejectedAsOutOfRange) {
    auto record = RecordValidator::validate(MakeRawRecord(
        {{RecordField::IDENTIFIER, "disk1"}, {RecordField::TEMPERATURE, "99999999999"}}));

    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, RejectCode(RejectReason::TEMPERATURE_OUT_OF_RANGE));
}

TEST(RecordValidatorTest, Validate_LeadingZeros_Accepted) {
    auto record = RecordValidator::validate(
        MakeRawRecord({{RecordField::IDENTIFIER, "disk1"}, {RecordField::TEMPERATURE, "038"}}));

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->temperature(), 38);
}

TEST(RecordValidatorTest, ParseRotational_MapsOnlyZeroAndOne) {
    EXPECT_EQ(RecordValidator::parse_rotational("1"), RotationalState::ROTATING);
    EXPECT_EQ(RecordValidator::parse_rotational("0"), RotationalState::NON_ROTATING);
    EXPECT_EQ(RecordValidator::parse_rotational(""), RotationalState::UNKNOWN);
    EXPECT_EQ(RecordValidator::parse_rotational("yes"), RotationalState::UNKNOWN);
    EXPECT_EQ(RecordValidator::parse_rotational("01"), RotationalState::UNKNOWN);
}

TEST(RecordValidatorTest, IsAllDigits) {
    EXPECT_TRUE(RecordValidator::is_all_digits("0"));
    EXPECT_TRUE(RecordValidator::is_all_digits("1234"));
    EXPECT_FALSE(RecordValidator::is_all_digits(""));
    EXPECT_FALSE(RecordValidator::is_all_digits("*"));
}

TEST(RecordValidatorTest, RejectReasonToString_NonEmpty) {
    for (auto reason : {RejectReason::MISSING_IDENTIFIER, RejectReason::MISSING_TEMPERATURE,
                        RejectReason::NON_NUMERIC_TEMPERATURE,
                        RejectReason::TEMPERATURE_OUT_OF_RANGE}) {
        EXPECT_FALSE(parser::reject_reason_to_string(reason).empty());
    }
}
