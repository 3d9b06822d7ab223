#include <gtest/gtest.h>
#include "data/value.hpp"
#include "core/errors.hpp"

using namespace sqlgraph::data;
using sqlgraph::core::TypeConversionError;

TEST(SqlValueTest, DefaultIsNull) {
    SqlValue value;
    EXPECT_TRUE(is_null(value));
    EXPECT_EQ(to_string(value), "");
}

TEST(SqlValueTest, DbTypeFollowsRuntimeKind) {
    EXPECT_EQ(db_type_of(SqlValue(int64_t{1})), DbType::Int64);
    EXPECT_EQ(db_type_of(SqlValue(int32_t{1})), DbType::Int32);
    EXPECT_EQ(db_type_of(SqlValue(uint8_t{1})), DbType::Byte);
    EXPECT_EQ(db_type_of(SqlValue(std::string("a"))), DbType::String);
    EXPECT_EQ(db_type_of(SqlValue(1.5)), DbType::Double);
    EXPECT_EQ(db_type_of(SqlValue(true)), DbType::Boolean);
    EXPECT_EQ(db_type_of(SqlValue(Decimal{"1.20"})), DbType::Decimal);
    EXPECT_EQ(db_type_of(SqlValue{}), DbType::String);
}

TEST(SqlValueTest, ToStringFormats) {
    EXPECT_EQ(to_string(SqlValue(int32_t{-42})), "-42");
    EXPECT_EQ(to_string(SqlValue(uint8_t{200})), "200");
    EXPECT_EQ(to_string(SqlValue(true)), "true");
    EXPECT_EQ(to_string(SqlValue('x')), "x");
    EXPECT_EQ(to_string(SqlValue(Decimal{"-123.4500"})), "-123.4500");
}

TEST(SqlValueTest, DateTimeToStringTrimsFraction) {
    DateTime dt;
    dt.year = 2024;
    dt.month = 3;
    dt.day = 7;
    dt.hour = 14;
    dt.minute = 5;
    dt.second = 9;
    EXPECT_EQ(to_string(dt), "2024-03-07 14:05:09");

    dt.fraction = 120000000;
    EXPECT_EQ(to_string(dt), "2024-03-07 14:05:09.12");
}

TEST(SqlValueTest, ParseDateTime) {
    auto parsed = parse_date_time("2023-12-31T23:59:58.5");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->year, 2023);
    EXPECT_EQ(parsed->month, 12);
    EXPECT_EQ(parsed->second, 58);
    EXPECT_EQ(parsed->fraction, 500000000u);

    auto date_only = parse_date_time("2020-02-29");
    ASSERT_TRUE(date_only.has_value());
    EXPECT_EQ(date_only->hour, 0);

    EXPECT_FALSE(parse_date_time("2020-13-01").has_value());
    EXPECT_FALSE(parse_date_time("yesterday").has_value());
    EXPECT_FALSE(parse_date_time("2020-01-01 10:00:00 junk").has_value());
}

TEST(ValueCastTest, WidensAndNarrowsIntegers) {
    EXPECT_EQ(value_cast<int64_t>(SqlValue(int32_t{7})), 7);
    EXPECT_EQ(value_cast<int32_t>(SqlValue(int64_t{7})), 7);
    EXPECT_THROW(value_cast<int32_t>(SqlValue(int64_t{5000000000})), TypeConversionError);
    EXPECT_THROW(value_cast<uint8_t>(SqlValue(int32_t{-1})), TypeConversionError);
}

TEST(ValueCastTest, ParsesText) {
    EXPECT_EQ(value_cast<int32_t>(SqlValue(std::string("12"))), 12);
    EXPECT_DOUBLE_EQ(value_cast<double>(SqlValue(std::string("2.5"))), 2.5);
    EXPECT_TRUE(value_cast<bool>(SqlValue(std::string("true"))));
    EXPECT_THROW(value_cast<int32_t>(SqlValue(std::string("12abc"))), TypeConversionError);
    EXPECT_THROW(value_cast<bool>(SqlValue(std::string("maybe"))), TypeConversionError);
}

TEST(ValueCastTest, DecimalWithZeroFractionIsInteger) {
    EXPECT_EQ(value_cast<int64_t>(SqlValue(Decimal{"12.000"})), 12);
    EXPECT_THROW(value_cast<int64_t>(SqlValue(Decimal{"12.5"})), TypeConversionError);
}

TEST(ValueCastTest, OptionalTargetAcceptsNull) {
    auto empty = value_cast<std::optional<int32_t>>(SqlValue{});
    EXPECT_FALSE(empty.has_value());

    auto set = value_cast<std::optional<int32_t>>(SqlValue(int64_t{3}));
    ASSERT_TRUE(set.has_value());
    EXPECT_EQ(*set, 3);
}

TEST(ValueCastTest, AnythingConvertsToString) {
    EXPECT_EQ(value_cast<std::string>(SqlValue(int64_t{99})), "99");
    EXPECT_EQ(value_cast<std::string>(SqlValue(std::string("abc"))), "abc");
}

TEST(ValueCastTest, DateTimeFromText) {
    DateTime dt = value_cast<DateTime>(SqlValue(std::string("2001-01-02 03:04:05")));
    EXPECT_EQ(dt.year, 2001);
    EXPECT_EQ(dt.minute, 4);
    EXPECT_THROW(value_cast<DateTime>(SqlValue(int32_t{1})), TypeConversionError);
}
