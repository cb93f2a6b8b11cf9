#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "PostgreSQLFormatConverter.hpp"
#include "mocks/ResultBuilder.hpp"

using namespace querymind;
using querymind::fakes::ResultBuilder;

namespace {

constexpr Oid kBool = 16;
constexpr Oid kInt8 = 20;
constexpr Oid kInt4 = 23;
constexpr Oid kText = 25;
constexpr Oid kFloat8 = 701;
constexpr Oid kNumeric = 1700;

}  // namespace

TEST(PostgreSQLFormatConverterTest, IntegersBecomeNumbers) {
    EXPECT_EQ(PostgreSQLFormatConverter::convertValue("42", kInt4), 42);
    EXPECT_EQ(PostgreSQLFormatConverter::convertValue("-9007199254740993", kInt8),
              int64_t{-9007199254740993});
    EXPECT_TRUE(PostgreSQLFormatConverter::convertValue("42", kInt4).is_number_integer());
}

TEST(PostgreSQLFormatConverterTest, FloatsBecomeNumbers) {
    auto value = PostgreSQLFormatConverter::convertValue("3.5", kFloat8);
    ASSERT_TRUE(value.is_number_float());
    EXPECT_DOUBLE_EQ(value.get<double>(), 3.5);
}

TEST(PostgreSQLFormatConverterTest, NonFiniteFloatsStayText) {
    EXPECT_EQ(PostgreSQLFormatConverter::convertValue("NaN", kFloat8), "NaN");
    EXPECT_EQ(PostgreSQLFormatConverter::convertValue("Infinity", kFloat8), "Infinity");
}

TEST(PostgreSQLFormatConverterTest, NumericStaysText) {
    EXPECT_EQ(PostgreSQLFormatConverter::convertValue("12345678901234567890.12", kNumeric),
              "12345678901234567890.12");
}

TEST(PostgreSQLFormatConverterTest, Booleans) {
    EXPECT_EQ(PostgreSQLFormatConverter::convertValue("t", kBool), true);
    EXPECT_EQ(PostgreSQLFormatConverter::convertValue("f", kBool), false);
}

TEST(PostgreSQLFormatConverterTest, OtherTypesStayText) {
    EXPECT_EQ(PostgreSQLFormatConverter::convertValue("2024-05-01", 1082), "2024-05-01");
    EXPECT_EQ(PostgreSQLFormatConverter::convertValue("42", kText), "42");
}

TEST(PostgreSQLFormatConverterTest, TypeClassification) {
    EXPECT_TRUE(PostgreSQLFormatConverter::isNumericType(kInt4));
    EXPECT_TRUE(PostgreSQLFormatConverter::isNumericType(kNumeric));
    EXPECT_FALSE(PostgreSQLFormatConverter::isNumericType(kText));
    EXPECT_TRUE(PostgreSQLFormatConverter::isBooleanType(kBool));
    EXPECT_FALSE(PostgreSQLFormatConverter::isBooleanType(kInt4));
}

TEST(PostgreSQLFormatConverterTest, RowsKeepColumnOrderAndNulls) {
    ResultBuilder result({{"zeta", kInt4}, {"alpha", kText}, {"active", kBool}});
    result.addRow({"1", "first", "t"});
    result.addRow({"2", nullptr, "f"});

    auto rows = PostgreSQLFormatConverter::toRows(result.result());

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].dump(), R"({"zeta":1,"alpha":"first","active":true})");
    EXPECT_TRUE(rows[1]["alpha"].is_null());
    EXPECT_EQ(rows[1]["active"], false);
}

TEST(PostgreSQLFormatConverterTest, RowLimit) {
    ResultBuilder limited({{"n", kInt4}});
    limited.addRow({"1"}).addRow({"2"}).addRow({"3"});
    auto rows = PostgreSQLFormatConverter::toRows(limited.result(), 2);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1]["n"], 2);

    ResultBuilder unlimited({{"n", kInt4}});
    unlimited.addRow({"1"}).addRow({"2"}).addRow({"3"});
    EXPECT_EQ(PostgreSQLFormatConverter::toRows(unlimited.result(), 0).size(), 3u);
}

TEST(PostgreSQLFormatConverterTest, CurrentRowUsesColumnTypes) {
    ResultBuilder result({{"id", kInt8}, {"price", kNumeric}, {"ratio", kFloat8}});
    result.addRow({"7", "19.99", nullptr});

    ASSERT_TRUE(result.result().fetchRow());
    auto row = PostgreSQLFormatConverter::rowToJSON(result.result());

    EXPECT_EQ(row.dump(), R"({"id":7,"price":"19.99","ratio":null})");
}

TEST(PostgreSQLFormatConverterTest, NoResult) {
    PostgreSQLResultSet empty;
    EXPECT_TRUE(PostgreSQLFormatConverter::toRows(empty).empty());
    EXPECT_TRUE(PostgreSQLFormatConverter::rowToJSON(empty).empty());
}
