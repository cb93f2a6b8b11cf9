#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "FormatConverter.hpp"

using namespace querymind;
using namespace std::chrono_literals;

class FormatConverterTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot_.databaseName = "shop";
        snapshot_.extractedAt = std::chrono::system_clock::time_point(1714566600s) + 42us;

        TableMeta orders;
        orders.rowCount = 4200;
        orders.tableSize = "432 kB";
        orders.columns = {
            ColumnMeta{"id", "integer", std::nullopt, 32, 0, false, std::nullopt, std::nullopt, 1},
            ColumnMeta{"note", "text", std::nullopt, std::nullopt, std::nullopt, true,
                       std::string("''::text"), std::string("Free text"), 2},
        };
        orders.primaryKeys = {"id"};
        orders.foreignKeys = {
            ForeignKeyMeta{"user_id", "users", "id", "orders_user_id_fkey",
                           ReferentialAction::SetNull, ReferentialAction::Cascade},
        };
        orders.indexes = {IndexMeta{"orders_pkey", {"id"}, true, true, "btree"}};
        orders.columnStatistics = std::map<std::string, ColumnStats>{
            {"id", ColumnStats{0, 0.0, 4200, 100.0, std::nullopt}},
            {"note", ColumnStats{0, 0.0, 0, 0.0, std::string("permission denied")}},
        };
        SampleRow row = SampleRow::object();
        row["id"] = 1;
        row["note"] = nullptr;
        orders.sampleData = std::vector<SampleRow>{row};
        snapshot_.tables["orders"] = orders;

        ViewMeta view;
        view.viewType = "MATERIALIZED VIEW";
        view.definition = "SELECT 1";
        snapshot_.views["daily_totals"] = view;

        snapshot_.relationships["orders"] = {RelationshipEdge{"user_id", "users", "id"}};
        snapshot_.warnings = {ProbeWarning{"orders.note", "statistics", "permission denied"}};
    }

    Snapshot snapshot_;
};

// Timestamps
TEST_F(FormatConverterTest, FormatTimestamp) {
    auto tp = std::chrono::system_clock::time_point(1714566600s) + 123456us;
    EXPECT_EQ(FormatConverter::formatTimestamp(tp), "2024-05-01T12:30:00.123456Z");
}

TEST_F(FormatConverterTest, ParseTimestamp) {
    auto tp = FormatConverter::parseTimestamp("2024-05-01T12:30:00.123456Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(*tp, std::chrono::system_clock::time_point(1714566600s) + 123456us);
}

TEST_F(FormatConverterTest, ParseTimestampRejectsGarbage) {
    EXPECT_FALSE(FormatConverter::parseTimestamp("").has_value());
    EXPECT_FALSE(FormatConverter::parseTimestamp("2024-05-01").has_value());
    EXPECT_FALSE(FormatConverter::parseTimestamp("yesterday").has_value());
}

TEST_F(FormatConverterTest, TruncateToMicros) {
    auto tp = std::chrono::system_clock::time_point(1714566600s) + 123456us;
    auto precise = tp + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                            std::chrono::nanoseconds(789));
    EXPECT_EQ(FormatConverter::truncateToMicros(precise), tp);
}

// Key names
TEST_F(FormatConverterTest, SnapshotKeys) {
    auto data = FormatConverter::toJSON(snapshot_);

    EXPECT_EQ(data["database_name"], "shop");
    EXPECT_EQ(data["extracted_at"], "2024-05-01T12:30:00.000042Z");
    EXPECT_EQ(data["total_tables"], 1);
    EXPECT_EQ(data["total_views"], 1);
    EXPECT_EQ(data["connection_failed"], false);
    EXPECT_EQ(data["relationships"]["orders"][0]["to_table"], "users");
    EXPECT_EQ(data["warnings"][0]["step"], "statistics");
}

TEST_F(FormatConverterTest, TableKeys) {
    auto data = FormatConverter::toJSON(snapshot_.tables.at("orders"));

    EXPECT_EQ(data["table_type"], "BASE TABLE");
    EXPECT_TRUE(data["comment"].is_null());
    EXPECT_EQ(data["row_count"], 4200);
    EXPECT_EQ(data["table_size"], "432 kB");
    EXPECT_EQ(data["primary_keys"][0], "id");

    const auto& fk = data["foreign_keys"][0];
    EXPECT_EQ(fk["column_name"], "user_id");
    EXPECT_EQ(fk["foreign_table_name"], "users");
    EXPECT_EQ(fk["foreign_column_name"], "id");
    EXPECT_EQ(fk["update_rule"], "SET NULL");
    EXPECT_EQ(fk["delete_rule"], "CASCADE");

    const auto& idx = data["indexes"][0];
    EXPECT_EQ(idx["index_name"], "orders_pkey");
    EXPECT_EQ(idx["is_primary"], true);
    EXPECT_EQ(idx["index_type"], "btree");

    EXPECT_EQ(data["sample_data"][0].dump(), R"({"id":1,"note":null})");
}

TEST_F(FormatConverterTest, ColumnKeys) {
    auto data = FormatConverter::toJSON(snapshot_.tables.at("orders").columns[1]);

    EXPECT_EQ(data["column_name"], "note");
    EXPECT_EQ(data["data_type"], "text");
    EXPECT_TRUE(data["character_maximum_length"].is_null());
    EXPECT_EQ(data["is_nullable"], "YES");
    EXPECT_EQ(data["column_default"], "''::text");
    EXPECT_EQ(data["column_comment"], "Free text");
    EXPECT_EQ(data["ordinal_position"], 2);
}

TEST_F(FormatConverterTest, StatisticsForms) {
    auto stats = FormatConverter::toJSON(snapshot_.tables.at("orders")).at("column_statistics");

    EXPECT_EQ(stats["id"]["distinct_count"], 4200);
    EXPECT_EQ(stats["id"]["null_percentage"], 0.0);
    EXPECT_EQ(stats["note"].size(), 1u);
    EXPECT_EQ(stats["note"]["error"], "permission denied");
}

TEST_F(FormatConverterTest, AbsentOptionalSectionsAreOmitted) {
    TableMeta bare;
    auto data = FormatConverter::toJSON(bare);

    EXPECT_FALSE(data.contains("column_statistics"));
    EXPECT_FALSE(data.contains("sample_data"));

    ViewMeta view;
    EXPECT_FALSE(FormatConverter::toJSON(view).contains("sample_data"));
}

TEST_F(FormatConverterTest, SnapshotSurvivesRoundTrip) {
    auto restored = FormatConverter::snapshotFromJSON(FormatConverter::toJSON(snapshot_));

    EXPECT_EQ(restored, snapshot_);
}

TEST_F(FormatConverterTest, SnapshotFromJSONRejectsMissingKeys) {
    auto data = FormatConverter::toJSON(snapshot_);
    data.erase("tables");

    EXPECT_THROW(FormatConverter::snapshotFromJSON(data), json::exception);
}

TEST_F(FormatConverterTest, SnapshotFromJSONRejectsBadTimestamp) {
    auto data = FormatConverter::toJSON(snapshot_);
    data["extracted_at"] = "not a time";

    EXPECT_THROW(FormatConverter::snapshotFromJSON(data), std::invalid_argument);
}

// Referential actions
TEST(ReferentialActionTest, ParseAndPrint) {
    EXPECT_EQ(parseReferentialAction("CASCADE"), ReferentialAction::Cascade);
    EXPECT_EQ(parseReferentialAction("set null"), ReferentialAction::SetNull);
    EXPECT_EQ(parseReferentialAction("SET_DEFAULT"), ReferentialAction::SetDefault);
    EXPECT_EQ(parseReferentialAction("RESTRICT"), ReferentialAction::Restrict);
    EXPECT_EQ(parseReferentialAction("whatever"), ReferentialAction::NoAction);

    EXPECT_EQ(referentialActionToString(ReferentialAction::NoAction), "NO ACTION");
    EXPECT_EQ(referentialActionToString(ReferentialAction::SetNull), "SET NULL");
}
