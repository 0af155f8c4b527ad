//! # Data Table View Tests

#include "cuke/gherkin/data_table.hpp"

#include <gtest/gtest.h>

using namespace cuke::gherkin;

TEST(DataTableViewTest, HeaderRowAndMaps) {
    DataTable table{{"name", "price"}, {"apple", "1.25"}, {"pear", "0.90"}};
    auto view = DataTableView::from(table);

    EXPECT_EQ(view.headers, (std::vector<std::string>{"name", "price"}));
    ASSERT_EQ(view.rows.size(), 2u);
    EXPECT_EQ(view.rows[1], (std::vector<std::string>{"pear", "0.90"}));
    ASSERT_EQ(view.maps.size(), 2u);
    EXPECT_EQ(view.maps[0].at("name"), "apple");
    EXPECT_EQ(view.maps[1].at("price"), "0.90");
    EXPECT_EQ(view.raw, table);
}

TEST(DataTableViewTest, SingleRowHasNoHeader) {
    DataTable table{{"a", "b", "c"}};
    auto view = DataTableView::from(table);

    EXPECT_TRUE(view.headers.empty());
    EXPECT_TRUE(view.maps.empty());
    EXPECT_EQ(view.rows, table);
}

TEST(DataTableViewTest, EmptyTable) {
    auto view = DataTableView::from(DataTable{});

    EXPECT_TRUE(view.headers.empty());
    EXPECT_TRUE(view.rows.empty());
    EXPECT_TRUE(view.raw.empty());
}

TEST(DataTableViewTest, ShortRowGivesPartialMap) {
    auto view = DataTableView::from(DataTable{{"x", "y"}, {"1"}});

    ASSERT_EQ(view.maps.size(), 1u);
    EXPECT_EQ(view.maps[0].size(), 1u);
    EXPECT_EQ(view.maps[0].at("x"), "1");
}

TEST(DataTableViewTest, CellLookup) {
    auto view = DataTableView::from(DataTable{{"user", "role"}, {"alice", "admin"}});

    EXPECT_EQ(view.cell(0, "role"), std::optional<std::string>("admin"));
    EXPECT_FALSE(view.cell(0, "missing").has_value());
    EXPECT_FALSE(view.cell(1, "user").has_value());
}
