#include <gtest/gtest.h>
#include "utils/utils.h"

using namespace qkdsim::utils;

TEST(FormatterTest, Numbers) {
    EXPECT_EQ(Formatter::formatNumber(100000), "100,000");
    EXPECT_EQ(Formatter::formatNumber(999), "999");
    EXPECT_EQ(Formatter::formatNumber(0), "0");
    EXPECT_EQ(Formatter::formatRatio(0.5), "0.5000");
    EXPECT_EQ(Formatter::formatRatio(0.49871, 2), "0.50");
}

TEST(FormatterTest, Strings) {
    EXPECT_EQ(Formatter::padLeft("7", 3), "  7");
    EXPECT_EQ(Formatter::padRight("ab", 4, '.'), "ab..");
    EXPECT_EQ(Formatter::padRight("abcdef", 3), "abcdef");
    EXPECT_EQ(Formatter::join({"a", "b", "c"}, " "), "a b c");
    EXPECT_EQ(Formatter::join({}, ","), "");
}

TEST(TableFormatterTest, RendersAlignedColumns) {
    TableFormatter table;
    table.setHeaders({"Metric", "Value"});
    table.addRow({"samples", "100,000"});
    table.addRow({"ok", "yes"});

    std::string expected =
        "| Metric  | Value   |\n"
        "|---------|---------|\n"
        "| samples | 100,000 |\n"
        "| ok      | yes     |\n";
    EXPECT_EQ(table.render(), expected);
}

TEST(TableFormatterTest, ShortRowsArePadded) {
    TableFormatter table;
    table.setHeaders({"A", "B"});
    table.addRow({"x"});

    std::string expected =
        "| A | B |\n"
        "|---|---|\n"
        "| x |   |\n";
    EXPECT_EQ(table.render(), expected);
}

TEST(TableFormatterTest, RightAlignedColumnPadsOnTheLeft) {
    TableFormatter table;
    table.setHeaders({"Check", "Samples"});
    table.setRightAligned(1);
    table.addRow({"matched", "50,112"});
    table.addRow({"mismatched", "7"});

    std::string expected =
        "| Check      | Samples |\n"
        "|------------|---------|\n"
        "| matched    |  50,112 |\n"
        "| mismatched |       7 |\n";
    EXPECT_EQ(table.render(), expected);

    table.setRightAligned(1, false);
    EXPECT_NE(table.render().find("| 7       |"), std::string::npos);
}
