#include <gtest/gtest.h>
#include "common/row.h"
#include "fakes/fake_cluster.h"

using namespace VerifyRep;
using VerifyRep::fakes::CellSpec;
using VerifyRep::fakes::MakeRow;

TEST(RowTest, CellEqualityCoversEveryField) {
    Cell base{"r1", "cf", "q", 10, "value"};

    Cell other = base;
    EXPECT_EQ(base, other);

    other.timestamp = 11;
    EXPECT_NE(base, other);

    other = base;
    other.value = "value2";
    EXPECT_NE(base, other);

    other = base;
    other.row = "r2";
    EXPECT_NE(base, other);

    other = base;
    other.family = "cf2";
    EXPECT_NE(base, other);

    other = base;
    other.qualifier = "q2";
    EXPECT_NE(base, other);
}

TEST(RowTest, RowEqualityIsOrderSensitive) {
    Row a = MakeRow("r1", {CellSpec{"cf", "a", 1, "x"}, CellSpec{"cf", "b", 1, "y"}});
    Row b = MakeRow("r1", {CellSpec{"cf", "b", 1, "y"}, CellSpec{"cf", "a", 1, "x"}});
    EXPECT_EQ(a, a);
    EXPECT_NE(a, b);
}

TEST(RowTest, ToStringEscapesBinaryBytes) {
    Row row = MakeRow(std::string("k\x01", 2), {CellSpec{"cf", "q", 5, std::string("\xff", 1)}});
    std::string rendered = row.ToString();
    EXPECT_NE(rendered.find("k\\x01"), std::string::npos);
    EXPECT_NE(rendered.find("cf:q/5"), std::string::npos);
    EXPECT_NE(rendered.find("\\xff"), std::string::npos);
}

TEST(RowTest, EmptyRowRendersAsNone) {
    Row row;
    row.key = "r9";
    EXPECT_EQ(row.ToString(), "row=r9, keyvalues=NONE");
}

TEST(RowTest, KeyRangeContainsHalfOpen) {
    KeyRange range{"b", "d"};
    EXPECT_FALSE(range.Contains("a"));
    EXPECT_TRUE(range.Contains("b"));
    EXPECT_TRUE(range.Contains("c"));
    EXPECT_FALSE(range.Contains("d"));

    KeyRange unbounded{"b", ""};
    EXPECT_TRUE(unbounded.Contains("zzzz"));
}
