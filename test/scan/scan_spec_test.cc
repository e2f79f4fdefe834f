#include <gtest/gtest.h>
#include "common/errors.h"
#include "scan/scan_spec.h"

using namespace VerifyRep;

TEST(ScanSpecBuilderTest, DefaultsCoverAllTime) {
    ScanSpec spec = ScanSpecBuilder::Build(TimeRange{}, std::nullopt, {});
    EXPECT_EQ(spec.time_range.start, 0);
    EXPECT_EQ(spec.time_range.end, std::numeric_limits<int64_t>::max());
    EXPECT_FALSE(spec.max_versions.has_value());
    EXPECT_TRUE(spec.families.empty());
    EXPECT_TRUE(spec.start_row.empty());
}

TEST(ScanSpecBuilderTest, SameInputsBuildEqualSpecs) {
    TimeRange range{1265875194289, 1265878794289};
    ScanSpec a = ScanSpecBuilder::Build(range, 3, {"cf1", "cf2"});
    ScanSpec b = ScanSpecBuilder::Build(range, 3, {"cf2", "cf1", "cf1"});
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.families.size(), 2u);
}

TEST(ScanSpecBuilderTest, LocalAndRemoteDifferOnlyInStartRow) {
    ScanSpec job_spec = ScanSpecBuilder::Build(TimeRange{10, 20}, 1, {"cf"});
    ScanSpec local = job_spec.WithRange(KeyRange{"row-100", "row-200"});
    ScanSpec remote = local.WithStartRow("row-123");

    EXPECT_TRUE(local.EqualsIgnoringStartRow(remote));
    EXPECT_NE(local, remote);
    EXPECT_EQ(remote.start_row, "row-123");
    EXPECT_EQ(remote.stop_row, "row-200");

    ScanSpec other_versions = ScanSpecBuilder::Build(TimeRange{10, 20}, 2, {"cf"});
    EXPECT_FALSE(job_spec.EqualsIgnoringStartRow(other_versions));
    ScanSpec other_families = ScanSpecBuilder::Build(TimeRange{10, 20}, 1, {"cf", "meta"});
    EXPECT_FALSE(job_spec.EqualsIgnoringStartRow(other_families));
}

TEST(ScanSpecBuilderTest, StartAfterEndIsRejected) {
    EXPECT_THROW(ScanSpecBuilder::Build(TimeRange{20, 10}, std::nullopt, {}), InvalidArguments);
}

TEST(ScanSpecBuilderTest, EmptyTimeRangeIsAccepted) {
    ScanSpec spec = ScanSpecBuilder::Build(TimeRange{10, 10}, std::nullopt, {});
    EXPECT_EQ(spec.time_range.start, spec.time_range.end);
}

TEST(ScanSpecBuilderTest, NegativeVersionsAreRejected) {
    EXPECT_THROW(ScanSpecBuilder::Build(TimeRange{}, -1, {}), InvalidArguments);
    EXPECT_NO_THROW(ScanSpecBuilder::Build(TimeRange{}, 0, {}));
}

TEST(ScanSpecBuilderTest, EmptyFamilyIsRejected) {
    EXPECT_THROW(ScanSpecBuilder::Build(TimeRange{}, std::nullopt, {"cf", ""}), InvalidArguments);
}

TEST(ScanSpecBuilderTest, ParseFamilyList) {
    std::vector<std::string> families = ParseFamilyList("cf1,cf2,cf3");
    ASSERT_EQ(families.size(), 3u);
    EXPECT_EQ(families[0], "cf1");
    EXPECT_EQ(families[2], "cf3");

    EXPECT_THROW(ParseFamilyList("cf1,,cf2"), InvalidArguments);
    EXPECT_THROW(ParseFamilyList(""), InvalidArguments);
}
