#include <gtest/gtest.h>

#include "../ingest/status_resolver.hpp"
#include "../utils/scan_types.hpp"
#include "../utils/time_utils.hpp"

TEST(ScanTypes, AngleNamesRoundTrip) {
    for (ScanAngle angle : kRequiredAngles) {
        EXPECT_EQ(parseAngle(toString(angle)), angle);
    }
    EXPECT_EQ(toString(ScanAngle::Left45), "left45");
    EXPECT_THROW(parseAngle("back"), std::invalid_argument);
    EXPECT_THROW(parseAngle("FRONT"), std::invalid_argument);
}

TEST(ScanTypes, StatusNames) {
    EXPECT_EQ(toString(ScanStatus::Pending), "pending");
    EXPECT_EQ(parseStatus("rejected"), ScanStatus::Rejected);
    EXPECT_THROW(parseStatus("done"), std::invalid_argument);
}

TEST(ScanTypes, GeneratedIdsAreUnique) {
    std::string a = generateScanId();
    std::string b = generateScanId();
    EXPECT_EQ(a.size(), 36u);
    EXPECT_NE(a, b);
}

TEST(QualityFlags, KeepsFirstInsertionOrderWithoutDuplicates) {
    QualityFlags flags;
    flags.add("blur", ScanAngle::Left);
    flags.add("pose:left");
    flags.add("blur:left");
    flags.add("missing_angle", ScanAngle::Right45);

    std::vector<std::string> expected = {"blur:left", "pose:left", "missing_angle:right45"};
    EXPECT_EQ(flags.values(), expected);
    EXPECT_TRUE(flags.contains("pose:left"));
    EXPECT_TRUE(flags.hasPrefix("missing_angle"));
    EXPECT_FALSE(flags.hasPrefix("checksum_mismatch"));
}

TEST(MissingAngles, FollowsRequiredOrder) {
    std::vector<ScanAngle> present = {ScanAngle::Right45, ScanAngle::Front};
    std::vector<ScanAngle> expected = {ScanAngle::Left, ScanAngle::Right, ScanAngle::Left45};
    EXPECT_EQ(computeMissingAngles(present), expected);

    std::vector<ScanAngle> all(kRequiredAngles.begin(), kRequiredAngles.end());
    EXPECT_TRUE(computeMissingAngles(all).empty());
    EXPECT_EQ(computeMissingAngles(std::vector<ScanAngle>{}).size(), 5u);
}

TEST(StatusResolver, ChecksumMismatchRejects) {
    QualityFlags flags;
    flags.add("blur", ScanAngle::Front);
    flags.add("checksum_mismatch", ScanAngle::Left);

    EXPECT_EQ(resolveStatus(flags, {}), ScanStatus::Rejected);
    EXPECT_EQ(resolveStatus(flags, {ScanAngle::Right}), ScanStatus::Rejected);
}

TEST(StatusResolver, MissingAnglesKeepScanProcessing) {
    QualityFlags flags;
    flags.add("missing_angle", ScanAngle::Right);
    EXPECT_EQ(resolveStatus(flags, {ScanAngle::Right}), ScanStatus::Processing);
}

TEST(StatusResolver, AdvisoryFlagsDoNotBlockCompletion) {
    QualityFlags flags;
    flags.add("blur", ScanAngle::Front);
    flags.add("low_light", ScanAngle::Front);
    flags.add("pose", ScanAngle::Front);
    flags.add("missing_object", ScanAngle::Left);
    EXPECT_EQ(resolveStatus(flags, {}), ScanStatus::Complete);
    EXPECT_EQ(resolveStatus(QualityFlags(), {}), ScanStatus::Complete);
}

TEST(TimeUtils, FormatsUtcWithMilliseconds) {
    Clock::time_point tp = Clock::from_time_t(1369353600) + std::chrono::milliseconds(42);
    EXPECT_EQ(formatIso8601(tp), "2013-05-24T00:00:00.042Z");
}

TEST(TimeUtils, ParsesOffsetsAndFractions) {
    Clock::time_point base = Clock::from_time_t(1369353600);
    EXPECT_EQ(parseIso8601("2013-05-24T00:00:00Z"), base);
    EXPECT_EQ(parseIso8601("2013-05-24T02:00:00+02:00"), base);
    EXPECT_EQ(parseIso8601("2013-05-23 19:30:00-04:30"), base);
    EXPECT_EQ(parseIso8601("2013-05-24T00:00:00.5Z"), base + std::chrono::milliseconds(500));
}

TEST(TimeUtils, RejectsMalformedTimestamps) {
    EXPECT_THROW(parseIso8601("yesterday"), std::invalid_argument);
    EXPECT_THROW(parseIso8601("2013-05-24"), std::invalid_argument);
    EXPECT_THROW(parseIso8601("2013-05-24T00:00:00Zjunk"), std::invalid_argument);
}
