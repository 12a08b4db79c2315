#include <gtest/gtest.h>

#include "../utils/scan_json.hpp"

TEST(ScanJson, ScanUsesCamelCaseKeys) {
    Scan scan;
    scan.id = "s1";
    scan.patient_id = "p1";
    scan.captured_at = "2026-02-01T10:00:00.000Z";
    scan.status = ScanStatus::Rejected;
    scan.quality_flags = {"checksum_mismatch:front"};
    scan.missing_angles = {ScanAngle::Left45};

    ScanImage image;
    image.scan_id = "s1";
    image.angle = ScanAngle::Front;
    image.storage_key = std::string("scans/p1/s1/front.jpg");
    scan.images.push_back(image);

    json j = scan;

    EXPECT_EQ(j["id"], "s1");
    EXPECT_EQ(j["patientId"], "p1");
    EXPECT_EQ(j["capturedAt"], "2026-02-01T10:00:00.000Z");
    EXPECT_EQ(j["status"], "rejected");
    EXPECT_EQ(j["qualityFlags"], json::array({"checksum_mismatch:front"}));
    EXPECT_EQ(j["missingAngles"], json::array({"left45"}));
    ASSERT_EQ(j["images"].size(), 1u);
    EXPECT_EQ(j["images"][0]["angle"], "front");
    EXPECT_EQ(j["images"][0]["storageKey"], "scans/p1/s1/front.jpg");
}

TEST(ScanJson, UnsetImageFieldsAreNull) {
    ScanImage image;
    image.scan_id = "s1";
    image.angle = ScanAngle::Right;

    json j = image;

    EXPECT_TRUE(j["storageKey"].is_null());
    EXPECT_TRUE(j["checksum"].is_null());
    EXPECT_TRUE(j["blurScore"].is_null());
    EXPECT_TRUE(j["poseOk"].is_null());
    EXPECT_TRUE(j["landmarks"].is_null());
}

TEST(ScanJson, LandmarksRoundTrip) {
    Landmarks landmarks;
    landmarks.estimated = true;
    landmarks.points = {{"nose", 50.0f, 55.0f}};

    json j = landmarks;
    EXPECT_EQ(j["points"][0]["name"], "nose");

    Landmarks parsed = j.get<Landmarks>();
    EXPECT_TRUE(parsed.estimated);
    ASSERT_EQ(parsed.points.size(), 1u);
    EXPECT_FLOAT_EQ(parsed.points[0].x, 50.0f);
    EXPECT_FLOAT_EQ(parsed.points[0].y, 55.0f);
}

TEST(ScanJson, QualityReport) {
    QualityReport report;
    report.blur_score = 250.5;
    report.light_score = 70.0;
    report.pose_ok = true;

    json j = report;
    EXPECT_DOUBLE_EQ(j["blurScore"].get<double>(), 250.5);
    EXPECT_DOUBLE_EQ(j["lightScore"].get<double>(), 70.0);
    EXPECT_TRUE(j["poseOk"].get<bool>());
    EXPECT_TRUE(j["landmarks"]["points"].empty());
}
