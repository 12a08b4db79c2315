#include <gtest/gtest.h>

#include <memory>

#include "../ingest/upload_target_issuer.hpp"
#include "../store/memory_scan_store.hpp"
#include "test_helpers.hpp"

class UploadTargetIssuerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<MemoryScanStore>();
        storage = std::make_shared<FakeObjectStorage>();
        issuer = std::make_unique<UploadTargetIssuer>(store, storage);

        NewScan input;
        input.patient_id = "patient-7";
        scan_id = store->createScan(input).id;
    }

    std::shared_ptr<MemoryScanStore> store;
    std::shared_ptr<FakeObjectStorage> storage;
    std::unique_ptr<UploadTargetIssuer> issuer;
    std::string scan_id;
};

TEST_F(UploadTargetIssuerTest, UnknownScanThrows) {
    EXPECT_THROW(issuer->issue("no-such-scan", {{ScanAngle::Front, "image/jpeg", std::nullopt}}),
                 ScanNotFound);
    EXPECT_TRUE(storage->issued.empty());
}

TEST_F(UploadTargetIssuerTest, ExtensionFollowsContentType) {
    EXPECT_EQ(UploadTargetIssuer::extensionForContentType("image/png"), "png");
    EXPECT_EQ(UploadTargetIssuer::extensionForContentType("image/webp"), "webp");
    EXPECT_EQ(UploadTargetIssuer::extensionForContentType("image/jpeg"), "jpg");
    EXPECT_EQ(UploadTargetIssuer::extensionForContentType("application/octet-stream"), "jpg");
    EXPECT_EQ(UploadTargetIssuer::extensionForContentType(""), "jpg");
}

TEST_F(UploadTargetIssuerTest, StorageKeyLayout) {
    auto targets = issuer->issue(scan_id, {{ScanAngle::Left45, "image/png", std::nullopt}});

    ASSERT_EQ(targets.size(), 1u);
    std::string expected_key = "scans/patient-7/" + scan_id + "/left45.png";
    EXPECT_EQ(targets[0].storage_key, expected_key);
    EXPECT_EQ(targets[0].angle, ScanAngle::Left45);
    EXPECT_EQ(targets[0].target.url, "https://upload.test/" + expected_key);
    EXPECT_EQ(targets[0].target.method, "PUT");
    EXPECT_EQ(targets[0].display_url, "https://cdn.test/" + expected_key);
}

TEST_F(UploadTargetIssuerTest, TargetsExpireAfterFifteenMinutes) {
    issuer->issue(scan_id, {{ScanAngle::Front, "image/jpeg", std::nullopt},
                            {ScanAngle::Left, "image/jpeg", std::nullopt}});

    ASSERT_EQ(storage->issued.size(), 2u);
    for (const auto& issued : storage->issued) {
        EXPECT_EQ(issued.ttl_seconds, 900);
        EXPECT_EQ(issued.content_type, "image/jpeg");
    }
}

TEST_F(UploadTargetIssuerTest, ReissuingAnAngleReplacesItsRow) {
    issuer->issue(scan_id, {{ScanAngle::Front, "image/jpeg", std::string("aaa")}});
    auto second = issuer->issue(scan_id, {{ScanAngle::Front, "image/jpeg", std::string("bbb")}});

    auto scan = store->findScan(scan_id);
    ASSERT_TRUE(scan.has_value());
    ASSERT_EQ(scan->images.size(), 1u);

    const ScanImage* front = scan->findImage(ScanAngle::Front);
    ASSERT_NE(front, nullptr);
    EXPECT_EQ(front->checksum, std::optional<std::string>("bbb"));
    EXPECT_EQ(front->storage_key, std::optional<std::string>(second[0].storage_key));
    EXPECT_EQ(front->url, std::optional<std::string>(second[0].display_url));
}

TEST_F(UploadTargetIssuerTest, SameAngleAndTypeGiveSameKey) {
    auto first = issuer->issue(scan_id, {{ScanAngle::Right, "image/png", std::nullopt}});
    auto second = issuer->issue(scan_id, {{ScanAngle::Right, "image/png", std::nullopt}});
    EXPECT_EQ(first[0].storage_key, second[0].storage_key);
}

TEST_F(UploadTargetIssuerTest, MissingAnglesCoverEveryStoredRow) {
    issuer->issue(scan_id, {{ScanAngle::Front, "image/jpeg", std::nullopt},
                            {ScanAngle::Left, "image/jpeg", std::nullopt}});
    issuer->issue(scan_id, {{ScanAngle::Right, "image/jpeg", std::nullopt}});

    auto scan = store->findScan(scan_id);
    ASSERT_TRUE(scan.has_value());
    std::vector<ScanAngle> expected = {ScanAngle::Left45, ScanAngle::Right45};
    EXPECT_EQ(scan->missing_angles, expected);
    EXPECT_EQ(scan->images.size(), 3u);
}

TEST_F(UploadTargetIssuerTest, EmptyRequestStillRecomputesMissingAngles) {
    auto targets = issuer->issue(scan_id, {});
    EXPECT_TRUE(targets.empty());

    auto scan = store->findScan(scan_id);
    ASSERT_TRUE(scan.has_value());
    EXPECT_EQ(scan->missing_angles.size(), kRequiredAngles.size());
}

TEST_F(UploadTargetIssuerTest, DoesNotTouchStatusOrFlags) {
    issuer->issue(scan_id, {{ScanAngle::Front, "image/jpeg", std::nullopt}});

    auto scan = store->findScan(scan_id);
    ASSERT_TRUE(scan.has_value());
    EXPECT_EQ(scan->status, ScanStatus::Pending);
    EXPECT_TRUE(scan->quality_flags.empty());
    EXPECT_TRUE(storage->fetched.empty());
}

TEST_F(UploadTargetIssuerTest, FailurePartWayStillRefreshesMissingAngles) {
    storage->failing_write_keys.insert("scans/patient-7/" + scan_id + "/left.jpg");

    EXPECT_THROW(issuer->issue(scan_id, {{ScanAngle::Front, "image/jpeg", std::nullopt},
                                         {ScanAngle::Left, "image/jpeg", std::nullopt},
                                         {ScanAngle::Right, "image/jpeg", std::nullopt}}),
                 StorageError);

    auto scan = store->findScan(scan_id);
    ASSERT_TRUE(scan.has_value());
    ASSERT_EQ(scan->images.size(), 1u);
    EXPECT_NE(scan->findImage(ScanAngle::Front), nullptr);
    EXPECT_EQ(scan->missing_angles, computeMissingAngles(scan->images));
    std::vector<ScanAngle> expected = {ScanAngle::Left, ScanAngle::Right,
                                       ScanAngle::Left45, ScanAngle::Right45};
    EXPECT_EQ(scan->missing_angles, expected);
}
