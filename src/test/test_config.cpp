#include <gtest/gtest.h>

#include <cstdlib>
#include <cstdio>
#include <fstream>
#include <sstream>

#include "../utils/config.hpp"

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::string(::testing::TempDir()) + "skinscan_config_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".ini";
        clearEnvironment();
    }

    void TearDown() override {
        std::remove(path.c_str());
        clearEnvironment();
    }

    void write(const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    static void clearEnvironment() {
        for (const char* name : {"BLUR_THRESHOLD", "LIGHT_THRESHOLD", "S3_BUCKET", "S3_REGION",
                                 "S3_ENDPOINT", "S3_PUBLIC_BASE_URL", "S3_ACCESS_KEY_ID",
                                 "S3_SECRET_ACCESS_KEY"}) {
            unsetenv(name);
        }
    }

    std::string path;
};

TEST_F(ConfigTest, DefaultsWithoutFile) {
    Config config;
    config.load(path + ".missing");

    EXPECT_FLOAT_EQ(config.blur_threshold, 120.0f);
    EXPECT_FLOAT_EQ(config.light_threshold, 55.0f);
    EXPECT_EQ(config.ingest_workers, 1);
    EXPECT_FLOAT_EQ(config.rescan_interval_days, 30.0f);
    EXPECT_EQ(config.storage_backend, "s3");
    EXPECT_EQ(config.s3_bucket, "skinsage");
    EXPECT_EQ(config.s3_region, "us-east-1");
    EXPECT_EQ(config.server_port, 8764);
}

TEST_F(ConfigTest, ReadsKeyValuePairs) {
    write("# thresholds\n"
          "blur_threshold = 80.5\n"
          "light_threshold=40\n"
          "; storage\n"
          "storage_backend = file\n"
          "storage_root = /var/lib/skinscan\n"
          "ingest_workers = 4\n"
          "\n"
          "db_port = 6543\n");

    Config config;
    config.load(path);

    EXPECT_FLOAT_EQ(config.blur_threshold, 80.5f);
    EXPECT_FLOAT_EQ(config.light_threshold, 40.0f);
    EXPECT_EQ(config.storage_backend, "file");
    EXPECT_EQ(config.storage_root, "/var/lib/skinscan");
    EXPECT_EQ(config.ingest_workers, 4);
    EXPECT_EQ(config.db_port, 6543);
}

TEST_F(ConfigTest, InvalidNumbersKeepDefaults) {
    write("blur_threshold = sharp\n"
          "db_port = five\n");

    Config config;
    config.load(path);

    EXPECT_FLOAT_EQ(config.blur_threshold, 120.0f);
    EXPECT_EQ(config.db_port, 5432);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    write("blur_threshold = 80\n"
          "s3_bucket = from-file\n");
    setenv("BLUR_THRESHOLD", "150", 1);
    setenv("S3_BUCKET", "from-env", 1);
    setenv("S3_ENDPOINT", "http://minio:9000", 1);
    setenv("LIGHT_THRESHOLD", "", 1);

    Config config;
    config.load(path);

    EXPECT_FLOAT_EQ(config.blur_threshold, 150.0f);
    EXPECT_FLOAT_EQ(config.light_threshold, 55.0f);
    EXPECT_EQ(config.s3_bucket, "from-env");
    EXPECT_EQ(config.s3_endpoint, "http://minio:9000");
}

TEST_F(ConfigTest, InvalidEnvironmentThresholdIsIgnored) {
    setenv("LIGHT_THRESHOLD", "bright", 1);

    Config config;
    config.applyEnvironment();

    EXPECT_FLOAT_EQ(config.light_threshold, 55.0f);
}

TEST_F(ConfigTest, SummaryGoesToGivenStream) {
    write("blur_threshold = 90\n");

    Config config;
    std::ostringstream log;
    testing::internal::CaptureStdout();
    config.load(path, log);
    std::string stdout_text = testing::internal::GetCapturedStdout();

    EXPECT_EQ(stdout_text, "");
    EXPECT_NE(log.str().find("Configuration loaded successfully"), std::string::npos);
    EXPECT_NE(log.str().find("Thresholds: blur 90"), std::string::npos);
}
