#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <map>
#include <fstream>
#include <sstream>
#include <iostream>

class Config {
public:
    // Database configuration
    std::string db_host;
    int db_port;
    std::string db_name;
    std::string db_user;
    std::string db_password;

    // Quality thresholds
    float blur_threshold;
    float light_threshold;

    // Ingestion settings
    int ingest_workers;
    float rescan_interval_days;

    // Object storage
    std::string storage_backend;  // "s3" or "file"
    std::string storage_root;
    std::string s3_bucket;
    std::string s3_region;
    std::string s3_endpoint;
    std::string s3_public_base_url;
    std::string s3_access_key_id;
    std::string s3_secret_access_key;

    // Server settings
    std::string server_host;
    int server_port;

    Config();
    // The summary is written to `log` so CLIs can keep stdout for their output.
    bool load(const std::string& filename, std::ostream& log = std::cout);
    void setDefaults();

    // Environment variables win over the file (BLUR_THRESHOLD, S3_BUCKET, ...).
    void applyEnvironment();

private:
    std::map<std::string, std::string> configMap;
    void parseFile(const std::string& filename);
    std::string trim(const std::string& str);
    std::string getValue(const std::string& key, const std::string& defaultValue);
    int getValueInt(const std::string& key, int defaultValue);
    float getValueFloat(const std::string& key, float defaultValue);
};

#endif // CONFIG_HPP
