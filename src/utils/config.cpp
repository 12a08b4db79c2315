#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace {

const char* envOrNull(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

} // namespace

Config::Config() {
    setDefaults();
}

void Config::setDefaults() {
    // Database defaults
    db_host = "localhost";
    db_port = 5432;
    db_name = "skinsage";
    db_user = "skinsage";
    db_password = "skinsage";

    // Quality thresholds
    blur_threshold = 120.0f;
    light_threshold = 55.0f;

    // Ingestion defaults
    ingest_workers = 1;
    rescan_interval_days = 30.0f;

    // Storage defaults
    storage_backend = "s3";
    storage_root = "./data/objects";
    s3_bucket = "skinsage";
    s3_region = "us-east-1";
    s3_endpoint = "";
    s3_public_base_url = "";
    s3_access_key_id = "";
    s3_secret_access_key = "";

    // Server defaults
    server_host = "0.0.0.0";
    server_port = 8764;
}

std::string Config::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void Config::parseFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Warning: Could not open config file: " << filename << std::endl;
        std::cerr << "Using default configuration." << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Parse key=value
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            configMap[key] = value;
        }
    }

    file.close();
}

std::string Config::getValue(const std::string& key, const std::string& defaultValue) {
    auto it = configMap.find(key);
    if (it != configMap.end()) {
        return it->second;
    }
    return defaultValue;
}

int Config::getValueInt(const std::string& key, int defaultValue) {
    auto it = configMap.find(key);
    if (it != configMap.end()) {
        try {
            return std::stoi(it->second);
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid integer value for " << key << std::endl;
        }
    }
    return defaultValue;
}

float Config::getValueFloat(const std::string& key, float defaultValue) {
    auto it = configMap.find(key);
    if (it != configMap.end()) {
        try {
            return std::stof(it->second);
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid float value for " << key << std::endl;
        }
    }
    return defaultValue;
}

bool Config::load(const std::string& filename, std::ostream& log) {
    parseFile(filename);

    // Load database configuration
    db_host = getValue("db_host", db_host);
    db_port = getValueInt("db_port", db_port);
    db_name = getValue("db_name", db_name);
    db_user = getValue("db_user", db_user);
    db_password = getValue("db_password", db_password);

    // Load quality thresholds
    blur_threshold = getValueFloat("blur_threshold", blur_threshold);
    light_threshold = getValueFloat("light_threshold", light_threshold);

    // Load ingestion settings
    ingest_workers = getValueInt("ingest_workers", ingest_workers);
    rescan_interval_days = getValueFloat("rescan_interval_days", rescan_interval_days);

    // Load storage settings
    storage_backend = getValue("storage_backend", storage_backend);
    storage_root = getValue("storage_root", storage_root);
    s3_bucket = getValue("s3_bucket", s3_bucket);
    s3_region = getValue("s3_region", s3_region);
    s3_endpoint = getValue("s3_endpoint", s3_endpoint);
    s3_public_base_url = getValue("s3_public_base_url", s3_public_base_url);
    s3_access_key_id = getValue("s3_access_key_id", s3_access_key_id);
    s3_secret_access_key = getValue("s3_secret_access_key", s3_secret_access_key);

    // Load server settings
    server_host = getValue("server_host", server_host);
    server_port = getValueInt("server_port", server_port);

    applyEnvironment();

    log << "Configuration loaded successfully" << std::endl;
    log << "Database: " << db_host << ":" << db_port << "/" << db_name << std::endl;
    log << "Storage: " << storage_backend << " ("
        << (storage_backend == "file" ? storage_root : s3_bucket) << ")" << std::endl;
    log << "Thresholds: blur " << blur_threshold << ", light " << light_threshold << std::endl;

    return true;
}

void Config::applyEnvironment() {
    if (const char* v = envOrNull("BLUR_THRESHOLD")) {
        try {
            blur_threshold = std::stof(v);
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid float value for BLUR_THRESHOLD" << std::endl;
        }
    }
    if (const char* v = envOrNull("LIGHT_THRESHOLD")) {
        try {
            light_threshold = std::stof(v);
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid float value for LIGHT_THRESHOLD" << std::endl;
        }
    }
    if (const char* v = envOrNull("S3_BUCKET")) s3_bucket = v;
    if (const char* v = envOrNull("S3_REGION")) s3_region = v;
    if (const char* v = envOrNull("S3_ENDPOINT")) s3_endpoint = v;
    if (const char* v = envOrNull("S3_PUBLIC_BASE_URL")) s3_public_base_url = v;
    if (const char* v = envOrNull("S3_ACCESS_KEY_ID")) s3_access_key_id = v;
    if (const char* v = envOrNull("S3_SECRET_ACCESS_KEY")) s3_secret_access_key = v;
}
