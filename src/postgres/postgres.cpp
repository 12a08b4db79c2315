#include "postgres.hpp"

#include <iostream>

#include "../utils/scan_json.hpp"
#include "../utils/time_utils.hpp"

namespace {

const char* kScanColumns =
    "SELECT id, patient_id, "
    "to_char(captured_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"') AS captured_at, "
    "status, quality_flags, missing_angles "
    "FROM scan ";

std::vector<std::string> anglesToStrings(const std::vector<ScanAngle>& angles) {
    std::vector<std::string> out;
    for (ScanAngle angle : angles) {
        out.push_back(toString(angle));
    }
    return out;
}

std::vector<ScanAngle> stringsToAngles(const std::vector<std::string>& names) {
    std::vector<ScanAngle> out;
    for (const auto& name : names) {
        out.push_back(parseAngle(name));
    }
    return out;
}

template <typename T>
std::optional<T> optionalField(const pqxx::row& row, const char* column) {
    if (row[column].is_null()) {
        return std::nullopt;
    }
    return row[column].as<T>();
}

Scan scanFromRow(const pqxx::row& row) {
    Scan scan;
    scan.id = row["id"].as<std::string>();
    scan.patient_id = row["patient_id"].as<std::string>();
    scan.captured_at = row["captured_at"].as<std::string>();
    scan.status = parseStatus(row["status"].as<std::string>());
    scan.quality_flags = pgarray2vec(row["quality_flags"].as<std::string>());
    scan.missing_angles = stringsToAngles(pgarray2vec(row["missing_angles"].as<std::string>()));
    return scan;
}

ScanImage imageFromRow(const pqxx::row& row) {
    ScanImage image;
    image.scan_id = row["scan_id"].as<std::string>();
    image.angle = parseAngle(row["angle"].as<std::string>());
    image.storage_key = optionalField<std::string>(row, "storage_key");
    image.url = optionalField<std::string>(row, "url");
    image.checksum = optionalField<std::string>(row, "checksum");
    image.blur_score = optionalField<double>(row, "blur_score");
    image.light_score = optionalField<double>(row, "light_score");
    image.pose_ok = optionalField<bool>(row, "pose_ok");
    if (!row["landmarks"].is_null()) {
        image.landmarks = json::parse(row["landmarks"].as<std::string>()).get<Landmarks>();
    }
    return image;
}

} // namespace

Postgres::Postgres(
    const std::string& host,
    const int& port,
    const std::string& dbname,
    const std::string& user,
    const std::string& password
) : conn("host=" + host +
         " port=" + std::to_string(port) +
         " dbname=" + dbname +
         " user=" + user +
         " password=" + password) {
}

Postgres::~Postgres() {
    conn.close();
}

void Postgres::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    pqxx::work txn(conn);
    txn.exec(
        "CREATE TABLE IF NOT EXISTS scan ("
        "  id TEXT PRIMARY KEY,"
        "  patient_id TEXT NOT NULL,"
        "  captured_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
        "  status TEXT NOT NULL DEFAULT 'pending',"
        "  quality_flags TEXT[] NOT NULL DEFAULT '{}',"
        "  missing_angles TEXT[] NOT NULL DEFAULT '{}'"
        ")"
    );
    txn.exec(
        "CREATE TABLE IF NOT EXISTS scan_image ("
        "  id BIGSERIAL PRIMARY KEY,"
        "  scan_id TEXT NOT NULL REFERENCES scan(id) ON DELETE CASCADE,"
        "  angle TEXT NOT NULL,"
        "  storage_key TEXT,"
        "  url TEXT,"
        "  checksum TEXT,"
        "  blur_score DOUBLE PRECISION,"
        "  light_score DOUBLE PRECISION,"
        "  pose_ok BOOLEAN,"
        "  landmarks JSONB,"
        "  UNIQUE (scan_id, angle)"
        ")"
    );
    txn.exec("CREATE INDEX IF NOT EXISTS scan_patient_idx ON scan (patient_id, captured_at DESC)");
    txn.commit();
}

void Postgres::require_scan(pqxx::work& txn, const std::string& scan_id) {
    pqxx::result r = txn.exec_params("SELECT 1 FROM scan WHERE id = $1", scan_id);
    if (r.empty()) {
        throw ScanNotFound(scan_id);
    }
}

Scan Postgres::load_scan(pqxx::work& txn, const std::string& scan_id) {
    pqxx::result r = txn.exec_params(std::string(kScanColumns) + "WHERE id = $1", scan_id);
    if (r.empty()) {
        throw ScanNotFound(scan_id);
    }
    Scan scan = scanFromRow(r[0]);

    pqxx::result images = txn.exec_params(
        "SELECT scan_id, angle, storage_key, url, checksum, "
        "blur_score, light_score, pose_ok, landmarks::text AS landmarks "
        "FROM scan_image WHERE scan_id = $1 ORDER BY id",
        scan_id
    );
    for (const auto& row : images) {
        scan.images.push_back(imageFromRow(row));
    }
    return scan;
}

Scan Postgres::createScan(const NewScan& input) {
    std::vector<ScanAngle> declared;
    for (const auto& angle : input.angles) {
        declared.push_back(angle.angle);
    }
    const std::string scan_id = generateScanId();
    std::optional<std::string> captured_at;
    if (input.captured_at) {
        captured_at = formatIso8601(parseIso8601(*input.captured_at));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    pqxx::work txn(conn);
    txn.exec_params(
        "INSERT INTO scan(id, patient_id, captured_at, status, missing_angles) "
        "VALUES ($1, $2, COALESCE($3::timestamptz, now()), $4, $5::text[])",
        scan_id,
        input.patient_id,
        captured_at,
        toString(ScanStatus::Pending),
        vec2pgarray(anglesToStrings(computeMissingAngles(declared)))
    );
    for (const auto& angle : input.angles) {
        txn.exec_params(
            "INSERT INTO scan_image(scan_id, angle, checksum) VALUES ($1, $2, $3) "
            "ON CONFLICT (scan_id, angle) DO UPDATE SET checksum = EXCLUDED.checksum",
            scan_id,
            toString(angle.angle),
            angle.checksum
        );
    }
    Scan scan = load_scan(txn, scan_id);
    txn.commit();
    return scan;
}

std::optional<Scan> Postgres::findScan(const std::string& scan_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pqxx::work txn(conn);
    try {
        Scan scan = load_scan(txn, scan_id);
        txn.commit();
        return scan;
    } catch (const ScanNotFound&) {
        return std::nullopt;
    }
}

std::vector<Scan> Postgres::listScans(const std::string& patient_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pqxx::work txn(conn);
    pqxx::result r = txn.exec_params(
        "SELECT id FROM scan WHERE patient_id = $1 ORDER BY captured_at DESC",
        patient_id
    );
    std::vector<Scan> scans;
    for (const auto& row : r) {
        scans.push_back(load_scan(txn, row["id"].as<std::string>()));
    }
    txn.commit();
    return scans;
}

void Postgres::upsertImage(const std::string& scan_id,
                           ScanAngle angle,
                           const std::string& storage_key,
                           const std::string& url,
                           const std::optional<std::string>& checksum) {
    std::lock_guard<std::mutex> lock(mutex_);
    pqxx::work txn(conn);
    require_scan(txn, scan_id);
    txn.exec_params(
        "INSERT INTO scan_image(scan_id, angle, storage_key, url, checksum) "
        "VALUES ($1, $2, $3, $4, $5) "
        "ON CONFLICT (scan_id, angle) DO UPDATE SET "
        "storage_key = EXCLUDED.storage_key, url = EXCLUDED.url, checksum = EXCLUDED.checksum",
        scan_id,
        toString(angle),
        storage_key,
        url,
        checksum
    );
    txn.commit();
}

void Postgres::updateImageAnalysis(const std::string& scan_id,
                                   ScanAngle angle,
                                   const QualityReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    pqxx::work txn(conn);
    pqxx::result r = txn.exec_params(
        "UPDATE scan_image SET blur_score = $3, light_score = $4, pose_ok = $5, landmarks = $6::jsonb "
        "WHERE scan_id = $1 AND angle = $2",
        scan_id,
        toString(angle),
        report.blur_score,
        report.light_score,
        report.pose_ok,
        json(report.landmarks).dump()
    );
    if (r.affected_rows() == 0) {
        throw std::runtime_error("No " + toString(angle) + " image recorded for scan " + scan_id);
    }
    txn.commit();
}

void Postgres::updateMissingAngles(const std::string& scan_id,
                                   const std::vector<ScanAngle>& missing_angles) {
    std::lock_guard<std::mutex> lock(mutex_);
    pqxx::work txn(conn);
    pqxx::result r = txn.exec_params(
        "UPDATE scan SET missing_angles = $2::text[] WHERE id = $1",
        scan_id,
        vec2pgarray(anglesToStrings(missing_angles))
    );
    if (r.affected_rows() == 0) {
        throw ScanNotFound(scan_id);
    }
    txn.commit();
}

Scan Postgres::updateScanState(const std::string& scan_id,
                               const QualityFlags& flags,
                               const std::vector<ScanAngle>& missing_angles,
                               ScanStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    pqxx::work txn(conn);
    pqxx::result r = txn.exec_params(
        "UPDATE scan SET quality_flags = $2::text[], missing_angles = $3::text[], status = $4 "
        "WHERE id = $1",
        scan_id,
        vec2pgarray(flags.values()),
        vec2pgarray(anglesToStrings(missing_angles)),
        toString(status)
    );
    if (r.affected_rows() == 0) {
        throw ScanNotFound(scan_id);
    }
    Scan scan = load_scan(txn, scan_id);
    txn.commit();
    return scan;
}
