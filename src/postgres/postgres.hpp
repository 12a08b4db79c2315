#pragma once

#include <pqxx/pqxx>

#include <mutex>

#include "../store/scan_store.hpp"
#include "utils.hpp"

// ScanStore over a single PostgreSQL connection. Calls are serialized; each
// one runs in its own transaction.
class Postgres : public ScanStore {
    private:
        pqxx::connection conn;
        std::mutex mutex_;

        Scan load_scan(pqxx::work& txn, const std::string& scan_id);
        void require_scan(pqxx::work& txn, const std::string& scan_id);

    public:
        Postgres(
            const std::string& host,
            const int& port,
            const std::string& dbname,
            const std::string& user,
            const std::string& password
        );

        ~Postgres();

        // Creates the scan and scan_image tables when they do not exist.
        void ensure_schema();

        Scan createScan(const NewScan& scan) override;
        std::optional<Scan> findScan(const std::string& scan_id) override;
        std::vector<Scan> listScans(const std::string& patient_id) override;

        void upsertImage(const std::string& scan_id,
                         ScanAngle angle,
                         const std::string& storage_key,
                         const std::string& url,
                         const std::optional<std::string>& checksum) override;

        void updateImageAnalysis(const std::string& scan_id,
                                 ScanAngle angle,
                                 const QualityReport& report) override;

        void updateMissingAngles(const std::string& scan_id,
                                 const std::vector<ScanAngle>& missing_angles) override;

        Scan updateScanState(const std::string& scan_id,
                             const QualityFlags& flags,
                             const std::vector<ScanAngle>& missing_angles,
                             ScanStatus status) override;
};
