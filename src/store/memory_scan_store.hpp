#ifndef MEMORY_SCAN_STORE_HPP
#define MEMORY_SCAN_STORE_HPP

#include <map>
#include <mutex>

#include "scan_store.hpp"

// Process-local store. Every call takes the same lock, which gives the
// atomicity the ScanStore contract asks for.
class MemoryScanStore : public ScanStore {
public:
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

private:
    Scan& require(const std::string& scan_id);

    std::mutex mutex_;
    std::map<std::string, Scan> scans_;
};

#endif // MEMORY_SCAN_STORE_HPP
