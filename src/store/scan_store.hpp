#ifndef SCAN_STORE_HPP
#define SCAN_STORE_HPP

#include <optional>
#include <string>
#include <vector>

#include "../utils/scan_types.hpp"

struct AngleDeclaration {
    ScanAngle angle;
    std::optional<std::string> checksum;
};

struct NewScan {
    std::string patient_id;
    std::optional<std::string> captured_at;  // defaults to now
    std::vector<AngleDeclaration> angles;
};

// Durable record store for scans and their angle images.
//
// Mutating calls on an unknown scan id throw ScanNotFound. Implementations
// must make upsertImage and updateScanState atomic.
class ScanStore {
public:
    virtual ~ScanStore() = default;

    virtual Scan createScan(const NewScan& scan) = 0;

    // Scan with all its images, or std::nullopt.
    virtual std::optional<Scan> findScan(const std::string& scan_id) = 0;

    // Newest capturedAt first.
    virtual std::vector<Scan> listScans(const std::string& patient_id) = 0;

    // Inserts or replaces the metadata of the (scan, angle) image. Analysis
    // results of an existing row are kept.
    virtual void upsertImage(const std::string& scan_id,
                             ScanAngle angle,
                             const std::string& storage_key,
                             const std::string& url,
                             const std::optional<std::string>& checksum) = 0;

    virtual void updateImageAnalysis(const std::string& scan_id,
                                     ScanAngle angle,
                                     const QualityReport& report) = 0;

    virtual void updateMissingAngles(const std::string& scan_id,
                                     const std::vector<ScanAngle>& missing_angles) = 0;

    // Writes flags, missing angles and status together.
    virtual Scan updateScanState(const std::string& scan_id,
                                 const QualityFlags& flags,
                                 const std::vector<ScanAngle>& missing_angles,
                                 ScanStatus status) = 0;
};

#endif // SCAN_STORE_HPP
