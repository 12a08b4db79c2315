#include "status_resolver.hpp"

ScanStatus resolveStatus(const QualityFlags& flags, const std::vector<ScanAngle>& missing_angles) {
    if (flags.hasPrefix("checksum_mismatch")) {
        return ScanStatus::Rejected;
    }
    if (!missing_angles.empty()) {
        return ScanStatus::Processing;
    }
    return ScanStatus::Complete;
}
