#ifndef STATUS_RESOLVER_HPP
#define STATUS_RESOLVER_HPP

#include <vector>

#include "../utils/scan_types.hpp"

// A checksum mismatch rejects the scan; otherwise the scan is complete once
// every required angle is present. Blur, light and pose flags are advisory
// and never hold a scan back.
ScanStatus resolveStatus(const QualityFlags& flags, const std::vector<ScanAngle>& missing_angles);

#endif // STATUS_RESOLVER_HPP
