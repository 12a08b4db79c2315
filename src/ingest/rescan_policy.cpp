#include "rescan_policy.hpp"

#include <algorithm>

bool patientNeedsScan(ScanStore& store,
                      const std::string& patient_id,
                      double threshold_days,
                      Clock::time_point now) {
    std::vector<Scan> scans = store.listScans(patient_id);
    if (scans.empty()) {
        return true;
    }

    Clock::time_point newest = parseIso8601(scans.front().captured_at);
    for (const auto& scan : scans) {
        newest = std::max(newest, parseIso8601(scan.captured_at));
    }

    std::chrono::duration<double, std::ratio<86400>> elapsed = now - newest;
    return elapsed.count() > threshold_days;
}
