#ifndef RESCAN_POLICY_HPP
#define RESCAN_POLICY_HPP

#include <string>

#include "../store/scan_store.hpp"
#include "../utils/time_utils.hpp"

// True when the patient has never been scanned, or when the newest scan was
// captured more than `threshold_days` days before `now`.
bool patientNeedsScan(ScanStore& store,
                      const std::string& patient_id,
                      double threshold_days = 30.0,
                      Clock::time_point now = Clock::now());

#endif // RESCAN_POLICY_HPP
