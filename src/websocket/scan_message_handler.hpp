#ifndef SCAN_MESSAGE_HANDLER_HPP
#define SCAN_MESSAGE_HANDLER_HPP

#include <atomic>
#include <memory>
#include <string>

#include "../ingest/ingestion_orchestrator.hpp"
#include "../ingest/upload_target_issuer.hpp"
#include "../utils/scan_json.hpp"

// Statistics structure
struct ServerStats {
    std::atomic<uint64_t> messages_processed{0};
    std::atomic<uint64_t> scans_created{0};
    std::atomic<uint64_t> upload_targets_issued{0};
    std::atomic<uint64_t> ingestions_run{0};
    std::atomic<uint64_t> scans_complete{0};
    std::atomic<uint64_t> scans_rejected{0};
    std::atomic<uint64_t> errors{0};

    json toJSON() const;
};

// Translates one JSON request into calls on the ingestion components.
//
// Requests are objects with a "type" field:
//   create_scan      {patient_id, captured_at?, angles: [{angle, checksum?}]}
//   get_scan         {scan_id}
//   list_scans       {patient_id}
//   upload_targets   {scan_id, items: [{angle, content_type, checksum?}]}
//   upload_complete  {scan_id}            runs an ingestion pass
//   needs_scan       {patient_id, threshold_days?}
//   get_stats        {}
class ScanMessageHandler {
public:
    ScanMessageHandler(std::shared_ptr<ScanStore> store,
                       std::shared_ptr<UploadTargetIssuer> issuer,
                       std::shared_ptr<IngestionOrchestrator> orchestrator,
                       double rescan_interval_days,
                       ServerStats& stats);

    // Never throws; failures become {"type": "error"} replies.
    std::string processMessage(const std::string& message);

private:
    json handle(const std::string& type, const json& data);

    json createScan(const json& data);
    json getScan(const json& data);
    json listScans(const json& data);
    json uploadTargets(const json& data);
    json uploadComplete(const json& data);
    json needsScan(const json& data);

    static std::string buildResultResponse(const std::string& request, const json& payload);
    static std::string buildErrorResponse(const std::string& request,
                                          const std::string& error_message,
                                          const std::string& code);

    std::shared_ptr<ScanStore> store_;
    std::shared_ptr<UploadTargetIssuer> issuer_;
    std::shared_ptr<IngestionOrchestrator> orchestrator_;
    double rescan_interval_days_;
    ServerStats& stats_;
};

#endif // SCAN_MESSAGE_HANDLER_HPP
