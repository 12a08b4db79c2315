#include "scan_message_handler.hpp"

#include <iostream>
#include <stdexcept>

#include "../ingest/rescan_policy.hpp"

namespace {

class BadRequest : public std::runtime_error {
public:
    explicit BadRequest(const std::string& what) : std::runtime_error(what) {}
};

std::string requireString(const json& data, const char* field) {
    if (!data.contains(field) || !data[field].is_string() || data[field].get<std::string>().empty()) {
        throw BadRequest(std::string("Missing field: ") + field);
    }
    return data[field].get<std::string>();
}

std::optional<std::string> optionalString(const json& data, const char* field) {
    if (!data.contains(field) || data[field].is_null()) {
        return std::nullopt;
    }
    if (!data[field].is_string()) {
        throw BadRequest(std::string("Field must be a string: ") + field);
    }
    return data[field].get<std::string>();
}

ScanAngle requireAngle(const json& data) {
    std::string name = requireString(data, "angle");
    try {
        return parseAngle(name);
    } catch (const std::invalid_argument& e) {
        throw BadRequest(e.what());
    }
}

const json& requireArray(const json& data, const char* field) {
    if (!data.contains(field) || !data[field].is_array() || data[field].empty()) {
        throw BadRequest(std::string("Field must be a non-empty array: ") + field);
    }
    return data[field];
}

} // namespace

json ServerStats::toJSON() const {
    return json{
        {"messages_processed", messages_processed.load()},
        {"scans_created", scans_created.load()},
        {"upload_targets_issued", upload_targets_issued.load()},
        {"ingestions_run", ingestions_run.load()},
        {"scans_complete", scans_complete.load()},
        {"scans_rejected", scans_rejected.load()},
        {"errors", errors.load()}
    };
}

ScanMessageHandler::ScanMessageHandler(std::shared_ptr<ScanStore> store,
                                       std::shared_ptr<UploadTargetIssuer> issuer,
                                       std::shared_ptr<IngestionOrchestrator> orchestrator,
                                       double rescan_interval_days,
                                       ServerStats& stats)
    : store_(std::move(store)),
      issuer_(std::move(issuer)),
      orchestrator_(std::move(orchestrator)),
      rescan_interval_days_(rescan_interval_days),
      stats_(stats) {
}

std::string ScanMessageHandler::processMessage(const std::string& message) {
    stats_.messages_processed++;
    std::string type;
    try {
        json data = json::parse(message);
        if (!data.is_object()) {
            throw BadRequest("Message must be a JSON object");
        }
        type = data.value("type", "");
        return buildResultResponse(type, handle(type, data));

    } catch (const ScanNotFound& e) {
        stats_.errors++;
        return buildErrorResponse(type, e.what(), "not_found");
    } catch (const BadRequest& e) {
        stats_.errors++;
        return buildErrorResponse(type, e.what(), "bad_request");
    } catch (const json::exception& e) {
        stats_.errors++;
        return buildErrorResponse(type, std::string("Invalid JSON: ") + e.what(), "bad_request");
    } catch (const std::exception& e) {
        stats_.errors++;
        std::cerr << "Message processing error: " << e.what() << std::endl;
        return buildErrorResponse(type, std::string("Processing error: ") + e.what(), "internal");
    }
}

json ScanMessageHandler::handle(const std::string& type, const json& data) {
    if (type == "create_scan") return createScan(data);
    if (type == "get_scan") return getScan(data);
    if (type == "list_scans") return listScans(data);
    if (type == "upload_targets") return uploadTargets(data);
    if (type == "upload_complete") return uploadComplete(data);
    if (type == "needs_scan") return needsScan(data);
    if (type == "get_stats") return stats_.toJSON();
    throw BadRequest("Unknown message type");
}

json ScanMessageHandler::createScan(const json& data) {
    NewScan input;
    input.patient_id = requireString(data, "patient_id");
    input.captured_at = optionalString(data, "captured_at");
    if (input.captured_at) {
        try {
            parseIso8601(*input.captured_at);
        } catch (const std::invalid_argument& e) {
            throw BadRequest(e.what());
        }
    }
    for (const auto& item : requireArray(data, "angles")) {
        input.angles.push_back({requireAngle(item), optionalString(item, "checksum")});
    }

    Scan scan = store_->createScan(input);
    stats_.scans_created++;
    return scan;
}

json ScanMessageHandler::getScan(const json& data) {
    std::string scan_id = requireString(data, "scan_id");
    std::optional<Scan> scan = store_->findScan(scan_id);
    if (!scan) {
        throw ScanNotFound(scan_id);
    }
    return *scan;
}

json ScanMessageHandler::listScans(const json& data) {
    return store_->listScans(requireString(data, "patient_id"));
}

json ScanMessageHandler::uploadTargets(const json& data) {
    std::string scan_id = requireString(data, "scan_id");
    std::vector<UploadRequest> items;
    for (const auto& item : requireArray(data, "items")) {
        UploadRequest request;
        request.angle = requireAngle(item);
        request.content_type = requireString(item, "content_type");
        request.checksum = optionalString(item, "checksum");
        items.push_back(request);
    }

    json out = json::array();
    for (const auto& result : issuer_->issue(scan_id, items)) {
        out.push_back({
            {"angle", toString(result.angle)},
            {"uploadUrl", result.target.url},
            {"method", result.target.method},
            {"headers", result.target.headers},
            {"expiresIn", result.target.expires_in_seconds},
            {"storageKey", result.storage_key},
            {"url", result.display_url}
        });
    }
    stats_.upload_targets_issued += items.size();
    return out;
}

json ScanMessageHandler::uploadComplete(const json& data) {
    Scan scan = orchestrator_->ingest(requireString(data, "scan_id"));
    stats_.ingestions_run++;
    if (scan.status == ScanStatus::Complete) stats_.scans_complete++;
    if (scan.status == ScanStatus::Rejected) stats_.scans_rejected++;
    return scan;
}

json ScanMessageHandler::needsScan(const json& data) {
    std::string patient_id = requireString(data, "patient_id");
    double threshold = data.value("threshold_days", rescan_interval_days_);
    return json{
        {"patientId", patient_id},
        {"needsScan", patientNeedsScan(*store_, patient_id, threshold)}
    };
}

std::string ScanMessageHandler::buildResultResponse(const std::string& request, const json& payload) {
    json response = {
        {"type", "result"},
        {"request", request},
        {"data", payload}
    };
    return response.dump();
}

std::string ScanMessageHandler::buildErrorResponse(const std::string& request,
                                                   const std::string& error_message,
                                                   const std::string& code) {
    json response = {
        {"type", "error"},
        {"request", request},
        {"code", code},
        {"error", error_message}
    };
    return response.dump();
}
