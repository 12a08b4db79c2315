#include "scan_json.hpp"

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return json(*value);
}

} // namespace

void to_json(json& j, const LandmarkPoint& point) {
    j = json{{"name", point.name}, {"x", point.x}, {"y", point.y}};
}

void from_json(const json& j, LandmarkPoint& point) {
    j.at("name").get_to(point.name);
    j.at("x").get_to(point.x);
    j.at("y").get_to(point.y);
}

void to_json(json& j, const Landmarks& landmarks) {
    j = json{{"estimated", landmarks.estimated}, {"points", landmarks.points}};
}

void from_json(const json& j, Landmarks& landmarks) {
    landmarks.estimated = j.value("estimated", true);
    landmarks.points = j.value("points", std::vector<LandmarkPoint>{});
}

void to_json(json& j, const QualityReport& report) {
    j = json{
        {"blurScore", report.blur_score},
        {"lightScore", report.light_score},
        {"poseOk", report.pose_ok},
        {"landmarks", report.landmarks}
    };
}

void to_json(json& j, const ScanImage& image) {
    j = json{
        {"scanId", image.scan_id},
        {"angle", toString(image.angle)},
        {"storageKey", optionalToJson(image.storage_key)},
        {"url", optionalToJson(image.url)},
        {"checksum", optionalToJson(image.checksum)},
        {"blurScore", optionalToJson(image.blur_score)},
        {"lightScore", optionalToJson(image.light_score)},
        {"poseOk", optionalToJson(image.pose_ok)},
        {"landmarks", optionalToJson(image.landmarks)}
    };
}

void to_json(json& j, const Scan& scan) {
    j = json{
        {"id", scan.id},
        {"patientId", scan.patient_id},
        {"capturedAt", scan.captured_at},
        {"status", toString(scan.status)},
        {"qualityFlags", scan.quality_flags},
        {"missingAngles", anglesToJson(scan.missing_angles)},
        {"images", scan.images}
    };
}

json anglesToJson(const std::vector<ScanAngle>& angles) {
    json out = json::array();
    for (ScanAngle angle : angles) {
        out.push_back(toString(angle));
    }
    return out;
}
