#ifndef SCAN_JSON_HPP
#define SCAN_JSON_HPP

#include <nlohmann/json.hpp>

#include "scan_types.hpp"

using json = nlohmann::json;

void to_json(json& j, const LandmarkPoint& point);
void from_json(const json& j, LandmarkPoint& point);
void to_json(json& j, const Landmarks& landmarks);
void from_json(const json& j, Landmarks& landmarks);
void to_json(json& j, const QualityReport& report);
void to_json(json& j, const ScanImage& image);
void to_json(json& j, const Scan& scan);

json anglesToJson(const std::vector<ScanAngle>& angles);

#endif // SCAN_JSON_HPP
