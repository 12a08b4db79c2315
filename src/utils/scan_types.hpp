#ifndef SCAN_TYPES_HPP
#define SCAN_TYPES_HPP

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

enum class ScanAngle {
    Front,
    Left,
    Right,
    Left45,
    Right45
};

enum class ScanStatus {
    Pending,
    Processing,
    Complete,
    Rejected
};

// Every scan session must eventually hold one image per angle listed here.
constexpr std::array<ScanAngle, 5> kRequiredAngles = {
    ScanAngle::Front,
    ScanAngle::Left,
    ScanAngle::Right,
    ScanAngle::Left45,
    ScanAngle::Right45
};

// Validity window of upload targets handed to clients, in seconds.
constexpr int kUploadTargetTtlSeconds = 900;

class ScanNotFound : public std::runtime_error {
public:
    explicit ScanNotFound(const std::string& scan_id)
        : std::runtime_error("Scan not found: " + scan_id), scan_id_(scan_id) {}

    const std::string& scanId() const { return scan_id_; }

private:
    std::string scan_id_;
};

std::string toString(ScanAngle angle);
std::string toString(ScanStatus status);

// "<kind>:<angle>", e.g. blur:left45
std::string makeFlag(const std::string& kind, ScanAngle angle);

// Random UUID string.
std::string generateScanId();

// Both throw std::invalid_argument on an unknown name.
ScanAngle parseAngle(const std::string& name);
ScanStatus parseStatus(const std::string& name);

struct LandmarkPoint {
    std::string name;
    float x;
    float y;
};

struct Landmarks {
    bool estimated = true;
    std::vector<LandmarkPoint> points;
};

struct QualityReport {
    double blur_score = 0.0;
    double light_score = 0.0;
    bool pose_ok = false;
    Landmarks landmarks;
};

struct ScanImage {
    std::string scan_id;
    ScanAngle angle = ScanAngle::Front;
    std::optional<std::string> storage_key;
    std::optional<std::string> url;
    std::optional<std::string> checksum;
    std::optional<double> blur_score;
    std::optional<double> light_score;
    std::optional<bool> pose_ok;
    std::optional<Landmarks> landmarks;
};

// Insertion-ordered set of flag strings. Re-adding an existing flag is a no-op.
class QualityFlags {
public:
    QualityFlags() = default;
    explicit QualityFlags(const std::vector<std::string>& flags);

    void add(const std::string& flag);
    void add(const std::string& kind, ScanAngle angle);
    bool contains(const std::string& flag) const;
    bool hasPrefix(const std::string& prefix) const;
    bool empty() const { return ordered_.empty(); }
    size_t size() const { return ordered_.size(); }
    const std::vector<std::string>& values() const { return ordered_; }

private:
    std::vector<std::string> ordered_;
    std::unordered_set<std::string> seen_;
};

struct Scan {
    std::string id;
    std::string patient_id;
    std::string captured_at;  // ISO-8601, UTC
    ScanStatus status = ScanStatus::Pending;
    std::vector<std::string> quality_flags;
    std::vector<ScanAngle> missing_angles;
    std::vector<ScanImage> images;

    const ScanImage* findImage(ScanAngle angle) const;
};

// Required angles with no image among `present`, in required-angle order.
std::vector<ScanAngle> computeMissingAngles(const std::vector<ScanAngle>& present);
std::vector<ScanAngle> computeMissingAngles(const std::vector<ScanImage>& images);

#endif // SCAN_TYPES_HPP
