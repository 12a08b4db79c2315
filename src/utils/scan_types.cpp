#include "scan_types.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <mutex>

std::string toString(ScanAngle angle) {
    switch (angle) {
        case ScanAngle::Front: return "front";
        case ScanAngle::Left: return "left";
        case ScanAngle::Right: return "right";
        case ScanAngle::Left45: return "left45";
        case ScanAngle::Right45: return "right45";
    }
    return "unknown";
}

std::string toString(ScanStatus status) {
    switch (status) {
        case ScanStatus::Pending: return "pending";
        case ScanStatus::Processing: return "processing";
        case ScanStatus::Complete: return "complete";
        case ScanStatus::Rejected: return "rejected";
    }
    return "unknown";
}

std::string makeFlag(const std::string& kind, ScanAngle angle) {
    return kind + ":" + toString(angle);
}

std::string generateScanId() {
    static std::mutex mutex;
    static boost::uuids::random_generator generator;
    std::lock_guard<std::mutex> lock(mutex);
    return boost::uuids::to_string(generator());
}

ScanAngle parseAngle(const std::string& name) {
    for (ScanAngle angle : kRequiredAngles) {
        if (toString(angle) == name) {
            return angle;
        }
    }
    throw std::invalid_argument("Unknown scan angle: " + name);
}

ScanStatus parseStatus(const std::string& name) {
    if (name == "pending") return ScanStatus::Pending;
    if (name == "processing") return ScanStatus::Processing;
    if (name == "complete") return ScanStatus::Complete;
    if (name == "rejected") return ScanStatus::Rejected;
    throw std::invalid_argument("Unknown scan status: " + name);
}

QualityFlags::QualityFlags(const std::vector<std::string>& flags) {
    for (const auto& flag : flags) {
        add(flag);
    }
}

void QualityFlags::add(const std::string& flag) {
    if (seen_.insert(flag).second) {
        ordered_.push_back(flag);
    }
}

void QualityFlags::add(const std::string& kind, ScanAngle angle) {
    add(makeFlag(kind, angle));
}

bool QualityFlags::contains(const std::string& flag) const {
    return seen_.count(flag) > 0;
}

bool QualityFlags::hasPrefix(const std::string& prefix) const {
    return std::any_of(ordered_.begin(), ordered_.end(), [&prefix](const std::string& flag) {
        return flag.compare(0, prefix.size(), prefix) == 0;
    });
}

const ScanImage* Scan::findImage(ScanAngle angle) const {
    for (const auto& image : images) {
        if (image.angle == angle) {
            return &image;
        }
    }
    return nullptr;
}

std::vector<ScanAngle> computeMissingAngles(const std::vector<ScanAngle>& present) {
    std::vector<ScanAngle> missing;
    for (ScanAngle angle : kRequiredAngles) {
        if (std::find(present.begin(), present.end(), angle) == present.end()) {
            missing.push_back(angle);
        }
    }
    return missing;
}

std::vector<ScanAngle> computeMissingAngles(const std::vector<ScanImage>& images) {
    std::vector<ScanAngle> present;
    present.reserve(images.size());
    for (const auto& image : images) {
        present.push_back(image.angle);
    }
    return computeMissingAngles(present);
}
