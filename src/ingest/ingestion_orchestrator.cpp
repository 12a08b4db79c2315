#include "ingestion_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>

#include "../quality/checksum_verifier.hpp"
#include "status_resolver.hpp"

IngestionOrchestrator::IngestionOrchestrator(std::shared_ptr<ScanStore> store,
                                             std::shared_ptr<ObjectStorage> storage,
                                             QualityAnalyzer analyzer,
                                             int workers)
    : store_(std::move(store)),
      storage_(std::move(storage)),
      analyzer_(analyzer),
      workers_(std::max(1, std::min(workers, static_cast<int>(kRequiredAngles.size())))) {
}

ImageOutcome IngestionOrchestrator::processImage(const ScanImage& image) {
    ImageOutcome outcome;
    outcome.angle = image.angle;

    if (!image.storage_key || image.storage_key->empty()) {
        outcome.flags.push_back(makeFlag("missing_storage", image.angle));
        return outcome;
    }

    try {
        std::optional<std::vector<uint8_t>> bytes = storage_->fetchObject(*image.storage_key);
        if (!bytes) {
            outcome.flags.push_back(makeFlag("missing_object", image.angle));
            return outcome;
        }

        if (ChecksumVerifier::verify(*bytes, image.checksum).mismatch) {
            outcome.flags.push_back(makeFlag("checksum_mismatch", image.angle));
        }

        QualityReport report = analyzer_.analyze(*bytes);
        if (report.blur_score < analyzer_.blurThreshold()) {
            outcome.flags.push_back(makeFlag("blur", image.angle));
        }
        if (report.light_score < analyzer_.lightThreshold()) {
            outcome.flags.push_back(makeFlag("low_light", image.angle));
        }
        if (!report.pose_ok) {
            outcome.flags.push_back(makeFlag("pose", image.angle));
        }
        outcome.report = report;
    } catch (const std::exception& e) {
        std::cerr << "Processing error for " << toString(image.angle)
                  << " (" << *image.storage_key << "): " << e.what() << std::endl;
        outcome.flags.push_back(makeFlag("processing_error", image.angle));
    }

    return outcome;
}

Scan IngestionOrchestrator::ingest(const std::string& scan_id) {
    auto start_time = std::chrono::steady_clock::now();

    std::optional<Scan> scan = store_->findScan(scan_id);
    if (!scan) {
        throw ScanNotFound(scan_id);
    }

    std::vector<ImageOutcome> outcomes;
    outcomes.reserve(scan->images.size());

    if (workers_ == 1) {
        for (const auto& image : scan->images) {
            outcomes.push_back(processImage(image));
        }
    } else {
        const size_t batch = static_cast<size_t>(workers_);
        for (size_t begin = 0; begin < scan->images.size(); begin += batch) {
            size_t end = std::min(begin + batch, scan->images.size());
            std::vector<std::future<ImageOutcome>> pending;
            for (size_t i = begin; i < end; ++i) {
                const ScanImage& image = scan->images[i];
                pending.push_back(std::async(std::launch::async, [this, &image]() {
                    return processImage(image);
                }));
            }
            for (auto& f : pending) {
                outcomes.push_back(f.get());
            }
        }
    }

    QualityFlags flags;
    for (const auto& outcome : outcomes) {
        for (const auto& flag : outcome.flags) {
            flags.add(flag);
        }
        if (!outcome.report) {
            continue;
        }
        try {
            store_->updateImageAnalysis(scan_id, outcome.angle, *outcome.report);
        } catch (const std::exception& e) {
            std::cerr << "Failed to store analysis for " << toString(outcome.angle)
                      << " of scan " << scan_id << ": " << e.what() << std::endl;
            flags.add("processing_error", outcome.angle);
        }
    }

    // Recorded angles, whether or not their bytes could be read.
    std::vector<ScanAngle> missing = computeMissingAngles(scan->images);
    for (ScanAngle angle : missing) {
        flags.add("missing_angle", angle);
    }

    ScanStatus status = resolveStatus(flags, missing);
    Scan updated = store_->updateScanState(scan_id, flags, missing, status);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    std::cout << "Ingested scan " << scan_id << ": " << scan->images.size() << " images, "
              << flags.size() << " flags, status " << toString(status)
              << " (" << duration.count() << " ms)" << std::endl;

    return updated;
}
