#ifndef INGESTION_ORCHESTRATOR_HPP
#define INGESTION_ORCHESTRATOR_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../quality/quality_analyzer.hpp"
#include "../storage/object_storage.hpp"
#include "../store/scan_store.hpp"

struct ImageOutcome {
    ScanAngle angle = ScanAngle::Front;
    std::vector<std::string> flags;
    std::optional<QualityReport> report;
};

// Runs one ingestion pass over every recorded image of a scan: fetch, verify
// the declared checksum, score, persist, then derive the scan status.
//
// A problem with one image becomes a flag on the scan and never stops the
// other images from being processed. Flags are rebuilt from scratch on every
// pass.
class IngestionOrchestrator {
public:
    // `workers` bounds how many images are fetched and scored at once;
    // 1 processes them one after another. Capped at the number of angles.
    IngestionOrchestrator(std::shared_ptr<ScanStore> store,
                          std::shared_ptr<ObjectStorage> storage,
                          QualityAnalyzer analyzer,
                          int workers = 1);

    // Throws ScanNotFound. Returns the scan as persisted by this pass.
    Scan ingest(const std::string& scan_id);

    // Steps that need no store access; safe to run concurrently.
    ImageOutcome processImage(const ScanImage& image);

    int workers() const { return workers_; }

private:
    std::shared_ptr<ScanStore> store_;
    std::shared_ptr<ObjectStorage> storage_;
    QualityAnalyzer analyzer_;
    int workers_;
};

#endif // INGESTION_ORCHESTRATOR_HPP
