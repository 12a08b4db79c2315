#include "src/ingest/ingestion_orchestrator.hpp"
#include "src/postgres/postgres.hpp"
#include "src/storage/storage_factory.hpp"
#include "src/utils/config.hpp"
#include "src/utils/scan_json.hpp"

//// ./build/ingest_scan <scan_id> [config.ini]

int main(int argc, char **argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <scan_id> [config_file]" << std::endl;
        return 1;
    }
    std::string scan_id = argv[1];

    Config config;
    config.load(argc == 3 ? argv[2] : "config.ini", std::cerr);

    try {
        auto store = std::make_shared<Postgres>(
            config.db_host,
            config.db_port,
            config.db_name,
            config.db_user,
            config.db_password
        );
        store->ensure_schema();

        IngestionOrchestrator orchestrator(
            store,
            createStorage(config),
            QualityAnalyzer(config.blur_threshold, config.light_threshold),
            config.ingest_workers
        );
        Scan scan = orchestrator.ingest(scan_id);
        std::cout << json(scan).dump(2) << std::endl;
    }
    catch (const ScanNotFound& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }
    catch (const std::exception& e) {
        std::cerr << "Ingestion failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
