#include "config/Settings.hpp"
#include "domain/aggregates/AssetClassRegistry.hpp"
#include "domain/aggregates/RecyclingLedger.hpp"
#include "infrastructure/AssetClassDirectory.hpp"
#include "infrastructure/JsonLinesEventSink.hpp"
#include "infrastructure/ScriptRunner.hpp"
#include "infrastructure/SingleAdminAuthorizer.hpp"
#include "infrastructure/SystemClock.hpp"
#include "repositories/ILedgerRepository.hpp"
#include "repositories/InMemoryLedgerRepository.hpp"
#include "services/BatchCoordinator.hpp"
#include "services/ExchangeGate.hpp"
#include "services/QueryService.hpp"
#include "services/RecycleProcessor.hpp"
#include "services/RegistryService.hpp"
#include "services/StateRestore.hpp"

#ifdef RCY_HAS_PARQUET
#include "repositories/parquet/ParquetLedgerRepository.hpp"
#endif

#include <fstream>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    try {
        auto settings = rcy::config::Settings::from_environment();

        // Optional CLI arg: command script (JSON lines); stdin otherwise
        std::ifstream script_file;
        if (argc >= 2) {
            script_file.open(argv[1]);
            if (!script_file) {
                std::cerr << "Usage: recycling_engine [script.jsonl]" << std::endl;
                std::cerr << "Cannot open script: " << argv[1] << std::endl;
                return 1;
            }
        }
        std::istream& script = argc >= 2 ? static_cast<std::istream&>(script_file) : std::cin;

        std::unique_ptr<rcy::repositories::ILedgerRepository> repo;

        if (settings.storage.backend == "parquet") {
#ifdef RCY_HAS_PARQUET
            auto fs = rcy::repositories::pq::ParquetLedgerRepository::make_local_fs(
                settings.storage.data_directory);
            repo = std::make_unique<rcy::repositories::pq::ParquetLedgerRepository>(
                fs, settings.storage);
#else
            std::cerr << "Parquet backend requested but not compiled in. "
                      << "Rebuild with Apache Arrow installed." << std::endl;
            return 1;
#endif
        } else {
            repo = std::make_unique<rcy::repositories::InMemoryLedgerRepository>();
        }

        std::unique_ptr<rcy::infrastructure::JsonLinesEventSink> events;
        if (settings.events.event_log_path.empty()) {
            events = std::make_unique<rcy::infrastructure::JsonLinesEventSink>(std::cout);
        } else {
            events = rcy::infrastructure::JsonLinesEventSink::open_file(settings.events.event_log_path);
        }

        rcy::domain::ActorId admin(settings.admin.admin_id);
        rcy::domain::ActorId custody(settings.admin.custody_id);

        rcy::domain::AssetClassRegistry registry(
            rcy::domain::Points(settings.registry.max_points_per_unit));
        rcy::domain::RecyclingLedger ledger;

        auto restored = rcy::services::restore_state(*repo, registry, ledger);
        std::cout << "[storage] Restored " << restored.classes << " asset classes and "
                  << restored.records << " records from " << settings.storage.backend
                  << " backend" << std::endl;

        rcy::infrastructure::AssetClassDirectory directory;
        rcy::infrastructure::SingleAdminAuthorizer authorizer(admin);
        rcy::infrastructure::SystemClock clock;
        rcy::services::ExchangeGate gate;

        rcy::services::RegistryService registry_service(
            registry, *repo, directory, authorizer, gate, *events, clock);
        rcy::services::RecycleProcessor processor(
            registry, ledger, *repo, directory, authorizer, gate, *events, clock, custody);
        rcy::services::BatchCoordinator batches(processor, gate, *events, clock);
        rcy::services::QueryService queries(registry, ledger, directory, gate, custody);

        std::cout << "[engine] Started (admin=" << admin.value()
                  << ", custody=" << custody.value() << ")" << std::endl;

        rcy::infrastructure::ScriptRunner runner(
            directory, registry_service, processor, batches, queries, std::cout);
        auto summary = runner.run(script);

        auto stats = queries.get_stats();
        std::cout << "[engine] Done. Executed " << summary.executed << " commands ("
                  << summary.failed << " failed); total_recyclings=" << stats.total_recyclings
                  << " total_points=" << stats.total_points_generated.amount()
                  << " active_classes=" << stats.active_class_count << std::endl;
        return summary.failed == 0 ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "[engine] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
