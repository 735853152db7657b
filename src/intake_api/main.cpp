#include <atomic>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "intake_api/config.hpp"
#include "intake_api/routes.hpp"
#include "intake_api/server.hpp"
#include "intake_core/db/database_manager.hpp"
#include "intake_core/db/ingestion_log_store.hpp"
#include "intake_core/detection/file_detector.hpp"
#include "intake_core/extractors/checksum.hpp"
#include "intake_core/extractors/extractor_factory.hpp"
#include "intake_core/logging/logger_factory.hpp"
#include "intake_core/pipeline/ingestion_pipeline.hpp"
#include "intake_core/services/metadata_extractor.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

namespace {
constexpr const char* kConfigFile = "intakerc.json";
constexpr int kReaderConnections = 4;
}  // namespace

int main() {
  try {
    Config config = std::filesystem::exists(kConfigFile) ? Config::from_file(kConfigFile)
                                                         : Config::from_json(nlohmann::json::object());

    std::filesystem::create_directories(config.log_directory);
    intake_core::LoggerPtr logger =
        intake_core::make_intake_logger(config.log_directory, config.log_level, "intake_api");

    logger->info("Starting Data Ingestion API Server...");
    logger->info("Server URL: {}", config.api_base_url);
    logger->info("Upload Directory: {}", config.upload_directory);
    logger->info("Log Directory: {}", config.log_directory);
    logger->info("Extraction Workers: {}", config.extraction_workers);

    std::filesystem::create_directories(config.upload_directory);

    // Initialize core components
    intake_core::DatabaseManager db_manager;
    db_manager.initialize(std::filesystem::path(config.log_directory) / "ingestion.db",
                          kReaderConnections);
    auto log_store = std::make_shared<intake_core::IngestionLogStore>(db_manager, logger);

    std::vector<std::filesystem::path> watch_directories(config.watch_directories.begin(),
                                                         config.watch_directories.end());
    auto detector = std::make_shared<intake_core::FileDetector>(watch_directories, logger);
    auto extractor_factory = std::make_shared<intake_core::ExtractorFactory>(
        intake_core::ExtractorOptions{.sample_rows = static_cast<std::size_t>(config.csv_sample_rows)});
    auto metadata_extractor = std::make_shared<intake_core::MetadataExtractor>(
        extractor_factory, intake_core::ChecksumCalculator(config.checksum_algorithm), logger);
    auto pipeline = std::make_shared<intake_core::IngestionPipeline>(
        detector, metadata_extractor, log_store, logger,
        intake_core::PipelineOptions{.extraction_workers = config.extraction_workers});

    intake_api::Server server(config.host(), config.port(), config.cors_origin);
    intake_api::Routes routes(pipeline, log_store, config.upload_directory,
                              config.default_history_limit, logger);
    routes.register_routes(server);

    logger->debug("Disabling Crow's internal signal handling...");
    server.get_app().signal_clear();

    server.start();
    logger->info("Server started successfully. Press Ctrl+C to exit.");

    // --- WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- GRACEFUL SHUTDOWN SEQUENCE ---
    logger->info("Shutdown signal received. Initiating graceful shutdown...");
    logger->info("[1/2] Stopping API server to refuse new requests...");
    server.stop();

    logger->info("[2/2] Shutting down database connections...");
    db_manager.shutdown();

    logger->info("Shutdown complete.");
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
