#pragma once
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "intake_core/logging/logger_factory.hpp"
#include "server.hpp"

// Forward declarations
namespace intake_core {
class IngestionPipeline;
class IngestionLogStore;
}  // namespace intake_core

namespace intake_api {

class Routes {
 public:
  Routes(std::shared_ptr<intake_core::IngestionPipeline> pipeline,
         std::shared_ptr<intake_core::IngestionLogStore> log_store,
         std::filesystem::path upload_directory,
         int default_history_limit,
         intake_core::LoggerPtr logger);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Base name of an uploaded file, or nullopt when it cannot be stored safely
  static std::optional<std::string> safe_upload_name(const std::string &filename);

 private:
  std::shared_ptr<intake_core::IngestionPipeline> pipeline_;
  std::shared_ptr<intake_core::IngestionLogStore> log_store_;
  std::filesystem::path upload_directory_;
  int default_history_limit_;
  intake_core::LoggerPtr logger_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_upload(const crow::request &req);
  crow::response handle_get_metadata(const crow::request &req);
  crow::response handle_get_logs(const crow::request &req);
  crow::response handle_trigger_ingestion(const crow::request &req);

  // Helper methods
  nlohmann::json create_success_response(const std::string &message);
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace intake_api
