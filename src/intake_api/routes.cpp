#include "intake_api/routes.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "intake_core/db/ingestion_log_store.hpp"
#include "intake_core/pipeline/ingestion_pipeline.hpp"

namespace intake_api {
Routes::Routes(std::shared_ptr<intake_core::IngestionPipeline> pipeline,
               std::shared_ptr<intake_core::IngestionLogStore> log_store,
               std::filesystem::path upload_directory,
               int default_history_limit,
               intake_core::LoggerPtr logger)
    : pipeline_(std::move(pipeline)),
      log_store_(std::move(log_store)),
      upload_directory_(std::move(upload_directory)),
      default_history_limit_(default_history_limit),
      logger_(std::move(logger)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Upload endpoint, runs ingestion afterwards
  CROW_ROUTE(app, "/upload")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_upload(req); });

  CROW_ROUTE(app, "/metadata")
  ([this](const crow::request &req) { return handle_get_metadata(req); });

  CROW_ROUTE(app, "/logs")
  ([this](const crow::request &req) { return handle_get_logs(req); });

  CROW_ROUTE(app, "/trigger-ingestion")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_trigger_ingestion(req); });

  logger_->info("All routes registered successfully");
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response;
  response["status"] = "healthy";
  response["message"] = "Data Ingestion API is running";
  return create_json_response(response);
}

std::optional<std::string> Routes::safe_upload_name(const std::string &filename) {
  // Browsers on Windows may send the full client path
  const auto slash = filename.find_last_of("/\\");
  std::string base = slash == std::string::npos ? filename : filename.substr(slash + 1);
  if (base.empty() || base == "." || base == "..") {
    return std::nullopt;
  }
  if (base.find('\0') != std::string::npos) {
    return std::nullopt;
  }
  return base;
}

crow::response Routes::handle_upload(const crow::request &req) {
  const std::string content_type = req.get_header_value("Content-Type");
  if (content_type.rfind("multipart/form-data", 0) != 0) {
    return create_json_response(create_error_response("Expected multipart/form-data upload"), 400);
  }

  try {
    crow::multipart::message message(req);
    std::filesystem::create_directories(upload_directory_);

    nlohmann::json uploaded_files = nlohmann::json::array();
    for (const auto &part : message.parts) {
      const auto &disposition = part.get_header_object("Content-Disposition");
      auto filename_it = disposition.params.find("filename");
      if (filename_it == disposition.params.end() || filename_it->second.empty()) {
        continue;
      }

      std::optional<std::string> name = safe_upload_name(filename_it->second);
      if (!name.has_value()) {
        return create_json_response(
            create_error_response("Invalid upload filename: " + filename_it->second), 400);
      }

      const std::filesystem::path target = upload_directory_ / *name;
      std::ofstream out(target, std::ios::binary | std::ios::trunc);
      if (!out) {
        throw std::runtime_error("Failed to open " + target.string() + " for writing");
      }
      out.write(part.body.data(), static_cast<std::streamsize>(part.body.size()));
      if (!out) {
        throw std::runtime_error("Failed to write " + target.string());
      }

      logger_->info("Stored upload: {} ({} bytes)", target.string(), part.body.size());
      uploaded_files.push_back(
          {{"filename", *name}, {"size", part.body.size()}, {"path", target.string()}});
    }

    intake_core::IngestionRunSummary results = pipeline_->run(false);

    nlohmann::json response = create_success_response(
        "Successfully uploaded " + std::to_string(uploaded_files.size()) + " files");
    response["uploaded_files"] = uploaded_files;
    response["ingestion_results"] = results;
    return create_json_response(response);
  } catch (const std::exception &e) {
    logger_->error("Exception in handle_upload: {}", e.what());
    return create_json_response(create_error_response(std::string("Upload failed: ") + e.what()),
                                500);
  }
}

crow::response Routes::handle_get_metadata(const crow::request &req) {
  try {
    nlohmann::json metadata = nlohmann::json::object();
    for (const auto &[path, record] : log_store_->get_all_metadata()) {
      metadata[path] = record;
    }
    nlohmann::json response;
    response["success"] = true;
    response["metadata"] = metadata;
    return create_json_response(response);
  } catch (const std::exception &e) {
    logger_->error("Exception in handle_get_metadata: {}", e.what());
    return create_json_response(
        create_error_response(std::string("Failed to get metadata: ") + e.what()), 500);
  }
}

crow::response Routes::handle_get_logs(const crow::request &req) {
  int limit = default_history_limit_;
  if (const char *limit_param = req.url_params.get("limit")) {
    try {
      std::size_t consumed = 0;
      limit = std::stoi(limit_param, &consumed);
      if (consumed != std::string(limit_param).size() || limit < 0) {
        throw std::invalid_argument(limit_param);
      }
    } catch (const std::exception &) {
      return create_json_response(create_error_response("Invalid limit parameter"), 400);
    }
  }

  try {
    nlohmann::json logs = nlohmann::json::array();
    for (const auto &entry : log_store_->get_history(static_cast<std::size_t>(limit))) {
      logs.push_back(entry);
    }
    nlohmann::json response;
    response["success"] = true;
    response["logs"] = logs;
    return create_json_response(response);
  } catch (const std::exception &e) {
    logger_->error("Exception in handle_get_logs: {}", e.what());
    return create_json_response(
        create_error_response(std::string("Failed to get logs: ") + e.what()), 500);
  }
}

crow::response Routes::handle_trigger_ingestion(const crow::request &req) {
  try {
    intake_core::IngestionRunSummary results = pipeline_->run(false);
    nlohmann::json response;
    response["success"] = true;
    response["results"] = results;
    return create_json_response(response);
  } catch (const std::exception &e) {
    logger_->error("Exception in handle_trigger_ingestion: {}", e.what());
    return create_json_response(
        create_error_response(std::string("Ingestion failed: ") + e.what()), 500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

}  // namespace intake_api
