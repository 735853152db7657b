#pragma once

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

class Config {
 public:
  std::string api_base_url;
  std::string cors_origin;
  std::vector<std::string> watch_directories;
  std::string upload_directory;
  std::string log_directory;
  std::string log_level;
  int extraction_workers;
  std::string checksum_algorithm;
  int csv_sample_rows;
  int default_history_limit;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw ConfigError(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    // Apply defaults when keys are missing
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:8000"));
      config.cors_origin = json_config.value("cors_origin", std::string("http://localhost:3000"));
      config.watch_directories = json_config.value(
          "watch_directories", std::vector<std::string>{"./data/incoming"});
      config.log_directory = json_config.value("log_directory", std::string("./logs"));
      config.log_level = json_config.value("log_level", std::string("info"));
      config.checksum_algorithm = json_config.value("checksum_algorithm", std::string("sha256"));
      config.extraction_workers = json_config.value("extraction_workers", 1);
      config.csv_sample_rows = json_config.value("csv_sample_rows", 5);
      config.default_history_limit = json_config.value("default_history_limit", 100);
    } catch (const nlohmann::json::exception& e) {
      throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }

    // Uploads land in the first watched directory unless told otherwise
    if (json_config.contains("upload_directory") && json_config.at("upload_directory").is_string()) {
      config.upload_directory = json_config.at("upload_directory").get<std::string>();
    } else if (!config.watch_directories.empty()) {
      config.upload_directory = config.watch_directories.front();
    }

    config.validate();
    return config;
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }

  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw ConfigError("api_base_url cannot be empty");
    }
    const auto colon = api_base_url.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw ConfigError("api_base_url must be host:port");
    }
    if (watch_directories.empty()) {
      throw ConfigError("watch_directories cannot be empty");
    }
    for (const auto& dir : watch_directories) {
      if (dir.empty()) {
        throw ConfigError("watch_directories cannot contain an empty path");
      }
    }
    if (upload_directory.empty()) {
      throw ConfigError("upload_directory cannot be empty");
    }
    if (log_directory.empty()) {
      throw ConfigError("log_directory cannot be empty");
    }
    if (log_level != "trace" && log_level != "debug" && log_level != "info" &&
        log_level != "warn" && log_level != "error") {
      throw ConfigError("log_level must be one of trace, debug, info, warn, error");
    }
    if (extraction_workers <= 0) {
      throw ConfigError("extraction_workers must be greater than 0");
    }
    if (checksum_algorithm != "sha256" && checksum_algorithm != "md5" &&
        checksum_algorithm != "sha1" && checksum_algorithm != "sha512") {
      throw ConfigError("checksum_algorithm must be one of sha256, md5, sha1, sha512");
    }
    if (csv_sample_rows < 1) {
      throw ConfigError("csv_sample_rows must be at least 1");
    }
    if (default_history_limit < 0) {
      throw ConfigError("default_history_limit cannot be negative");
    }
  }
};
