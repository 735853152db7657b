#include "intake_cli/cli_handler.hpp"
#include <filesystem>
#include <iostream>
#include <memory>

#include "intake_core/db/database_manager.hpp"
#include "intake_core/db/ingestion_log_store.hpp"
#include "intake_core/detection/file_detector.hpp"
#include "intake_core/extractors/checksum.hpp"
#include "intake_core/extractors/extractor_factory.hpp"
#include "intake_core/logging/logger_factory.hpp"
#include "intake_core/pipeline/ingestion_pipeline.hpp"
#include "intake_core/services/metadata_extractor.hpp"

namespace intake_cli {

namespace {

// Values for flags that take one
std::string require_value(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw CliError("Missing value for " + flag);
    }
    return argv[++i];
}

int parse_positive_int(const std::string& value, const std::string& flag, int minimum) {
    int parsed = 0;
    try {
        std::size_t consumed = 0;
        parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw CliError("Invalid value for " + flag + ": " + value);
    }
    if (parsed < minimum) {
        throw CliError(flag + " must be at least " + std::to_string(minimum));
    }
    return parsed;
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "run" || command == "r") {
        options.command = Command::Run;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--dir" || flag == "-d") {
                options.watch_directories.push_back(require_value(argc, argv, i, flag));
            } else if (flag == "--log-dir" || flag == "-l") {
                options.log_directory = require_value(argc, argv, i, flag);
            } else if (flag == "--no-recursive") {
                options.recursive = false;
            } else if (flag == "--workers" || flag == "-w") {
                options.workers = parse_positive_int(require_value(argc, argv, i, flag), flag, 1);
            } else {
                throw CliError("Unknown option for run: " + flag);
            }
        }
        if (options.watch_directories.empty()) {
            options.watch_directories.push_back("./data/incoming");
        }
    } else if (command == "trigger" || command == "t") {
        options.command = Command::Trigger;
    } else if (command == "logs") {
        options.command = Command::Logs;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--limit" || flag == "-n") {
                options.limit = parse_positive_int(require_value(argc, argv, i, flag), flag, 0);
            } else {
                throw CliError("Unknown option for logs: " + flag);
            }
        }
    } else if (command == "metadata" || command == "m") {
        options.command = Command::Metadata;
    } else if (command == "health") {
        options.command = Command::Health;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

int CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Run:
            return handle_run_command(options);
        case Command::Trigger:
            handle_trigger_command(options);
            break;
        case Command::Logs:
            handle_logs_command(options);
            break;
        case Command::Metadata:
            handle_metadata_command(options);
            break;
        case Command::Health:
            handle_health_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
    return 0;
}

int CliHandler::handle_run_command(const CliOptions& options) {
    std::filesystem::create_directories(options.log_directory);
    intake_core::LoggerPtr logger = intake_core::make_intake_logger(options.log_directory);

    intake_core::DatabaseManager db_manager;
    db_manager.initialize(std::filesystem::path(options.log_directory) / "ingestion.db", 1);
    auto log_store = std::make_shared<intake_core::IngestionLogStore>(db_manager, logger);

    std::vector<std::filesystem::path> watch_directories(options.watch_directories.begin(),
                                                         options.watch_directories.end());
    auto detector = std::make_shared<intake_core::FileDetector>(watch_directories, logger);
    auto metadata_extractor = std::make_shared<intake_core::MetadataExtractor>(
        std::make_shared<intake_core::ExtractorFactory>(), intake_core::ChecksumCalculator(),
        logger);
    intake_core::IngestionPipeline pipeline(
        detector, metadata_extractor, log_store, logger,
        intake_core::PipelineOptions{.extraction_workers = options.workers});

    intake_core::IngestionRunSummary summary = pipeline.run(options.recursive);
    print_summary(nlohmann::json(summary));
    db_manager.shutdown();
    return summary.error.has_value() ? 1 : 0;
}

void CliHandler::handle_trigger_command(const CliOptions& options) {
    nlohmann::json response = make_post_request("/trigger-ingestion", nlohmann::json::object());
    if (!response.value("success", false)) {
        print_error(response.value("error", std::string("Unknown error")));
        return;
    }
    print_summary(response["results"]);
}

void CliHandler::handle_logs_command(const CliOptions& options) {
    std::string endpoint = "/logs";
    if (options.limit > 0) {
        endpoint += "?limit=" + std::to_string(options.limit);
    }
    nlohmann::json response = make_get_request(endpoint);
    if (!response.value("success", false)) {
        print_error(response.value("error", std::string("Unknown error")));
        return;
    }

    const nlohmann::json& logs = response["logs"];
    std::cout << "Ingestion history (" << logs.size() << " entries):" << std::endl;
    for (const auto& entry : logs) {
        std::cout << "[" << entry.value("timestamp", std::string()) << "] "
                  << entry.value("session_id", std::string()) << " "
                  << entry.value("event", std::string());
        const std::string event = entry.value("event", std::string());
        if (event == "ingestion_start") {
            std::cout << " files_detected=" << entry.value("files_detected", 0);
        } else if (event == "file_processed") {
            std::cout << " " << entry.value("file_path", std::string())
                      << (entry.value("success", false) ? " ok" : " FAILED");
        } else if (event == "ingestion_complete") {
            std::cout << " processed=" << entry.value("processed_count", 0)
                      << " failed=" << entry.value("failed_count", 0);
        }
        std::cout << std::endl;
    }
}

void CliHandler::handle_metadata_command(const CliOptions& options) {
    nlohmann::json response = make_get_request("/metadata");
    if (!response.value("success", false)) {
        print_error(response.value("error", std::string("Unknown error")));
        return;
    }

    const nlohmann::json& metadata = response["metadata"];
    std::cout << "Metadata for " << metadata.size() << " files:" << std::endl;
    for (const auto& [path, record] : metadata.items()) {
        std::cout << "- " << path << " (" << record.value("file_size", 0) << " bytes)";
        if (record.contains("row_count")) {
            std::cout << " rows=" << record["row_count"] << " columns=" << record["column_count"];
        } else if (record.contains("sheet_count")) {
            std::cout << " sheets=" << record["sheet_count"];
        } else if (record.contains("record_count")) {
            std::cout << " records=" << record["record_count"];
        }
        std::cout << std::endl;
    }
}

void CliHandler::handle_health_command(const CliOptions& options) {
    nlohmann::json response = make_get_request("/health");
    std::cout << "Status: " << response.value("status", std::string("unknown")) << std::endl;
    std::cout << "Message: " << response.value("message", std::string()) << std::endl;
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    curl_easy_reset(curl_handle_);
    return perform_request(build_url(endpoint));
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string request_json = data.dump();
    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());

    return perform_request(build_url(endpoint));
}

nlohmann::json CliHandler::perform_request(const std::string& url) {
    std::string response_buffer;
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        throw CliError("HTTP request failed with status code: " + std::to_string(http_code));
    }

    try {
        return nlohmann::json::parse(response_buffer);
    } catch (const nlohmann::json::parse_error& e) {
        throw CliError(std::string("Malformed response from server: ") + e.what());
    }
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    std::string url = api_base_url_;
    if (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + endpoint;
}

void CliHandler::print_summary(const nlohmann::json& summary) {
    std::cout << std::string(50, '=') << std::endl;
    std::cout << "INGESTION SUMMARY" << std::endl;
    std::cout << std::string(50, '=') << std::endl;
    std::cout << "Session ID: " << summary.value("session_id", std::string()) << std::endl;
    std::cout << "Total Files: " << summary.value("total_files", 0) << std::endl;
    std::cout << "Processed: " << summary.value("processed_count", 0) << std::endl;
    std::cout << "Failed: " << summary.value("failed_count", 0) << std::endl;
    if (summary.contains("error")) {
        std::cout << "Error: " << summary["error"].get<std::string>() << std::endl;
    }
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << "Data Ingestion CLI" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: intake_cli <command> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  run, r          Run one ingestion pass in this process" << std::endl;
    std::cout << "    --dir, -d <path>       Directory to scan (repeatable, default ./data/incoming)" << std::endl;
    std::cout << "    --log-dir, -l <path>   Log and database directory (default ./logs)" << std::endl;
    std::cout << "    --no-recursive         Only scan the top level of each directory" << std::endl;
    std::cout << "    --workers, -w <n>      Parallel extraction workers (default 1)" << std::endl;
    std::cout << "  trigger, t      Ask the server to run ingestion" << std::endl;
    std::cout << "  logs            Show ingestion history from the server" << std::endl;
    std::cout << "    --limit, -n <n>        Most recent entries only" << std::endl;
    std::cout << "  metadata, m     Show stored file metadata from the server" << std::endl;
    std::cout << "  health          Check that the server is up" << std::endl;
    std::cout << "  help, h         Show this help" << std::endl;
    std::cout << std::endl;
    std::cout << "Environment:" << std::endl;
    std::cout << "  API_BASE_URL    Server address (default http://127.0.0.1:8000)" << std::endl;
}

}  // namespace intake_cli
