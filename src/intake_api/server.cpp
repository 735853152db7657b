#include "intake_api/server.hpp"

namespace intake_api {

Server::Server(const std::string &host, int port, const std::string &cors_origin)
    : host_(host), port_(port) {
  app_.server_name("intake");
  app_.get_middleware<crow::CORSHandler>()
      .global()
      .origin(cors_origin)
      .methods(crow::HTTPMethod::GET, crow::HTTPMethod::POST, crow::HTTPMethod::OPTIONS)
      .headers("Content-Type", "Authorization")
      .allow_credentials();
}

Server::~Server() {
  stop();
}

void Server::start() {
  if (running_) {
    return;
  }
  app_.bindaddr(host_).port(static_cast<std::uint16_t>(port_)).multithreaded();
  run_result_ = app_.run_async();
  app_.wait_for_server_start();
  running_ = true;
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();
  if (run_result_.valid()) {
    run_result_.get();
  }
  running_ = false;
}

}  // namespace intake_api
