#pragma once
#include <crow.h>
#include <crow/middlewares/cors.h>

#include <cstdint>
#include <future>
#include <string>

namespace intake_api {

using IntakeApp = crow::App<crow::CORSHandler>;

// Owns the Crow app and the thread it runs on. CORS is opened to a single
// front-end origin for GET, POST and preflight requests.
class Server {
 public:
  Server(const std::string &host, int port, const std::string &cors_origin);
  ~Server();

  // crow::App is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  IntakeApp &get_app() {
    return app_;
  }

  // Returns once the listener is accepting connections
  void start();

  // Blocks until the server thread has exited
  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  IntakeApp app_;
  std::string host_;
  int port_;
  std::future<void> run_result_;
  bool running_ = false;
};
}  // namespace intake_api
