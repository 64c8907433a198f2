#pragma once
#include <crow.h>

#include <cstdint>
#include <future>
#include <string>

namespace localmind_api {
class Server {
 public:
  // threads: Crow worker threads serving requests concurrently.
  Server(const std::string &host, int port, unsigned int threads = 4);
  ~Server() = default;

  // crow::SimpleApp is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  void start();

  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  unsigned int threads_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};
}  // namespace localmind_api
