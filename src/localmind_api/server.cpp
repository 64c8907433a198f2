#include "localmind_api/server.hpp"

#include <iostream>

namespace localmind_api {
Server::Server(const std::string &host, int port, unsigned int threads)
    : host_(host), port_(port), threads_(threads == 0 ? 1 : threads), running_(false) {}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  // Each request runs its query chain on one of these threads.
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.port(static_cast<std::uint16_t>(port_)).bindaddr(host_).concurrency(threads_).run();
  });
  app_.wait_for_server_start();
  std::cout << "[Server] Listening on " << host_ << ":" << port_ << " with " << threads_ << " threads"
            << std::endl;
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
  std::cout << "[Server] Stopped" << std::endl;
}
}  // namespace localmind_api
