#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace syncplay_test {

// Loopback TCP responder for client tests. Each connection gets the raw bytes
// the handler returns for the request path, so tests can serve replies a
// real server would refuse to produce.
class CannedHttpServer {
 public:
  using Handler = std::function<std::string(const std::string& path)>;

  explicit CannedHttpServer(Handler handler) : handler_(std::move(handler)) {}
  ~CannedHttpServer() { Stop(); }

  CannedHttpServer(const CannedHttpServer&) = delete;
  CannedHttpServer& operator=(const CannedHttpServer&) = delete;

  bool Start(uint16_t port) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
      return false;
    }
    const int on = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd_, 8) != 0) {
      ::close(fd_);
      fd_ = -1;
      return false;
    }
    running_ = true;
    thread_ = std::thread([this]() { Serve(); });
    return true;
  }

  void Stop() {
    running_ = false;
    if (thread_.joinable()) {
      thread_.join();
    }
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int requests() const { return requests_.load(); }

 private:
  void Serve() {
    while (running_) {
      pollfd pfd{fd_, POLLIN, 0};
      if (::poll(&pfd, 1, 50) <= 0) {
        continue;
      }
      const int client = ::accept(fd_, nullptr, nullptr);
      if (client < 0) {
        continue;
      }
      timeval tv{2, 0};
      ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
      std::string request;
      char buffer[1024];
      while (request.find("\r\n\r\n") == std::string::npos) {
        const ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
        if (n <= 0) {
          break;
        }
        request.append(buffer, static_cast<size_t>(n));
      }
      ++requests_;
      std::string method;
      std::string path;
      std::istringstream line(request);
      line >> method >> path;
      const auto query = path.find('?');
      if (query != std::string::npos) {
        path.resize(query);
      }
      const std::string reply = handler_(path);
      size_t sent = 0;
      while (sent < reply.size()) {
        const ssize_t n =
            ::send(client, reply.data() + sent, reply.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
          break;
        }
        sent += static_cast<size_t>(n);
      }
      ::shutdown(client, SHUT_WR);
      ::close(client);
    }
  }

  Handler handler_;
  int fd_ = -1;
  std::atomic<bool> running_{false};
  std::atomic<int> requests_{0};
  std::thread thread_;
};

inline std::string Reply(int status, const std::string& body) {
  std::ostringstream oss;
  oss << "HTTP/1.1 " << status << (status == 200 ? " OK" : " Error") << "\r\n"
      << "Content-Length: " << body.size() << "\r\n"
      << "Connection: close\r\n\r\n"
      << body;
  return oss.str();
}

}  // namespace syncplay_test
