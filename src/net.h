#pragma once

#include "syncplay/syncplay.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <netinet/in.h>
#include <sys/types.h>

namespace syncplay {
namespace detail {

// Route a diagnostic line to the configured callback or stderr.
void LogError(const std::string& message, const Config* config);

struct SessionMetricsAtomic {
  std::atomic<uint64_t> datagrams_received{0};
  std::atomic<uint64_t> datagrams_sent{0};
  std::atomic<uint64_t> parse_errors{0};
  std::atomic<uint64_t> send_errors{0};
  std::atomic<uint64_t> http_requests{0};
  std::atomic<uint64_t> http_errors{0};
  std::atomic<uint64_t> callback_exceptions{0};

  SessionMetrics Snapshot() const;
};

// Strict signed decimal parse: optional '-', digits only, no overflow.
bool ParseInt64(const std::string& text, int64_t* out);

bool IsValidIpv4(const std::string& address);

// Convert a string address and port into a sockaddr_in (INADDR_ANY for
// empty/0.0.0.0 or unparsable input).
sockaddr_in MakeSockaddr(const std::string& address, uint16_t port);

std::string AddrToString(const sockaddr_in& addr);

// Bound IPv4 datagram endpoint. Close() may be called from another thread
// to stop a pending Receive().
class DatagramEndpoint {
 public:
  DatagramEndpoint() = default;
  ~DatagramEndpoint() { Close(); }

  DatagramEndpoint(const DatagramEndpoint&) = delete;
  DatagramEndpoint& operator=(const DatagramEndpoint&) = delete;

  bool Bind(const std::string& address, uint16_t port, bool broadcast,
            std::string* error);
  void Close();
  bool is_bound() const { return fd_.load() >= 0; }

  // One datagram, all or nothing.
  bool Send(const std::string& message, const std::string& address, uint16_t port,
            std::string* error);

  // Bytes received, 0 when nothing arrived within timeout, -1 once closed.
  ssize_t Receive(uint8_t* buffer, size_t capacity, std::chrono::milliseconds timeout,
                  std::string* sender);

 private:
  std::atomic<int> fd_{-1};
};

struct HttpResponse {
  int status = 0;
  std::string content_type;
  std::string body;
};

HttpResponse TextResponse(int status, const std::string& text);

// Largest body HttpGet accepts; longer or longer-announced bodies fail.
constexpr size_t kMaxHttpBodySize = size_t{1} << 30;

using ProgressFn = std::function<void(size_t received, size_t total)>;

// Blocking GET through libcurl. False on transport failure; any HTTP status
// is returned in out->status.
bool HttpGet(const std::string& host, uint16_t port, const std::string& path,
             std::chrono::milliseconds connect_timeout,
             std::chrono::milliseconds read_timeout,
             const ProgressFn& progress, HttpResponse* out, std::string* error);

}  // namespace detail
}  // namespace syncplay
