#include "net.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <new>
#include <sstream>
#include <stdexcept>

#include <curl/curl.h>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace syncplay {

int64_t NowEpochMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string GetLocalIpv4Address() {
  ifaddrs* interfaces = nullptr;
  if (::getifaddrs(&interfaces) != 0) {
    return {};
  }
  std::string result;
  for (ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if ((it->ifa_flags & IFF_LOOPBACK) != 0 || (it->ifa_flags & IFF_UP) == 0) {
      continue;
    }
    const auto* addr = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
    result = detail::AddrToString(*addr);
    if (!result.empty()) {
      break;
    }
  }
  ::freeifaddrs(interfaces);
  return result;
}

namespace detail {
namespace {

std::string SocketError(const char* call) {
  std::string text(call);
  text += ": ";
  text += std::strerror(errno);
  return text;
}

// curl_global_init is not thread-safe; run it once per process.
bool EnsureCurl(std::string* error) {
  static std::once_flag once;
  static CURLcode init_result = CURLE_OK;
  std::call_once(once, []() { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (init_result != CURLE_OK) {
    *error = std::string("curl_global_init: ") + curl_easy_strerror(init_result);
    return false;
  }
  return true;
}

struct Transfer {
  HttpResponse* out = nullptr;
  const ProgressFn* progress = nullptr;
  bool too_large = false;
  bool out_of_memory = false;
};

size_t OnBodyData(char* data, size_t size, size_t count, void* user) {
  auto* transfer = static_cast<Transfer*>(user);
  const size_t bytes = size * count;
  if (transfer->out->body.size() + bytes > kMaxHttpBodySize) {
    transfer->too_large = true;
    return 0;
  }
  try {
    transfer->out->body.append(data, bytes);
  } catch (const std::bad_alloc&) {
    transfer->out_of_memory = true;
    return 0;
  } catch (const std::length_error&) {
    transfer->out_of_memory = true;
    return 0;
  }
  return bytes;
}

int OnTransferProgress(void* user, curl_off_t download_total, curl_off_t download_now,
                       curl_off_t, curl_off_t) {
  auto* transfer = static_cast<Transfer*>(user);
  if (download_total > 0 && download_now >= 0) {
    const auto total = static_cast<size_t>(download_total);
    (*transfer->progress)(std::min(static_cast<size_t>(download_now), total), total);
  }
  return 0;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

}  // namespace

void LogError(const std::string& message, const Config* config) {
  if (config && config->log_callback) {
    config->log_callback(message);
    return;
  }
  std::cerr << "[syncplay] " << message << std::endl;
}

SessionMetrics SessionMetricsAtomic::Snapshot() const {
  SessionMetrics snapshot;
  snapshot.datagrams_received = datagrams_received.load();
  snapshot.datagrams_sent = datagrams_sent.load();
  snapshot.parse_errors = parse_errors.load();
  snapshot.send_errors = send_errors.load();
  snapshot.http_requests = http_requests.load();
  snapshot.http_errors = http_errors.load();
  snapshot.callback_exceptions = callback_exceptions.load();
  return snapshot;
}

bool IsValidIpv4(const std::string& address) {
  if (address.empty()) {
    return false;
  }
  in_addr parsed{};
  return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

sockaddr_in MakeSockaddr(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else {
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
    }
  }
  return addr;
}

std::string AddrToString(const sockaddr_in& addr) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
    return buffer;
  }
  return {};
}

bool DatagramEndpoint::Bind(const std::string& address, uint16_t port, bool broadcast,
                            std::string* error) {
  Close();
  const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    *error = SocketError("socket");
    return false;
  }
  auto abandon = [&](const std::string& message) {
    *error = message;
    ::close(fd);
    return false;
  };
  const int on = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) != 0) {
    return abandon(SocketError("SO_REUSEADDR"));
  }
  if (broadcast && ::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) != 0) {
    return abandon(SocketError("SO_BROADCAST"));
  }
  const sockaddr_in local = MakeSockaddr(address, port);
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) != 0) {
    std::ostringstream oss;
    oss << "udp " << (address.empty() ? "0.0.0.0" : address) << ':' << port << ": "
        << std::strerror(errno);
    return abandon(oss.str());
  }
  fd_ = fd;
  return true;
}

void DatagramEndpoint::Close() {
  const int fd = fd_.exchange(-1);
  if (fd < 0) {
    return;
  }
  ::shutdown(fd, SHUT_RDWR);
  ::close(fd);
}

bool DatagramEndpoint::Send(const std::string& message, const std::string& address,
                            uint16_t port, std::string* error) {
  const int fd = fd_.load();
  if (fd < 0) {
    *error = "socket closed";
    return false;
  }
  const sockaddr_in peer = MakeSockaddr(address, port);
  const ssize_t sent = ::sendto(fd, message.data(), message.size(), 0,
                                reinterpret_cast<const sockaddr*>(&peer), sizeof(peer));
  if (sent < 0) {
    *error = SocketError("sendto");
    return false;
  }
  if (static_cast<size_t>(sent) != message.size()) {
    *error = "short datagram write";
    return false;
  }
  return true;
}

ssize_t DatagramEndpoint::Receive(uint8_t* buffer, size_t capacity,
                                  std::chrono::milliseconds timeout,
                                  std::string* sender) {
  const int fd = fd_.load();
  if (fd < 0) {
    return -1;
  }
  fd_set readable;
  FD_ZERO(&readable);
  FD_SET(fd, &readable);
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (::select(fd + 1, &readable, nullptr, nullptr, &tv) <= 0) {
    return fd_.load() < 0 ? -1 : 0;
  }
  sockaddr_in from{};
  socklen_t from_len = sizeof(from);
  const ssize_t bytes = ::recvfrom(fd, buffer, capacity, 0,
                                   reinterpret_cast<sockaddr*>(&from), &from_len);
  if (bytes < 0) {
    return fd_.load() < 0 ? -1 : 0;
  }
  if (sender) {
    *sender = AddrToString(from);
  }
  return bytes;
}

HttpResponse TextResponse(int status, const std::string& text) {
  HttpResponse response;
  response.status = status;
  response.content_type = "text/plain; charset=utf-8";
  response.body = text;
  return response;
}

bool HttpGet(const std::string& host, uint16_t port, const std::string& path,
             std::chrono::milliseconds connect_timeout,
             std::chrono::milliseconds read_timeout,
             const ProgressFn& progress, HttpResponse* out, std::string* error) {
  std::string scratch;
  if (!error) {
    error = &scratch;
  }
  if (!out) {
    *error = "no response buffer";
    return false;
  }
  if (!IsValidIpv4(host)) {
    *error = "invalid host address: " + host;
    return false;
  }
  if (!EnsureCurl(error)) {
    return false;
  }
  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    *error = "curl_easy_init failed";
    return false;
  }

  out->status = 0;
  out->content_type.clear();
  out->body.clear();
  Transfer transfer;
  transfer.out = out;
  transfer.progress = &progress;

  std::ostringstream url;
  url << "http://" << host << ':' << port << path;
  const std::string url_text = url.str();
  // A stall longer than read_timeout aborts the transfer.
  const long stall_seconds =
      std::max<long>(1, static_cast<long>((read_timeout.count() + 999) / 1000));

  CURL* handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, url_text.c_str());
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(connect_timeout.count()));
  curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, stall_seconds);
  curl_easy_setopt(handle, CURLOPT_MAXFILESIZE_LARGE,
                   static_cast<curl_off_t>(kMaxHttpBodySize));
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &OnBodyData);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &transfer);
  if (progress) {
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, &OnTransferProgress);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &transfer);
  }

  const CURLcode result = curl_easy_perform(handle);
  if (result != CURLE_OK) {
    if (transfer.too_large || result == CURLE_FILESIZE_EXCEEDED) {
      *error = "GET " + path + ": body exceeds size limit";
    } else if (transfer.out_of_memory) {
      *error = "GET " + path + ": out of memory for body";
    } else {
      *error = "GET " + path + ": " + curl_easy_strerror(result);
    }
    out->body.clear();
    out->body.shrink_to_fit();
    return false;
  }
  long status = 0;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
  out->status = static_cast<int>(status);
  const char* content_type = nullptr;
  if (curl_easy_getinfo(handle, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK &&
      content_type) {
    out->content_type = content_type;
  }
  return true;
}

}  // namespace detail
}  // namespace syncplay
