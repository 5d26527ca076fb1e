#pragma once

#include "syncplay/syncplay.h"

#include <cstdint>
#include <string>
#include <vector>

namespace syncplay {

#ifdef SYNCPLAY_TESTING
namespace test {

struct HttpResult {
  int status = 0;
  std::string content_type;
  std::vector<uint8_t> body;

  std::string BodyText() const { return std::string(body.begin(), body.end()); }
};

// Route a request through the host's HTTP handler without a socket.
HttpResult HandleHttpRequest(HostSession& session,
                             const std::string& method,
                             const std::string& path,
                             const std::string& peer_address);

// Feed a datagram to the host's control listener as if received from sender.
void InjectControlDatagram(HostSession& session,
                           const std::string& payload,
                           const std::string& sender_address);

// Feed a datagram to the client's trigger listener.
void InjectControlDatagram(ClientSession& session, const std::string& payload);

// Put an idle client into kReady with the given offset, skipping the network.
void PrepareForTrigger(ClientSession& session, int64_t clock_offset_ms);

bool ParseInteger(const std::string& text, int64_t* out);

}  // namespace test
#endif

}  // namespace syncplay
