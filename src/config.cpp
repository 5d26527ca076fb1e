#include "net.h"

namespace syncplay {

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (device_name.empty()) {
    return fail("device_name must not be empty");
  }
  if (device_name.find('\n') != std::string::npos) {
    return fail("device_name must be a single line");
  }
  if (!bind_address.empty() && bind_address != "0.0.0.0") {
    if (!detail::IsValidIpv4(bind_address)) {
      return fail("bind_address must be a valid IPv4 address");
    }
  }
  if (!detail::IsValidIpv4(broadcast_address)) {
    return fail("broadcast_address must be a valid IPv4 address");
  }
  if (http_port == 0 || control_port == 0 || trigger_port == 0) {
    return fail("ports must be non-zero");
  }
  if (control_port == trigger_port) {
    return fail("control_port and trigger_port must differ");
  }
  if (sync_delay.count() <= 0) {
    return fail("sync_delay must be positive");
  }
  if (precision_margin.count() < 0) {
    return fail("precision_margin must not be negative");
  }
  if (clock_sample_count <= 0 || clock_sample_interval.count() < 0) {
    return fail("clock sampling must use a positive sample count");
  }
  if (connect_timeout.count() <= 0 || read_timeout.count() <= 0) {
    return fail("network timeouts must be positive");
  }
  return true;
}

}  // namespace syncplay
