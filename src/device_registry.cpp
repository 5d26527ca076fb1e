#include "syncplay/syncplay.h"

#include <algorithm>
#include <utility>

namespace syncplay {

void DeviceRegistry::SetEventCallback(EventCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  event_cb_ = std::move(cb);
}

Device DeviceRegistry::RecordContact(const std::string& address) {
  const auto now = std::chrono::steady_clock::now();
  Device snapshot;
  std::vector<DeviceEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(address);
    if (it == index_.end()) {
      Device device;
      device.address = address;
      device.display_name = "Device-" + std::to_string(devices_.size() + 1);
      device.state = DeviceState::kAwaitingPayload;
      device.last_seen = now;
      index_.emplace(address, devices_.size());
      devices_.push_back(device);
      events.push_back({DeviceEventType::kConnected, device});
      snapshot = device;
    } else {
      Device& device = devices_[it->second];
      device.last_seen = now;
      snapshot = device;
    }
  }
  Deliver(events);
  return snapshot;
}

Device DeviceRegistry::MarkReady(const std::string& address,
                                 const std::string& display_name) {
  const auto now = std::chrono::steady_clock::now();
  Device snapshot;
  std::vector<DeviceEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(address);
    if (it == index_.end()) {
      Device device;
      device.address = address;
      device.display_name = display_name.empty()
                                ? "Device-" + std::to_string(devices_.size() + 1)
                                : display_name;
      device.state = DeviceState::kReady;
      device.last_seen = now;
      index_.emplace(address, devices_.size());
      devices_.push_back(device);
      events.push_back({DeviceEventType::kConnected, device});
      snapshot = device;
    } else {
      Device& device = devices_[it->second];
      if (!display_name.empty()) {
        device.display_name = display_name;
      }
      device.state = DeviceState::kReady;
      device.last_seen = now;
      snapshot = device;
    }
    events.push_back({DeviceEventType::kReady, snapshot});
  }
  Deliver(events);
  return snapshot;
}

std::vector<Device> DeviceRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_;
}

bool DeviceRegistry::AllReady() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (devices_.empty()) {
    return false;
  }
  return std::all_of(devices_.begin(), devices_.end(), [](const Device& device) {
    return device.state == DeviceState::kReady;
  });
}

size_t DeviceRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

size_t DeviceRegistry::ReadyCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(
      std::count_if(devices_.begin(), devices_.end(), [](const Device& device) {
        return device.state == DeviceState::kReady;
      }));
}

void DeviceRegistry::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  devices_.clear();
  index_.clear();
}

void DeviceRegistry::Deliver(const std::vector<DeviceEvent>& events) {
  if (events.empty()) {
    return;
  }
  EventCallback cb_copy;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb_copy = event_cb_;
  }
  if (!cb_copy) {
    return;
  }
  for (const auto& event : events) {
    cb_copy(event);
  }
}

}  // namespace syncplay
