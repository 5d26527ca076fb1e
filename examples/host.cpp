// Example: serve a WAV file to clients and start synchronized playback.
#include "syncplay/syncplay.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cout << "Usage: syncplay_host <file.wav> [--auto]\n";
    return 1;
  }
  const std::string path = argv[1];
  const bool auto_start = argc > 2 && std::string(argv[2]) == "--auto";

  syncplay::Config config;
  config.device_name = "syncplay-host";

  syncplay::HostSession session(config);
  syncplay::WavFileDecoder decoder;
  if (!session.LoadPayloadFromFile(path, decoder)) {
    std::cerr << "Failed to load " << path << ": " << session.GetLastError() << std::endl;
    return 1;
  }
  const auto info = session.GetPayloadInfo();
  if (info.has_value()) {
    std::cout << "Loaded " << path << " (" << info->sample_rate << " Hz, "
              << info->channels << " ch, " << info->duration_ms << " ms)" << std::endl;
  }

  session.SetDeviceEventCallback([&session, auto_start](const syncplay::DeviceEvent& event) {
    const char* what =
        event.type == syncplay::DeviceEventType::kConnected ? "connected" : "ready";
    std::cout << event.device.display_name << " (" << event.device.address << ") "
              << what << std::endl;
    if (auto_start && event.type == syncplay::DeviceEventType::kReady &&
        session.AllDevicesReady()) {
      const auto trigger = session.StartPlayback();
      if (trigger.has_value()) {
        std::cout << "All devices ready, playing at " << trigger.value() << std::endl;
      }
    }
  });
  session.SetPlaybackStartCallback([](int64_t target_ms, int64_t actual_ms) {
    std::cout << "Local playback started " << (actual_ms - target_ms)
              << " ms after target" << std::endl;
  });

  if (!session.Start()) {
    std::cerr << "Failed to start session: " << session.GetLastError() << std::endl;
    return 1;
  }

  const std::string address = session.GetLocalAddress();
  std::cout << "Clients connect to " << (address.empty() ? "<unknown>" : address)
            << ":" << config.http_port << std::endl;
  if (!auto_start) {
    std::cout << "Press Enter to start playback." << std::endl;
    std::string line;
    std::getline(std::cin, line);
    const auto trigger = session.StartPlayback();
    if (!trigger.has_value()) {
      std::cerr << "Failed to start playback: " << session.GetLastError() << std::endl;
    } else {
      std::cout << "Playing at " << trigger.value() << " to "
                << session.GetDevices().size() << " device(s)" << std::endl;
    }
  }

  std::cout << "Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);
  session.Stop();
  return 0;
}
