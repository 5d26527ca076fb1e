// Example: join a host and write the synchronized PCM stream to a file.
#include "syncplay/syncplay.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace {

// AudioSink that appends PCM to a file once playback starts.
class FileSink : public syncplay::AudioSink {
 public:
  explicit FileSink(const std::string& path) : out_(path, std::ios::binary) {}

  bool is_open() const { return out_.is_open(); }

  size_t BufferCapacityFrames() const override { return 4096; }

  int Write(const uint8_t* data, size_t offset, size_t length) override {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.write(reinterpret_cast<const char*>(data + offset),
               static_cast<std::streamsize>(length));
    return out_ ? static_cast<int>(length) : -1;
  }

  void Play() override {
    std::cout << "Play at " << syncplay::NowEpochMillis() << std::endl;
  }

  void Stop() override {}

  void Flush() override {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
  }

 private:
  std::mutex mutex_;
  std::ofstream out_;
};

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cout << "Usage: syncplay_client <host_ip> <output.pcm> [name]\n";
    return 1;
  }

  syncplay::Config config;
  if (argc > 3) {
    config.device_name = argv[3];
  }

  auto sink = std::make_shared<FileSink>(argv[2]);
  if (!sink->is_open()) {
    std::cerr << "Cannot open " << argv[2] << std::endl;
    return 1;
  }

  syncplay::ClientSession session(config, sink);
  session.SetStateCallback([](syncplay::ClientState state) {
    std::cout << "State: " << syncplay::ToString(state) << std::endl;
  });
  session.SetProgressCallback([](float fraction) {
    std::cout << "\rDownloading " << static_cast<int>(fraction * 100.0f) << "%"
              << std::flush;
    if (fraction >= 1.0f) {
      std::cout << std::endl;
    }
  });
  session.SetPlayCallback([](int64_t local_instant_ms) {
    std::cout << "Trigger received, starting at " << local_instant_ms << std::endl;
  });

  if (!session.Connect(argv[1])) {
    std::cerr << "Connect failed (" << syncplay::ToString(session.GetLastErrorKind())
              << "): " << session.GetLastError() << std::endl;
    return 1;
  }
  std::cout << "Clock offset " << session.GetClockOffset()
            << " ms. Waiting for trigger, press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);
  session.Reset();
  return 0;
}
