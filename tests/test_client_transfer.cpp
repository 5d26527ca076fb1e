// Tests for client download and clock sync failures against canned replies.
#include "canned_http_server.h"
#include "syncplay/syncplay.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace {

using syncplay_test::CannedHttpServer;
using syncplay_test::Reply;

syncplay::Config TransferConfig(uint16_t http_port) {
  syncplay::Config config;
  config.http_port = http_port;
  config.control_port = static_cast<uint16_t>(http_port + 1000);
  config.trigger_port = static_cast<uint16_t>(http_port + 1001);
  config.clock_sample_count = 3;
  config.clock_sample_interval = std::chrono::milliseconds(5);
  config.connect_timeout = std::chrono::milliseconds(1000);
  config.read_timeout = std::chrono::milliseconds(2000);
  config.log_callback = [](const std::string&) {};
  return config;
}

std::string ValidWav() {
  const std::string pcm(4410 * 4, '\x10');  // 100 ms
  const auto header = syncplay::BuildWavHeader(syncplay::AudioFormat{},
                                               static_cast<uint32_t>(pcm.size()));
  return std::string(header.begin(), header.end()) + pcm;
}

}  // namespace

TEST(ClientTransferTest, UndecodableAudioIsDecodeFailure) {
  CannedHttpServer server([](const std::string& path) {
    if (path == "/audio") {
      return Reply(200, std::string("RIFF\x04\x00\x00\x00WAVX", 12));
    }
    return Reply(200, std::to_string(syncplay::NowEpochMillis()));
  });
  if (!server.Start(18380)) {
    GTEST_SKIP() << "loopback port unavailable";
  }

  syncplay::ClientSession client(TransferConfig(18380));
  EXPECT_FALSE(client.Connect("127.0.0.1"));
  EXPECT_EQ(client.GetState(), syncplay::ClientState::kError);
  EXPECT_EQ(client.GetLastErrorKind(), syncplay::ErrorKind::kDecodeFailure);
  EXPECT_FALSE(client.GetPayloadInfo().has_value());
}

TEST(ClientTransferTest, UnparsableTimeRepliesAreInsufficientSamples) {
  CannedHttpServer server([](const std::string& path) {
    if (path == "/audio") {
      return Reply(200, ValidWav());
    }
    return Reply(200, "soon");
  });
  if (!server.Start(18382)) {
    GTEST_SKIP() << "loopback port unavailable";
  }

  syncplay::ClientSession client(TransferConfig(18382));
  EXPECT_FALSE(client.Connect("127.0.0.1"));
  EXPECT_EQ(client.GetState(), syncplay::ClientState::kError);
  EXPECT_EQ(client.GetLastErrorKind(), syncplay::ErrorKind::kInsufficientSamples);
  EXPECT_EQ(client.GetMetrics().parse_errors, 3u);
  EXPECT_EQ(server.requests(), 4);
}

TEST(ClientTransferTest, OversizedContentLengthFailsWithoutThrowing) {
  CannedHttpServer server([](const std::string&) {
    return std::string(
        "HTTP/1.1 200 OK\r\nContent-Length: 4000000000000\r\n"
        "Connection: close\r\n\r\nabc");
  });
  if (!server.Start(18384)) {
    GTEST_SKIP() << "loopback port unavailable";
  }

  syncplay::ClientSession client(TransferConfig(18384));
  bool connected = true;
  EXPECT_NO_THROW(connected = client.Connect("127.0.0.1"));
  EXPECT_FALSE(connected);
  EXPECT_EQ(client.GetState(), syncplay::ClientState::kError);
  EXPECT_EQ(client.GetLastErrorKind(), syncplay::ErrorKind::kTransportUnreachable);
  EXPECT_NE(client.GetLastError().find("size limit"), std::string::npos);
}

TEST(ClientTransferTest, OverflowingContentLengthFailsWithoutThrowing) {
  CannedHttpServer server([](const std::string&) {
    return std::string(
        "HTTP/1.1 200 OK\r\nContent-Length: 99999999999999999999\r\n"
        "Connection: close\r\n\r\nabc");
  });
  if (!server.Start(18386)) {
    GTEST_SKIP() << "loopback port unavailable";
  }

  syncplay::ClientSession client(TransferConfig(18386));
  bool connected = true;
  EXPECT_NO_THROW(connected = client.Connect("127.0.0.1"));
  EXPECT_FALSE(connected);
  EXPECT_EQ(client.GetState(), syncplay::ClientState::kError);
}

TEST(ClientTransferTest, ResetDuringClockSyncAbandonsConnect) {
  CannedHttpServer server([](const std::string& path) {
    if (path == "/audio") {
      return Reply(200, ValidWav());
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    return Reply(200, std::to_string(syncplay::NowEpochMillis()));
  });
  if (!server.Start(18388)) {
    GTEST_SKIP() << "loopback port unavailable";
  }

  // A host on the control port records any READY the client sends.
  syncplay::Config host_config = TransferConfig(18390);
  host_config.control_port = TransferConfig(18388).control_port;
  syncplay::HostSession host(host_config);
  if (!host.Start()) {
    GTEST_SKIP() << "loopback sockets unavailable: " << host.GetLastError();
  }

  syncplay::Config config = TransferConfig(18388);
  config.clock_sample_count = 20;
  syncplay::ClientSession client(config);
  std::atomic<bool> syncing{false};
  client.SetStateCallback([&](syncplay::ClientState state) {
    if (state == syncplay::ClientState::kSyncing) {
      syncing = true;
    }
  });

  std::atomic<bool> connected{true};
  std::thread worker([&]() { connected = client.Connect("127.0.0.1"); });
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!syncing && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_TRUE(syncing.load());
  client.Reset();
  worker.join();

  EXPECT_FALSE(connected.load());
  EXPECT_EQ(client.GetState(), syncplay::ClientState::kIdle);
  EXPECT_EQ(client.GetLastErrorKind(), syncplay::ErrorKind::kNone);
  EXPECT_FALSE(client.GetPayloadInfo().has_value());
  EXPECT_LT(server.requests(), 21);

  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  EXPECT_TRUE(host.GetDevices().empty());
  host.Stop();
}
