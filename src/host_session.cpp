#include "net.h"
#include "syncplay/test_hooks.h"

#include <algorithm>
#include <array>
#include <exception>
#include <limits>
#include <sstream>
#include <thread>
#include <utility>

#include <httpserver.hpp>

#include <sys/socket.h>

namespace syncplay {
namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(200);
constexpr size_t kMaxDatagramSize = 1024;
constexpr int kHttpThreads = 4;

bool ValidatePayload(const DecodedAudio& audio, std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (audio.format.sample_rate == 0 || audio.format.channels == 0) {
    return fail("payload format must have a sample rate and channels");
  }
  if (audio.format.bits_per_sample == 0 || audio.format.bits_per_sample % 8 != 0) {
    return fail("payload bits_per_sample must be a non-zero multiple of 8");
  }
  if (audio.pcm.size() > std::numeric_limits<uint32_t>::max() - 36u) {
    return fail("payload too large for a WAV container");
  }
  return true;
}

// WAV header followed by the PCM, served as the /audio body.
std::shared_ptr<const std::string> BuildWavBody(const DecodedAudio& audio) {
  const auto header =
      BuildWavHeader(audio.format, static_cast<uint32_t>(audio.pcm.size()));
  auto body = std::make_shared<std::string>();
  body->reserve(header.size() + audio.pcm.size());
  body->append(header.begin(), header.end());
  body->append(audio.pcm.begin(), audio.pcm.end());
  return body;
}

}  // namespace

struct HostSession::Impl {
  Impl(Config config, std::shared_ptr<AudioSink> sink)
      : config_(std::move(config)), player_(config_), routes_(this) {
    player_.SetSink(std::move(sink));
    registry_.SetEventCallback([this](const DeviceEvent& event) {
      DeliverDeviceEvent(event);
    });
  }

  ~Impl() { Stop(); }

  bool LoadPayload(DecodedAudio audio) {
    std::string error;
    if (!ValidatePayload(audio, &error)) {
      last_error_ = error;
      detail::LogError(error, &config_);
      return false;
    }
    auto shared = std::make_shared<const DecodedAudio>(std::move(audio));
    auto body = BuildWavBody(*shared);
    {
      std::lock_guard<std::mutex> lock(payload_mutex_);
      payload_ = shared;
      wav_body_ = std::move(body);
    }
    player_.Load(shared);
    return true;
  }

  bool LoadPayloadFromFile(const std::string& source, PayloadDecoder& decoder) {
    DecodedAudio audio;
    std::string error;
    if (!decoder.Decode(source, &audio, &error)) {
      last_error_ = "decode failed: " + error;
      detail::LogError(last_error_, &config_);
      return false;
    }
    return LoadPayload(std::move(audio));
  }

  bool Start() {
    if (running_) {
      Stop();
    }
    last_error_.clear();
    std::string error;
    if (!config_.Validate(&error)) {
      last_error_ = error;
      detail::LogError(error, &config_);
      return false;
    }
    if (!control_socket_.Bind(config_.bind_address, config_.control_port, false, &error)) {
      return FailStart("control listener: " + error);
    }
    if (!send_socket_.Bind(config_.bind_address, 0, true, &error)) {
      return FailStart("trigger sender: " + error);
    }
    if (!StartHttpServer(&error)) {
      return FailStart("http server: " + error);
    }
    running_ = true;
    try {
      control_thread_ = std::thread([this]() { ControlLoop(); });
    } catch (const std::exception& ex) {
      last_error_ = std::string("thread start failed: ") + ex.what();
      detail::LogError(last_error_, &config_);
      Stop();
      return false;
    }
    return true;
  }

  void Stop() {
    // Pending trigger first, then listeners, then shared state.
    player_.Stop();
    running_ = false;
    control_socket_.Close();
    send_socket_.Close();
    StopHttpServer();
    if (control_thread_.joinable()) {
      control_thread_.join();
    }
    registry_.Clear();
  }

  bool IsRunning() const { return running_.load(); }

  std::optional<int64_t> StartPlayback() {
    if (!running_) {
      last_error_ = "cannot start playback: session not running";
      detail::LogError(last_error_, &config_);
      return std::nullopt;
    }
    // Local playback is scheduled before any client hears the trigger, so a
    // rejected start never leaves clients playing alone.
    const int64_t trigger_ms = NowEpochMillis() + config_.sync_delay.count();
    if (!player_.PlayAt(trigger_ms)) {
      last_error_ = "cannot start playback: local playback already pending or running";
      detail::LogError(last_error_, &config_);
      return std::nullopt;
    }

    const std::string message = EncodePlayAt(trigger_ms);
    for (const auto& device : registry_.Snapshot()) {
      SendTrigger(message, device.address);
    }
    // Also reach devices that never fetched over HTTP.
    SendTrigger(message, config_.broadcast_address);
    return trigger_ms;
  }

  void StopPlayback() { player_.Stop(); }

  void SetDeviceEventCallback(DeviceEventCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    device_event_cb_ = std::move(cb);
  }

  void SetPlaybackStartCallback(Player::StartCallback cb) {
    player_.SetStartCallback(std::move(cb));
  }

  std::vector<Device> GetDevices() const { return registry_.Snapshot(); }

  bool AllDevicesReady() const { return registry_.AllReady(); }

  std::optional<PayloadInfo> GetPayloadInfo() const {
    std::lock_guard<std::mutex> lock(payload_mutex_);
    if (!payload_) {
      return std::nullopt;
    }
    return payload_->info();
  }

  std::string GetLastError() const { return last_error_; }

  SessionMetrics GetMetrics() const { return metrics_.Snapshot(); }

  // Decode one control datagram; malformed frames are counted and dropped.
  void ProcessDatagram(const uint8_t* data, size_t length, const std::string& sender) {
    metrics_.datagrams_received.fetch_add(1);
    ControlMessage message;
    if (!DecodeControlMessage(data, length, &message)) {
      metrics_.parse_errors.fetch_add(1);
      return;
    }
    if (message.type != ControlMessageType::kReady) {
      return;
    }
    if (sender.empty()) {
      metrics_.parse_errors.fetch_add(1);
      return;
    }
    registry_.MarkReady(sender, message.display_name);
  }

  detail::HttpResponse Route(const std::string& method, const std::string& path,
                             const std::string& peer) {
    metrics_.http_requests.fetch_add(1);
    if (method != "GET") {
      return detail::TextResponse(405, "Method not allowed");
    }
    if (path == "/audio") {
      std::shared_ptr<const std::string> body;
      {
        std::lock_guard<std::mutex> lock(payload_mutex_);
        body = wav_body_;
      }
      if (!body) {
        return detail::TextResponse(404, "No audio loaded");
      }
      if (!peer.empty()) {
        registry_.RecordContact(peer);
      }
      detail::HttpResponse response;
      response.status = 200;
      response.content_type = "audio/wav";
      response.body = *body;
      return response;
    }
    if (path == "/time") {
      return detail::TextResponse(200, std::to_string(NowEpochMillis()));
    }
    if (path == "/info") {
      const auto info = GetPayloadInfo();
      if (!info.has_value()) {
        return detail::TextResponse(404, "No audio loaded");
      }
      return detail::TextResponse(200, FormatPayloadInfo(info.value()));
    }
    return detail::TextResponse(404, "Not found");
  }

 private:
  // One resource registered under every served path; GET only.
  class RouteResource : public httpserver::http_resource {
   public:
    explicit RouteResource(Impl* owner) : owner_(owner) {
      disallow_all();
      set_allowing("GET", true);
    }

    std::shared_ptr<httpserver::http_response> render_GET(
        const httpserver::http_request& req) override {
      const std::string path(req.get_path());
      try {
        const detail::HttpResponse response =
            owner_->Route("GET", path, std::string(req.get_requestor()));
        return std::make_shared<httpserver::string_response>(
            response.body, response.status, response.content_type);
      } catch (const std::exception& ex) {
        owner_->metrics_.http_errors.fetch_add(1);
        detail::LogError("GET " + path + " failed: " + ex.what(), &owner_->config_);
        return std::make_shared<httpserver::string_response>(
            "Internal error", 500, "text/plain; charset=utf-8");
      }
    }

   private:
    Impl* owner_;
  };

  bool StartHttpServer(std::string* error) {
    httpserver::create_webserver params(config_.http_port);
    params.start_method(httpserver::http::http_utils::INTERNAL_SELECT)
        .max_threads(kHttpThreads)
        .connection_timeout(static_cast<int>(
            std::max<int64_t>(1, (config_.read_timeout.count() + 999) / 1000)));
    if (!config_.bind_address.empty() && config_.bind_address != "0.0.0.0") {
      http_bind_addr_ = detail::MakeSockaddr(config_.bind_address, config_.http_port);
      params.bind_address(reinterpret_cast<const sockaddr*>(&http_bind_addr_));
    }
    try {
      http_server_ = std::make_unique<httpserver::webserver>(params);
      for (const char* path : {"/audio", "/time", "/info"}) {
        if (!http_server_->register_resource(path, &routes_)) {
          *error = std::string("cannot register ") + path;
          http_server_.reset();
          return false;
        }
      }
      if (!http_server_->start(false)) {
        *error = "daemon did not start on port " + std::to_string(config_.http_port);
        http_server_.reset();
        return false;
      }
    } catch (const std::exception& ex) {
      *error = ex.what();
      http_server_.reset();
      return false;
    }
    return true;
  }

  void StopHttpServer() {
    if (!http_server_) {
      return;
    }
    http_server_->stop();
    http_server_.reset();
  }

  bool FailStart(const std::string& error) {
    last_error_ = error;
    detail::LogError(error, &config_);
    control_socket_.Close();
    send_socket_.Close();
    StopHttpServer();
    return false;
  }

  void DeliverDeviceEvent(const DeviceEvent& event) {
    DeviceEventCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = device_event_cb_;
    }
    if (!cb_copy) {
      return;
    }
    try {
      cb_copy(event);
    } catch (const std::exception& ex) {
      metrics_.callback_exceptions.fetch_add(1);
      detail::LogError(std::string("DeviceEventCallback threw: ") + ex.what(), &config_);
    }
  }

  void SendTrigger(const std::string& message, const std::string& address) {
    std::string error;
    if (!send_socket_.Send(message, address, config_.trigger_port, &error)) {
      metrics_.send_errors.fetch_add(1);
      detail::LogError("Failed to send " + message + " to " + address + ": " + error,
                       &config_);
      return;
    }
    metrics_.datagrams_sent.fetch_add(1);
  }

  void ControlLoop() {
    std::array<uint8_t, kMaxDatagramSize> buffer{};
    std::string sender;
    while (running_) {
      const ssize_t bytes =
          control_socket_.Receive(buffer.data(), buffer.size(), kPollInterval, &sender);
      if (bytes < 0) {
        break;
      }
      if (bytes > 0) {
        ProcessDatagram(buffer.data(), static_cast<size_t>(bytes), sender);
      }
    }
  }

  Config config_;
  Player player_;
  DeviceRegistry registry_;
  detail::SessionMetricsAtomic metrics_;
  std::string last_error_;

  std::atomic<bool> running_{false};
  detail::DatagramEndpoint control_socket_;
  detail::DatagramEndpoint send_socket_;
  std::thread control_thread_;

  // The resource outlives the server that points at it.
  RouteResource routes_;
  sockaddr_in http_bind_addr_{};
  std::unique_ptr<httpserver::webserver> http_server_;

  mutable std::mutex payload_mutex_;
  std::shared_ptr<const DecodedAudio> payload_;
  std::shared_ptr<const std::string> wav_body_;

  std::mutex callback_mutex_;
  DeviceEventCallback device_event_cb_;
};

HostSession::HostSession(Config config, std::shared_ptr<AudioSink> sink)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(sink))) {}

HostSession::~HostSession() = default;

bool HostSession::LoadPayload(DecodedAudio audio) {
  return impl_->LoadPayload(std::move(audio));
}

bool HostSession::LoadPayloadFromFile(const std::string& source,
                                      PayloadDecoder& decoder) {
  return impl_->LoadPayloadFromFile(source, decoder);
}

bool HostSession::Start() { return impl_->Start(); }

void HostSession::Stop() { impl_->Stop(); }

bool HostSession::IsRunning() const { return impl_->IsRunning(); }

std::optional<int64_t> HostSession::StartPlayback() { return impl_->StartPlayback(); }

void HostSession::StopPlayback() { impl_->StopPlayback(); }

void HostSession::SetDeviceEventCallback(DeviceEventCallback cb) {
  impl_->SetDeviceEventCallback(std::move(cb));
}

void HostSession::SetPlaybackStartCallback(Player::StartCallback cb) {
  impl_->SetPlaybackStartCallback(std::move(cb));
}

std::vector<Device> HostSession::GetDevices() const { return impl_->GetDevices(); }

bool HostSession::AllDevicesReady() const { return impl_->AllDevicesReady(); }

std::optional<PayloadInfo> HostSession::GetPayloadInfo() const {
  return impl_->GetPayloadInfo();
}

std::string HostSession::GetLastError() const { return impl_->GetLastError(); }

SessionMetrics HostSession::GetMetrics() const { return impl_->GetMetrics(); }

std::string HostSession::GetLocalAddress() const { return GetLocalIpv4Address(); }

#ifdef SYNCPLAY_TESTING
namespace test {

HttpResult HandleHttpRequest(HostSession& session,
                             const std::string& method,
                             const std::string& path,
                             const std::string& peer_address) {
  const detail::HttpResponse response =
      session.impl_->Route(method, path, peer_address);
  HttpResult result;
  result.status = response.status;
  result.content_type = response.content_type;
  result.body.assign(response.body.begin(), response.body.end());
  return result;
}

void InjectControlDatagram(HostSession& session,
                           const std::string& payload,
                           const std::string& sender_address) {
  session.impl_->ProcessDatagram(reinterpret_cast<const uint8_t*>(payload.data()),
                                 payload.size(), sender_address);
}

}  // namespace test
#endif

}  // namespace syncplay
