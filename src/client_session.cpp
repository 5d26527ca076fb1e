#include "net.h"
#include "syncplay/test_hooks.h"

#include <array>
#include <exception>
#include <sstream>
#include <thread>
#include <utility>

namespace syncplay {
namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(200);
constexpr size_t kMaxDatagramSize = 1024;

std::string TrimWhitespace(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return std::string();
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

}  // namespace

const char* ToString(ClientState state) {
  switch (state) {
    case ClientState::kIdle:
      return "idle";
    case ClientState::kConnecting:
      return "connecting";
    case ClientState::kDownloading:
      return "downloading";
    case ClientState::kSyncing:
      return "syncing";
    case ClientState::kReady:
      return "ready";
    case ClientState::kPlaying:
      return "playing";
    case ClientState::kError:
      return "error";
  }
  return "unknown";
}

struct ClientSession::Impl {
  Impl(Config config, std::shared_ptr<AudioSink> sink)
      : config_(std::move(config)), player_(config_) {
    player_.SetSink(std::move(sink));
  }

  ~Impl() {
    {
      std::lock_guard<std::mutex> lock(transition_mutex_);
      ++generation_;
    }
    StopListening();
    player_.Stop();
  }

  bool Connect(const std::string& host_address) {
    uint64_t generation = 0;
    {
      std::lock_guard<std::mutex> lock(transition_mutex_);
      const ClientState current = state_.load();
      if (current != ClientState::kIdle) {
        detail::LogError(std::string("Connect rejected in state ") + ToString(current),
                         &config_);
        return false;
      }
      state_ = ClientState::kConnecting;
      generation = generation_.load();
    }
    {
      std::lock_guard<std::mutex> lock(error_mutex_);
      last_error_kind_ = ErrorKind::kNone;
      last_error_.clear();
    }
    NotifyState(ClientState::kConnecting);

    std::string error;
    if (!config_.Validate(&error)) {
      return Fail(generation, ErrorKind::kInvalidConfig, error);
    }
    if (!detail::IsValidIpv4(host_address)) {
      return Fail(generation, ErrorKind::kTransportUnreachable,
                  "invalid host address: " + host_address);
    }

    if (!EnterState(generation, ClientState::kDownloading)) {
      return false;
    }
    detail::HttpResponse response;
    const detail::ProgressFn progress = [this](size_t received, size_t total) {
      if (total > 0) {
        NotifyProgress(static_cast<float>(received) / static_cast<float>(total));
      }
    };
    if (!detail::HttpGet(host_address, config_.http_port, "/audio",
                         config_.connect_timeout, config_.read_timeout, progress,
                         &response, &error)) {
      return Fail(generation, ErrorKind::kTransportUnreachable,
                  "download failed: " + error);
    }
    if (response.status != 200) {
      std::ostringstream oss;
      oss << "download failed: host returned " << response.status << " "
          << response.body;
      return Fail(generation, ErrorKind::kTransportUnreachable, oss.str());
    }
    NotifyProgress(1.0f);

    auto audio = std::make_shared<DecodedAudio>();
    {
      std::vector<uint8_t> bytes(response.body.begin(), response.body.end());
      response.body.clear();
      response.body.shrink_to_fit();
      if (!DecodePayloadBytes(bytes, audio.get(), &error)) {
        return Fail(generation, ErrorKind::kDecodeFailure, "decode failed: " + error);
      }
    }
    {
      std::lock_guard<std::mutex> lock(transition_mutex_);
      if (generation != generation_.load()) {
        return false;
      }
      {
        std::lock_guard<std::mutex> info_lock(state_mutex_);
        payload_info_ = audio->info();
      }
      player_.Load(std::move(audio));
      state_ = ClientState::kSyncing;
    }
    NotifyState(ClientState::kSyncing);
    const auto samples = CollectClockSamples(host_address, generation);
    if (generation != generation_.load()) {
      return false;
    }
    const auto offset = EstimateClockOffset(samples);
    if (!offset.has_value()) {
      return Fail(generation, ErrorKind::kInsufficientSamples,
                  "clock sync failed: no time samples from host");
    }

    // The listener runs and kReady is set before the host can learn of this
    // client, so a trigger answering READY is never dropped.
    bool listening = false;
    {
      std::lock_guard<std::mutex> lock(transition_mutex_);
      if (generation != generation_.load()) {
        return false;
      }
      listening = StartListening(&error);
      if (listening) {
        clock_offset_ = offset.value();
        state_ = ClientState::kReady;
      }
    }
    if (!listening) {
      return Fail(generation, ErrorKind::kTransportUnreachable,
                  "trigger listener failed: " + error);
    }
    NotifyState(ClientState::kReady);

    bool announced = false;
    {
      std::lock_guard<std::mutex> lock(transition_mutex_);
      if (generation != generation_.load()) {
        return false;
      }
      announced = SendReady(host_address, &error);
    }
    if (!announced) {
      return Fail(generation, ErrorKind::kTransportUnreachable,
                  "READY send failed: " + error);
    }
    return true;
  }

  void Reset() {
    {
      std::lock_guard<std::mutex> lock(transition_mutex_);
      ++generation_;
    }
    StopListening();
    player_.Stop();
    clock_offset_ = 0;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      payload_info_.reset();
    }
    {
      std::lock_guard<std::mutex> lock(error_mutex_);
      last_error_kind_ = ErrorKind::kNone;
      last_error_.clear();
    }
    {
      std::lock_guard<std::mutex> lock(transition_mutex_);
      state_ = ClientState::kIdle;
    }
    NotifyState(ClientState::kIdle);
  }

  void SetStateCallback(StateCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    state_cb_ = std::move(cb);
  }

  void SetProgressCallback(ProgressCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    progress_cb_ = std::move(cb);
  }

  void SetPlayCallback(PlayCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    play_cb_ = std::move(cb);
  }

  void SetPlaybackStartCallback(Player::StartCallback cb) {
    player_.SetStartCallback(std::move(cb));
  }

  ClientState GetState() const { return state_.load(); }

  int64_t GetClockOffset() const { return clock_offset_.load(); }

  std::optional<PayloadInfo> GetPayloadInfo() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return payload_info_;
  }

  ErrorKind GetLastErrorKind() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_kind_;
  }

  std::string GetLastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
  }

  SessionMetrics GetMetrics() const { return metrics_.Snapshot(); }

  // Accept a PLAY_AT only while kReady; unicast and broadcast copies of the
  // same trigger collapse into one start.
  void ProcessDatagram(const uint8_t* data, size_t length) {
    metrics_.datagrams_received.fetch_add(1);
    ControlMessage message;
    if (!DecodeControlMessage(data, length, &message)) {
      metrics_.parse_errors.fetch_add(1);
      return;
    }
    if (message.type != ControlMessageType::kPlayAt) {
      return;
    }
    ClientState expected = ClientState::kReady;
    if (!state_.compare_exchange_strong(expected, ClientState::kPlaying)) {
      return;
    }
    const int64_t local_ms = message.instant_ms - clock_offset_.load();
    NotifyState(ClientState::kPlaying);
    NotifyPlay(local_ms);
    player_.PlayAt(local_ms);
  }

  void PrepareForTrigger(int64_t clock_offset_ms) {
    {
      std::lock_guard<std::mutex> lock(transition_mutex_);
      clock_offset_ = clock_offset_ms;
      state_ = ClientState::kReady;
    }
    NotifyState(ClientState::kReady);
  }

 private:
  // False if a Reset() overtook this Connect(). The generation check and the
  // store happen under one lock so Reset() cannot land in between.
  bool EnterState(uint64_t generation, ClientState state) {
    {
      std::lock_guard<std::mutex> lock(transition_mutex_);
      if (generation != generation_.load()) {
        return false;
      }
      state_ = state;
    }
    NotifyState(state);
    return true;
  }

  bool Fail(uint64_t generation, ErrorKind kind, const std::string& message) {
    {
      std::lock_guard<std::mutex> lock(transition_mutex_);
      if (generation != generation_.load()) {
        return false;
      }
      state_ = ClientState::kError;
    }
    {
      std::lock_guard<std::mutex> lock(error_mutex_);
      last_error_kind_ = kind;
      last_error_ = message;
    }
    detail::LogError(message, &config_);
    StopListening();
    player_.Stop();
    NotifyState(ClientState::kError);
    return false;
  }

  std::vector<ClockSample> CollectClockSamples(const std::string& host_address,
                                               uint64_t generation) {
    std::vector<ClockSample> samples;
    for (int i = 0; i < config_.clock_sample_count; ++i) {
      if (generation != generation_.load()) {
        break;
      }
      if (i > 0) {
        std::this_thread::sleep_for(config_.clock_sample_interval);
      }
      ClockSample sample;
      sample.local_send_ms = NowEpochMillis();
      detail::HttpResponse response;
      std::string error;
      if (!detail::HttpGet(host_address, config_.http_port, "/time",
                           config_.connect_timeout, config_.read_timeout, nullptr,
                           &response, &error)) {
        detail::LogError("time sample failed: " + error, &config_);
        continue;
      }
      sample.local_receive_ms = NowEpochMillis();
      if (response.status != 200 ||
          !detail::ParseInt64(TrimWhitespace(response.body), &sample.remote_ms)) {
        metrics_.parse_errors.fetch_add(1);
        detail::LogError("time sample rejected: " + response.body, &config_);
        continue;
      }
      samples.push_back(sample);
    }
    return samples;
  }

  bool StartListening(std::string* error) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listening_ = false;
    trigger_socket_.Close();
    if (listen_thread_.joinable()) {
      listen_thread_.join();
    }
    if (!trigger_socket_.Bind(config_.bind_address, config_.trigger_port, true, error)) {
      return false;
    }
    listening_ = true;
    try {
      listen_thread_ = std::thread([this]() { ListenLoop(); });
    } catch (const std::exception& ex) {
      listening_ = false;
      trigger_socket_.Close();
      *error = ex.what();
      return false;
    }
    return true;
  }

  void StopListening() {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listening_ = false;
    trigger_socket_.Close();
    if (listen_thread_.joinable() &&
        listen_thread_.get_id() != std::this_thread::get_id()) {
      listen_thread_.join();
    }
  }

  void ListenLoop() {
    std::array<uint8_t, kMaxDatagramSize> buffer{};
    while (listening_) {
      const ssize_t bytes =
          trigger_socket_.Receive(buffer.data(), buffer.size(), kPollInterval, nullptr);
      if (bytes < 0) {
        break;
      }
      if (bytes > 0) {
        ProcessDatagram(buffer.data(), static_cast<size_t>(bytes));
      }
    }
  }

  // One READY from an ephemeral port; the host keys devices by address only.
  bool SendReady(const std::string& host_address, std::string* error) {
    detail::DatagramEndpoint socket;
    if (!socket.Bind(config_.bind_address, 0, false, error)) {
      return false;
    }
    if (!socket.Send(EncodeReady(config_.device_name), host_address,
                     config_.control_port, error)) {
      metrics_.send_errors.fetch_add(1);
      return false;
    }
    metrics_.datagrams_sent.fetch_add(1);
    return true;
  }

  void NotifyState(ClientState state) {
    StateCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = state_cb_;
    }
    Invoke("StateCallback", [&]() {
      if (cb_copy) {
        cb_copy(state);
      }
    });
  }

  void NotifyProgress(float fraction) {
    ProgressCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = progress_cb_;
    }
    Invoke("ProgressCallback", [&]() {
      if (cb_copy) {
        cb_copy(fraction);
      }
    });
  }

  void NotifyPlay(int64_t local_ms) {
    PlayCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = play_cb_;
    }
    Invoke("PlayCallback", [&]() {
      if (cb_copy) {
        cb_copy(local_ms);
      }
    });
  }

  void Invoke(const char* name, const std::function<void()>& fn) {
    try {
      fn();
    } catch (const std::exception& ex) {
      metrics_.callback_exceptions.fetch_add(1);
      detail::LogError(std::string(name) + " threw: " + ex.what(), &config_);
    }
  }

  Config config_;
  Player player_;
  detail::SessionMetricsAtomic metrics_;

  std::atomic<ClientState> state_{ClientState::kIdle};
  std::atomic<int64_t> clock_offset_{0};
  std::atomic<uint64_t> generation_{0};
  std::mutex transition_mutex_;

  mutable std::mutex state_mutex_;
  std::optional<PayloadInfo> payload_info_;

  mutable std::mutex error_mutex_;
  ErrorKind last_error_kind_ = ErrorKind::kNone;
  std::string last_error_;

  std::mutex listener_mutex_;
  std::atomic<bool> listening_{false};
  detail::DatagramEndpoint trigger_socket_;
  std::thread listen_thread_;

  std::mutex callback_mutex_;
  StateCallback state_cb_;
  ProgressCallback progress_cb_;
  PlayCallback play_cb_;
};

ClientSession::ClientSession(Config config, std::shared_ptr<AudioSink> sink)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(sink))) {}

ClientSession::~ClientSession() = default;

bool ClientSession::Connect(const std::string& host_address) {
  return impl_->Connect(host_address);
}

void ClientSession::Reset() { impl_->Reset(); }

void ClientSession::SetStateCallback(StateCallback cb) {
  impl_->SetStateCallback(std::move(cb));
}

void ClientSession::SetProgressCallback(ProgressCallback cb) {
  impl_->SetProgressCallback(std::move(cb));
}

void ClientSession::SetPlayCallback(PlayCallback cb) {
  impl_->SetPlayCallback(std::move(cb));
}

void ClientSession::SetPlaybackStartCallback(Player::StartCallback cb) {
  impl_->SetPlaybackStartCallback(std::move(cb));
}

ClientState ClientSession::GetState() const { return impl_->GetState(); }

int64_t ClientSession::GetClockOffset() const { return impl_->GetClockOffset(); }

std::optional<PayloadInfo> ClientSession::GetPayloadInfo() const {
  return impl_->GetPayloadInfo();
}

ErrorKind ClientSession::GetLastErrorKind() const { return impl_->GetLastErrorKind(); }

std::string ClientSession::GetLastError() const { return impl_->GetLastError(); }

SessionMetrics ClientSession::GetMetrics() const { return impl_->GetMetrics(); }

#ifdef SYNCPLAY_TESTING
namespace test {

void InjectControlDatagram(ClientSession& session, const std::string& payload) {
  session.impl_->ProcessDatagram(reinterpret_cast<const uint8_t*>(payload.data()),
                                 payload.size());
}

void PrepareForTrigger(ClientSession& session, int64_t clock_offset_ms) {
  session.impl_->PrepareForTrigger(clock_offset_ms);
}

}  // namespace test
#endif

}  // namespace syncplay
