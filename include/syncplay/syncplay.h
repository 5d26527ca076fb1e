#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace syncplay {

class HostSession;
class ClientSession;

#ifdef SYNCPLAY_TESTING
namespace test {
struct HttpResult;
HttpResult HandleHttpRequest(HostSession& session,
                             const std::string& method,
                             const std::string& path,
                             const std::string& peer_address);
void InjectControlDatagram(HostSession& session,
                           const std::string& payload,
                           const std::string& sender_address);
void InjectControlDatagram(ClientSession& session, const std::string& payload);
void PrepareForTrigger(ClientSession& session, int64_t clock_offset_ms);
}  // namespace test
#endif

/**
 * Well-known ports. HTTP carries the payload and time queries, the two UDP
 * ports carry control datagrams.
 */
constexpr uint16_t kDefaultHttpPort = 8080;
constexpr uint16_t kControlPort = 9999;  // client -> host (READY)
constexpr uint16_t kTriggerPort = 9998;  // host -> client (PLAY_AT)

/**
 * Control datagram prefixes.
 */
constexpr char kReadyPrefix[] = "READY|";
constexpr char kPlayAtPrefix[] = "PLAY_AT|";

/// Size of the canonical PCM WAV header prepended to /audio responses.
constexpr size_t kWavHeaderSize = 44;

/// Current wall-clock time in milliseconds since the UNIX epoch.
int64_t NowEpochMillis();

/**
 * Lifecycle state of a device known to the host. Moves forward only.
 */
enum class DeviceState {
  kAwaitingPayload,
  kReady,
};

const char* ToString(DeviceState state);

/**
 * One remote participant known to the host.
 */
struct Device {
  /// IPv4 address of the device; unique key within the registry.
  std::string address;
  /// Name reported by the device, or a generated "Device-N".
  std::string display_name;
  /// Current lifecycle state.
  DeviceState state = DeviceState::kAwaitingPayload;
  /// Last time the device contacted the host.
  std::chrono::steady_clock::time_point last_seen;
};

/**
 * Device lifecycle events emitted by the registry.
 */
enum class DeviceEventType {
  kConnected,
  kReady,
};

struct DeviceEvent {
  DeviceEventType type = DeviceEventType::kConnected;
  Device device;
};

/**
 * Lightweight counters for datagram/HTTP flow and error reporting.
 */
struct SessionMetrics {
  uint64_t datagrams_received = 0;
  uint64_t datagrams_sent = 0;
  uint64_t parse_errors = 0;
  uint64_t send_errors = 0;
  uint64_t http_requests = 0;
  uint64_t http_errors = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Failure categories surfaced by the client session.
 */
enum class ErrorKind {
  kNone,
  kTransportUnreachable,
  kDecodeFailure,
  kInsufficientSamples,
  kMalformedMessage,
  kDeviceRecordConflict,
  kInvalidConfig,
};

const char* ToString(ErrorKind kind);

// ---------------------------------------------------------------------------
// Clock synchronization
// ---------------------------------------------------------------------------

/**
 * One round-trip time measurement against the host clock.
 */
struct ClockSample {
  /// Local time the time query was sent (epoch ms).
  int64_t local_send_ms = 0;
  /// Host time reported in the response (epoch ms).
  int64_t remote_ms = 0;
  /// Local time the response arrived (epoch ms).
  int64_t local_receive_ms = 0;

  int64_t round_trip_ms() const;
  /// Estimated host time minus local time for this sample.
  int64_t offset_ms() const;
};

/**
 * Median of a set of offsets (element n/2 after sorting), or nullopt when
 * empty.
 */
std::optional<int64_t> MedianOffset(std::vector<int64_t> offsets);

/**
 * Estimate the clock offset from a batch of samples.
 *
 * A host instant H maps to the local timeline as H - offset.
 *
 * @return nullopt if no samples were provided.
 */
std::optional<int64_t> EstimateClockOffset(const std::vector<ClockSample>& samples);

// ---------------------------------------------------------------------------
// Wire formats
// ---------------------------------------------------------------------------

enum class ControlMessageType {
  kReady,
  kPlayAt,
};

/**
 * Decoded control datagram.
 */
struct ControlMessage {
  ControlMessageType type = ControlMessageType::kReady;
  /// Set for kReady.
  std::string display_name;
  /// Set for kPlayAt: host-clock epoch milliseconds.
  int64_t instant_ms = 0;
};

std::string EncodeReady(const std::string& display_name);
std::string EncodePlayAt(int64_t instant_ms);

/**
 * Decode a control datagram.
 *
 * @return false for unknown prefixes or malformed fields.
 */
bool DecodeControlMessage(const uint8_t* data, size_t length, ControlMessage* out);
bool DecodeControlMessage(const std::string& datagram, ControlMessage* out);

/**
 * Raw PCM sample layout.
 */
struct AudioFormat {
  uint32_t sample_rate = 44100;
  uint16_t channels = 2;
  uint16_t bits_per_sample = 16;

  uint32_t block_align() const;
  uint32_t byte_rate() const;
};

struct WavHeader {
  AudioFormat format;
  uint32_t data_size = 0;
};

std::vector<uint8_t> BuildWavHeader(const AudioFormat& format, uint32_t data_size);
bool ParseWavHeader(const uint8_t* data, size_t length, WavHeader* out);

/**
 * Payload metadata served on /info.
 */
struct PayloadInfo {
  uint32_t sample_rate = 0;
  uint16_t channels = 0;
  int64_t duration_ms = 0;
};

std::string FormatPayloadInfo(const PayloadInfo& info);
bool ParsePayloadInfo(const std::string& text, PayloadInfo* out);

// ---------------------------------------------------------------------------
// Audio collaborators
// ---------------------------------------------------------------------------

/**
 * Uncompressed PCM held in memory.
 */
struct DecodedAudio {
  std::vector<uint8_t> pcm;
  AudioFormat format;

  int64_t duration_ms() const;
  PayloadInfo info() const;
};

/**
 * Turn downloaded /audio bytes into PCM. Bytes with a RIFF header are parsed
 * as WAV; anything else is taken as raw PCM in the default format.
 */
bool DecodePayloadBytes(const std::vector<uint8_t>& bytes, DecodedAudio* out,
                        std::string* error = nullptr);

/**
 * Audio output device. Implementations own buffering and hardware writes.
 */
class AudioSink {
 public:
  virtual ~AudioSink() = default;

  /// Capacity of the device buffer in frames.
  virtual size_t BufferCapacityFrames() const = 0;
  /// Write length bytes starting at data + offset. Returns bytes written or
  /// a negative value on error.
  virtual int Write(const uint8_t* data, size_t offset, size_t length) = 0;
  virtual void Play() = 0;
  virtual void Stop() = 0;
  virtual void Flush() = 0;
};

/**
 * Decodes a source (file path, URI) into PCM.
 */
class PayloadDecoder {
 public:
  virtual ~PayloadDecoder() = default;

  virtual bool Decode(const std::string& source, DecodedAudio* out,
                      std::string* error) = 0;
};

/**
 * PayloadDecoder for uncompressed PCM WAV files on disk.
 */
class WavFileDecoder : public PayloadDecoder {
 public:
  bool Decode(const std::string& source, DecodedAudio* out,
              std::string* error) override;
};

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

/**
 * Session configuration shared by host and client.
 */
struct Config {
  using LogCallback = std::function<void(const std::string&)>;

  /// Name sent in READY datagrams.
  std::string device_name = "syncplay";

  /// Local bind address for sockets (usually 0.0.0.0).
  std::string bind_address = "0.0.0.0";
  /// Broadcast address that also receives PLAY_AT datagrams.
  std::string broadcast_address = "255.255.255.255";

  /// HTTP port serving /audio, /time and /info.
  uint16_t http_port = kDefaultHttpPort;
  /// UDP port the host listens on for READY.
  uint16_t control_port = kControlPort;
  /// UDP port clients listen on for PLAY_AT.
  uint16_t trigger_port = kTriggerPort;

  /// How far in the future the host schedules playback.
  std::chrono::milliseconds sync_delay{3000};
  /// Final stretch before the trigger that is busy-polled instead of slept.
  std::chrono::milliseconds precision_margin{50};

  /// Number of /time round trips per clock sync.
  int clock_sample_count = 5;
  /// Pause between clock samples.
  std::chrono::milliseconds clock_sample_interval{100};

  /// TCP connect timeout for HTTP requests.
  std::chrono::milliseconds connect_timeout{30000};
  /// Socket read/write timeout for HTTP transfers.
  std::chrono::milliseconds read_timeout{120000};

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

// ---------------------------------------------------------------------------
// Device registry
// ---------------------------------------------------------------------------

/**
 * Host-side table of devices keyed by address. Every operation is atomic per
 * address; events are delivered after the table lock is released.
 */
class DeviceRegistry {
 public:
  using EventCallback = std::function<void(const DeviceEvent&)>;

  DeviceRegistry() = default;

  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

  void SetEventCallback(EventCallback cb);

  /// Return the device for address, creating it as Device-N if absent.
  Device RecordContact(const std::string& address);
  /// Mark the device ready, creating it if absent.
  Device MarkReady(const std::string& address, const std::string& display_name);

  /// Copy of all devices in first-seen order.
  std::vector<Device> Snapshot() const;
  /// True iff non-empty and every device is ready.
  bool AllReady() const;
  size_t Size() const;
  size_t ReadyCount() const;
  void Clear();

 private:
  void Deliver(const std::vector<DeviceEvent>& events);

  mutable std::mutex mutex_;
  std::vector<Device> devices_;
  std::unordered_map<std::string, size_t> index_;

  std::mutex callback_mutex_;
  EventCallback event_cb_;
};

// ---------------------------------------------------------------------------
// Trigger scheduling and playback
// ---------------------------------------------------------------------------

enum class TriggerResult {
  kExecuted,
  kLate,
  kCancelled,
};

/**
 * Runs an action as close as possible to a wall-clock instant: a coarse
 * sleep until precision_margin before the target, then a busy poll.
 */
class TriggerScheduler {
 public:
  explicit TriggerScheduler(
      std::chrono::milliseconds precision_margin = std::chrono::milliseconds(50));

  TriggerScheduler(const TriggerScheduler&) = delete;
  TriggerScheduler& operator=(const TriggerScheduler&) = delete;

  /**
   * Block until target_ms (epoch ms, local clock) and run action once.
   *
   * A target already in the past runs the action immediately and reports
   * kLate. A Cancel() before the action skips it and reports kCancelled.
   */
  TriggerResult Run(int64_t target_ms, const std::function<void()>& action);

  /// Request cancellation of a pending Run().
  void Cancel();
  /// Clear a previous cancellation.
  void Reset();
  bool cancelled() const { return cancelled_.load(); }

 private:
  std::chrono::milliseconds precision_margin_;
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};

/**
 * Plays a PCM payload through an AudioSink starting at a scheduled instant.
 */
class Player {
 public:
  using StartCallback = std::function<void(int64_t target_ms, int64_t actual_ms)>;

  explicit Player(Config config);
  ~Player();

  Player(const Player&) = delete;
  Player& operator=(const Player&) = delete;

  void SetSink(std::shared_ptr<AudioSink> sink);
  void Load(std::shared_ptr<const DecodedAudio> audio);
  void SetStartCallback(StartCallback cb);

  /**
   * Schedule playback at local_ms on a dedicated thread.
   *
   * @return false if playback is already pending or running.
   */
  bool PlayAt(int64_t local_ms);
  /// Cancel a pending trigger, stop the sink and join the playback thread.
  void Stop();
  bool IsPlaying() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// ---------------------------------------------------------------------------
// Sessions
// ---------------------------------------------------------------------------

/**
 * Host side: serves the payload, tracks devices and issues the play trigger.
 */
class HostSession {
 public:
  using DeviceEventCallback = std::function<void(const DeviceEvent&)>;

  /// Construct a host with the provided configuration and optional sink.
  explicit HostSession(Config config, std::shared_ptr<AudioSink> sink = nullptr);
  /// Stop background threads and close sockets.
  ~HostSession();

  HostSession(const HostSession&) = delete;
  HostSession& operator=(const HostSession&) = delete;

  /// Replace the payload served on /audio and played locally.
  bool LoadPayload(DecodedAudio audio);
  /// Decode source with decoder and load the result.
  bool LoadPayloadFromFile(const std::string& source, PayloadDecoder& decoder);

  /// Open sockets and start background threads. Restarts if running.
  bool Start();
  /// Cancel playback, close sockets, join threads and forget all devices.
  void Stop();
  bool IsRunning() const;

  /**
   * Broadcast PLAY_AT for now + sync_delay and schedule local playback at the
   * same instant.
   *
   * @return The host-clock trigger instant, or nullopt if not running.
   */
  std::optional<int64_t> StartPlayback();
  /// Cancel a pending trigger or stop local playback.
  void StopPlayback();

  /// Set callback invoked on device lifecycle events.
  void SetDeviceEventCallback(DeviceEventCallback cb);
  /// Set callback invoked when local playback actually starts.
  void SetPlaybackStartCallback(Player::StartCallback cb);

  /// Return the devices known to this session in first-seen order.
  std::vector<Device> GetDevices() const;
  /// True when at least one device is known and all are ready.
  bool AllDevicesReady() const;
  /// Metadata of the loaded payload, if any.
  std::optional<PayloadInfo> GetPayloadInfo() const;
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;
  /// Return metrics for datagrams, HTTP requests, errors, and callbacks.
  SessionMetrics GetMetrics() const;
  /// Address clients should connect to (see GetLocalIpv4Address()).
  std::string GetLocalAddress() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef SYNCPLAY_TESTING
  friend test::HttpResult test::HandleHttpRequest(HostSession& session,
                                                  const std::string& method,
                                                  const std::string& path,
                                                  const std::string& peer_address);
  friend void test::InjectControlDatagram(HostSession& session,
                                          const std::string& payload,
                                          const std::string& sender_address);
#endif
};

/**
 * Client lifecycle.
 */
enum class ClientState {
  kIdle,
  kConnecting,
  kDownloading,
  kSyncing,
  kReady,
  kPlaying,
  kError,
};

const char* ToString(ClientState state);

/**
 * Client side: downloads the payload, syncs its clock and plays on trigger.
 */
class ClientSession {
 public:
  using StateCallback = std::function<void(ClientState)>;
  using ProgressCallback = std::function<void(float)>;
  using PlayCallback = std::function<void(int64_t local_instant_ms)>;

  explicit ClientSession(Config config, std::shared_ptr<AudioSink> sink = nullptr);
  ~ClientSession();

  ClientSession(const ClientSession&) = delete;
  ClientSession& operator=(const ClientSession&) = delete;

  /**
   * Download, sync and announce readiness to the host. Blocks the caller.
   *
   * @return true once the session is kReady; false on failure (state kError)
   *         or if the session was not kIdle.
   */
  bool Connect(const std::string& host_address);
  /// Stop listening and playback and return to kIdle.
  void Reset();

  void SetStateCallback(StateCallback cb);
  void SetProgressCallback(ProgressCallback cb);
  /// Invoked with the translated local instant when a trigger is accepted.
  void SetPlayCallback(PlayCallback cb);
  void SetPlaybackStartCallback(Player::StartCallback cb);

  ClientState GetState() const;
  /// Estimated host-minus-local offset in milliseconds.
  int64_t GetClockOffset() const;
  std::optional<PayloadInfo> GetPayloadInfo() const;
  ErrorKind GetLastErrorKind() const;
  std::string GetLastError() const;
  SessionMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef SYNCPLAY_TESTING
  friend void test::InjectControlDatagram(ClientSession& session,
                                          const std::string& payload);
  friend void test::PrepareForTrigger(ClientSession& session,
                                      int64_t clock_offset_ms);
#endif
};

/// First non-loopback IPv4 address of this host, or empty if none.
std::string GetLocalIpv4Address();

}  // namespace syncplay
