#include "net.h"
#include "syncplay/test_hooks.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace syncplay {
namespace {

constexpr uint8_t kRiffMarker[4] = {'R', 'I', 'F', 'F'};
constexpr uint8_t kWaveMarker[4] = {'W', 'A', 'V', 'E'};
constexpr uint8_t kFmtMarker[4] = {'f', 'm', 't', ' '};
constexpr uint8_t kDataMarker[4] = {'d', 'a', 't', 'a'};

constexpr size_t kOffsetRiffSize = 4;
constexpr size_t kOffsetWave = 8;
constexpr size_t kOffsetFmt = 12;
constexpr size_t kOffsetFmtSize = 16;
constexpr size_t kOffsetAudioFormat = 20;
constexpr size_t kOffsetChannels = 22;
constexpr size_t kOffsetSampleRate = 24;
constexpr size_t kOffsetByteRate = 28;
constexpr size_t kOffsetBlockAlign = 32;
constexpr size_t kOffsetBitsPerSample = 34;
constexpr size_t kOffsetData = 36;
constexpr size_t kOffsetDataSize = 40;

constexpr uint32_t kFmtChunkSize = 16;
constexpr uint16_t kPcmFormat = 1;

// Read little-endian integers from header bytes.
uint16_t ReadLe16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

uint32_t ReadLe32(const uint8_t* data, size_t offset) {
  return static_cast<uint32_t>(data[offset]) |
         (static_cast<uint32_t>(data[offset + 1]) << 8) |
         (static_cast<uint32_t>(data[offset + 2]) << 16) |
         (static_cast<uint32_t>(data[offset + 3]) << 24);
}

// Write little-endian integers into header bytes.
void WriteLe16(std::vector<uint8_t>& data, size_t offset, uint32_t value) {
  data[offset] = static_cast<uint8_t>(value & 0xff);
  data[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xff);
}

void WriteLe32(std::vector<uint8_t>& data, size_t offset, uint32_t value) {
  data[offset] = static_cast<uint8_t>(value & 0xff);
  data[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xff);
  data[offset + 2] = static_cast<uint8_t>((value >> 16) & 0xff);
  data[offset + 3] = static_cast<uint8_t>((value >> 24) & 0xff);
}

void WriteMarker(std::vector<uint8_t>& data, size_t offset, const uint8_t (&marker)[4]) {
  std::memcpy(data.data() + offset, marker, sizeof(marker));
}

bool HasMarker(const uint8_t* data, size_t offset, const uint8_t (&marker)[4]) {
  return std::memcmp(data + offset, marker, sizeof(marker)) == 0;
}

bool StartsWith(const std::string& text, const char* prefix) {
  const size_t length = std::strlen(prefix);
  return text.size() >= length && text.compare(0, length, prefix) == 0;
}

}  // namespace

namespace detail {

bool ParseInt64(const std::string& text, int64_t* out) {
  if (text.empty()) {
    return false;
  }
  const size_t start = text[0] == '-' ? 1 : 0;
  if (start == text.size()) {
    return false;
  }
  for (size_t i = start; i < text.size(); ++i) {
    if (text[i] < '0' || text[i] > '9') {
      return false;
    }
  }
  errno = 0;
  char* end = nullptr;
  const long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno == ERANGE || end != text.c_str() + text.size()) {
    return false;
  }
  *out = static_cast<int64_t>(value);
  return true;
}

}  // namespace detail

const char* ToString(DeviceState state) {
  switch (state) {
    case DeviceState::kAwaitingPayload:
      return "awaiting-payload";
    case DeviceState::kReady:
      return "ready";
  }
  return "unknown";
}

const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kTransportUnreachable:
      return "transport-unreachable";
    case ErrorKind::kDecodeFailure:
      return "decode-failure";
    case ErrorKind::kInsufficientSamples:
      return "insufficient-samples";
    case ErrorKind::kMalformedMessage:
      return "malformed-message";
    case ErrorKind::kDeviceRecordConflict:
      return "device-record-conflict";
    case ErrorKind::kInvalidConfig:
      return "invalid-config";
  }
  return "unknown";
}

std::string EncodeReady(const std::string& display_name) {
  return std::string(kReadyPrefix) + display_name;
}

std::string EncodePlayAt(int64_t instant_ms) {
  return std::string(kPlayAtPrefix) + std::to_string(instant_ms);
}

bool DecodeControlMessage(const std::string& datagram, ControlMessage* out) {
  if (!out) {
    return false;
  }
  if (StartsWith(datagram, kReadyPrefix)) {
    out->type = ControlMessageType::kReady;
    out->display_name = datagram.substr(std::strlen(kReadyPrefix));
    out->instant_ms = 0;
    return true;
  }
  if (StartsWith(datagram, kPlayAtPrefix)) {
    int64_t instant = 0;
    if (!detail::ParseInt64(datagram.substr(std::strlen(kPlayAtPrefix)), &instant)) {
      return false;
    }
    out->type = ControlMessageType::kPlayAt;
    out->display_name.clear();
    out->instant_ms = instant;
    return true;
  }
  return false;
}

bool DecodeControlMessage(const uint8_t* data, size_t length, ControlMessage* out) {
  if (!data || length == 0) {
    return false;
  }
  return DecodeControlMessage(
      std::string(reinterpret_cast<const char*>(data), length), out);
}

uint32_t AudioFormat::block_align() const {
  return static_cast<uint32_t>(channels) * (bits_per_sample / 8);
}

uint32_t AudioFormat::byte_rate() const {
  return sample_rate * block_align();
}

std::vector<uint8_t> BuildWavHeader(const AudioFormat& format, uint32_t data_size) {
  std::vector<uint8_t> header(kWavHeaderSize, 0x00);
  WriteMarker(header, 0, kRiffMarker);
  WriteLe32(header, kOffsetRiffSize, data_size + 36);
  WriteMarker(header, kOffsetWave, kWaveMarker);
  WriteMarker(header, kOffsetFmt, kFmtMarker);
  WriteLe32(header, kOffsetFmtSize, kFmtChunkSize);
  WriteLe16(header, kOffsetAudioFormat, kPcmFormat);
  WriteLe16(header, kOffsetChannels, format.channels);
  WriteLe32(header, kOffsetSampleRate, format.sample_rate);
  WriteLe32(header, kOffsetByteRate, format.byte_rate());
  WriteLe16(header, kOffsetBlockAlign, format.block_align());
  WriteLe16(header, kOffsetBitsPerSample, format.bits_per_sample);
  WriteMarker(header, kOffsetData, kDataMarker);
  WriteLe32(header, kOffsetDataSize, data_size);
  return header;
}

bool ParseWavHeader(const uint8_t* data, size_t length, WavHeader* out) {
  if (!out || !data || length < kWavHeaderSize) {
    return false;
  }
  if (!HasMarker(data, 0, kRiffMarker) || !HasMarker(data, kOffsetWave, kWaveMarker)) {
    return false;
  }
  out->format.channels = ReadLe16(data, kOffsetChannels);
  out->format.sample_rate = ReadLe32(data, kOffsetSampleRate);
  out->format.bits_per_sample = ReadLe16(data, kOffsetBitsPerSample);
  out->data_size = ReadLe32(data, kOffsetDataSize);
  return true;
}

std::string FormatPayloadInfo(const PayloadInfo& info) {
  std::ostringstream oss;
  oss << "sampleRate=" << info.sample_rate << "&channels=" << info.channels
      << "&duration=" << info.duration_ms;
  return oss.str();
}

bool ParsePayloadInfo(const std::string& text, PayloadInfo* out) {
  if (!out) {
    return false;
  }
  PayloadInfo info;
  bool have_rate = false;
  bool have_channels = false;
  bool have_duration = false;
  std::istringstream iss(text);
  std::string pair;
  while (std::getline(iss, pair, '&')) {
    const auto eq = pair.find('=');
    if (eq == std::string::npos) {
      return false;
    }
    const std::string key = pair.substr(0, eq);
    int64_t value = 0;
    if (!detail::ParseInt64(pair.substr(eq + 1), &value) || value < 0) {
      return false;
    }
    if (key == "sampleRate") {
      info.sample_rate = static_cast<uint32_t>(value);
      have_rate = true;
    } else if (key == "channels") {
      info.channels = static_cast<uint16_t>(value);
      have_channels = true;
    } else if (key == "duration") {
      info.duration_ms = value;
      have_duration = true;
    }
  }
  if (!have_rate || !have_channels || !have_duration) {
    return false;
  }
  *out = info;
  return true;
}

#ifdef SYNCPLAY_TESTING
namespace test {

bool ParseInteger(const std::string& text, int64_t* out) {
  return out && detail::ParseInt64(text, out);
}

}  // namespace test
#endif

}  // namespace syncplay
