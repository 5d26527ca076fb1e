#include "syncplay/syncplay.h"

#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

namespace syncplay {
namespace {

constexpr size_t kRiffHeaderSize = 12;
constexpr size_t kChunkHeaderSize = 8;
constexpr size_t kFmtMinimumSize = 16;
constexpr uint16_t kPcmFormat = 1;

uint16_t ReadLe16(const uint8_t* data) {
  return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

uint32_t ReadLe32(const uint8_t* data) {
  return static_cast<uint32_t>(data[0]) | (static_cast<uint32_t>(data[1]) << 8) |
         (static_cast<uint32_t>(data[2]) << 16) |
         (static_cast<uint32_t>(data[3]) << 24);
}

bool Fail(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

// Walk RIFF chunks for "fmt " and "data". Tolerates extra chunks (LIST,
// fact) and a data size that overstates the bytes actually present.
bool ParseRiffPcm(const uint8_t* data, size_t length, DecodedAudio* out,
                  std::string* error) {
  if (length < kRiffHeaderSize || std::memcmp(data, "RIFF", 4) != 0 ||
      std::memcmp(data + 8, "WAVE", 4) != 0) {
    return Fail(error, "missing RIFF/WAVE markers");
  }
  bool have_format = false;
  AudioFormat format;
  size_t pos = kRiffHeaderSize;
  while (pos + kChunkHeaderSize <= length) {
    const uint8_t* chunk = data + pos;
    const uint32_t chunk_size = ReadLe32(chunk + 4);
    const size_t body = pos + kChunkHeaderSize;
    if (std::memcmp(chunk, "fmt ", 4) == 0) {
      if (chunk_size < kFmtMinimumSize || body + kFmtMinimumSize > length) {
        return Fail(error, "truncated fmt chunk");
      }
      const uint16_t audio_format = ReadLe16(data + body);
      if (audio_format != kPcmFormat) {
        std::ostringstream oss;
        oss << "unsupported WAV encoding " << audio_format << " (PCM only)";
        return Fail(error, oss.str());
      }
      format.channels = ReadLe16(data + body + 2);
      format.sample_rate = ReadLe32(data + body + 4);
      format.bits_per_sample = ReadLe16(data + body + 14);
      have_format = true;
    } else if (std::memcmp(chunk, "data", 4) == 0) {
      if (!have_format) {
        return Fail(error, "data chunk before fmt chunk");
      }
      if (format.channels == 0 || format.sample_rate == 0 ||
          format.bits_per_sample == 0 || format.bits_per_sample % 8 != 0) {
        return Fail(error, "invalid PCM format in fmt chunk");
      }
      const size_t available = length - body;
      const size_t size = chunk_size < available ? chunk_size : available;
      out->format = format;
      out->pcm.assign(data + body, data + body + size);
      return true;
    }
    // Chunks are padded to an even size.
    pos = body + chunk_size + (chunk_size & 1u);
  }
  return Fail(error, "no data chunk");
}

}  // namespace

int64_t DecodedAudio::duration_ms() const {
  const uint32_t block_align = format.block_align();
  if (block_align == 0 || format.sample_rate == 0) {
    return 0;
  }
  const int64_t frames = static_cast<int64_t>(pcm.size() / block_align);
  return frames * 1000 / format.sample_rate;
}

PayloadInfo DecodedAudio::info() const {
  PayloadInfo result;
  result.sample_rate = format.sample_rate;
  result.channels = format.channels;
  result.duration_ms = duration_ms();
  return result;
}

bool DecodePayloadBytes(const std::vector<uint8_t>& bytes, DecodedAudio* out,
                        std::string* error) {
  if (!out) {
    return Fail(error, "no output buffer");
  }
  if (bytes.empty()) {
    return Fail(error, "payload is empty");
  }
  if (bytes.size() >= 4 && std::memcmp(bytes.data(), "RIFF", 4) == 0) {
    return ParseRiffPcm(bytes.data(), bytes.size(), out, error);
  }
  out->format = AudioFormat{};
  out->pcm = bytes;
  return true;
}

bool WavFileDecoder::Decode(const std::string& source, DecodedAudio* out,
                            std::string* error) {
  if (!out) {
    return Fail(error, "no output buffer");
  }
  std::ifstream stream(source, std::ios::binary | std::ios::in);
  if (!stream) {
    return Fail(error, "failed to open audio file: " + source);
  }
  const std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(stream)),
                                   std::istreambuf_iterator<char>());
  if (!ParseRiffPcm(bytes.data(), bytes.size(), out, error)) {
    if (error) {
      *error = source + ": " + *error;
    }
    return false;
  }
  return true;
}

}  // namespace syncplay
