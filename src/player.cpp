#include "net.h"

#include <algorithm>
#include <exception>
#include <sstream>
#include <thread>
#include <utility>

namespace syncplay {
namespace {

constexpr size_t kWriteChunkSize = 4096;

}  // namespace

struct Player::Impl {
  explicit Impl(Config config)
      : config_(std::move(config)), scheduler_(config_.precision_margin) {}

  ~Impl() { Stop(); }

  void SetSink(std::shared_ptr<AudioSink> sink) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    sink_ = std::move(sink);
  }

  void Load(std::shared_ptr<const DecodedAudio> audio) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    audio_ = std::move(audio);
  }

  void SetStartCallback(StartCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    start_cb_ = std::move(cb);
  }

  bool PlayAt(int64_t local_ms) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (playing_) {
      detail::LogError("Already playing, ignoring duplicate play command", &config_);
      return false;
    }
    if (thread_.joinable()) {
      thread_.join();
    }
    stop_ = false;
    scheduler_.Reset();
    playing_ = true;
    auto sink = sink_;
    auto audio = audio_;
    try {
      thread_ = std::thread([this, local_ms, sink, audio]() {
        PlaybackLoop(local_ms, sink, audio);
      });
    } catch (const std::exception& ex) {
      playing_ = false;
      detail::LogError(std::string("playback thread start failed: ") + ex.what(), &config_);
      return false;
    }
    return true;
  }

  void Stop() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stop_ = true;
    scheduler_.Cancel();
    if (playing_ && sink_) {
      sink_->Stop();
    }
    if (thread_.joinable()) {
      thread_.join();
    }
    playing_ = false;
  }

  bool IsPlaying() const { return playing_.load(); }

 private:
  void PlaybackLoop(int64_t target_ms, const std::shared_ptr<AudioSink>& sink,
                    const std::shared_ptr<const DecodedAudio>& audio) {
    const bool has_audio = sink && audio && !audio->pcm.empty();
    size_t offset = 0;

    // Prime the device buffer before the trigger to avoid an initial underrun.
    if (has_audio) {
      const size_t capacity =
          sink->BufferCapacityFrames() * audio->format.block_align();
      const size_t prime = std::min(audio->pcm.size(), capacity);
      if (prime > 0) {
        const int written = sink->Write(audio->pcm.data(), 0, prime);
        if (written < 0) {
          std::ostringstream oss;
          oss << "Priming write failed: " << written;
          detail::LogError(oss.str(), &config_);
        } else {
          offset = static_cast<size_t>(written);
        }
      }
    }

    int64_t actual_ms = 0;
    const TriggerResult result = scheduler_.Run(target_ms, [&]() {
      if (has_audio) {
        sink->Play();
      }
      actual_ms = NowEpochMillis();
    });
    if (result == TriggerResult::kCancelled) {
      detail::LogError("Playback cancelled before start", &config_);
      playing_ = false;
      return;
    }
    if (result == TriggerResult::kLate) {
      std::ostringstream oss;
      oss << "Trigger time already passed by " << (actual_ms - target_ms)
          << " ms, playing immediately";
      detail::LogError(oss.str(), &config_);
    }
    NotifyStart(target_ms, actual_ms);

    if (has_audio) {
      const auto& pcm = audio->pcm;
      while (offset < pcm.size() && !stop_) {
        const size_t chunk = std::min(kWriteChunkSize, pcm.size() - offset);
        const int written = sink->Write(pcm.data(), offset, chunk);
        if (written < 0) {
          std::ostringstream oss;
          oss << "Error writing to audio sink: " << written;
          detail::LogError(oss.str(), &config_);
          break;
        }
        if (written == 0) {
          detail::LogError("Audio sink accepted no data, ending playback", &config_);
          break;
        }
        offset += static_cast<size_t>(written);
      }
      if (!stop_) {
        sink->Stop();
        sink->Flush();
      }
    }
    playing_ = false;
  }

  void NotifyStart(int64_t target_ms, int64_t actual_ms) {
    StartCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = start_cb_;
    }
    if (!cb_copy) {
      return;
    }
    try {
      cb_copy(target_ms, actual_ms);
    } catch (const std::exception& ex) {
      detail::LogError(std::string("StartCallback threw: ") + ex.what(), &config_);
    }
  }

  Config config_;
  TriggerScheduler scheduler_;
  std::mutex state_mutex_;
  std::shared_ptr<AudioSink> sink_;
  std::shared_ptr<const DecodedAudio> audio_;
  std::thread thread_;
  std::atomic<bool> playing_{false};
  std::atomic<bool> stop_{false};

  std::mutex callback_mutex_;
  StartCallback start_cb_;
};

Player::Player(Config config) : impl_(std::make_unique<Impl>(std::move(config))) {}

Player::~Player() = default;

void Player::SetSink(std::shared_ptr<AudioSink> sink) { impl_->SetSink(std::move(sink)); }

void Player::Load(std::shared_ptr<const DecodedAudio> audio) {
  impl_->Load(std::move(audio));
}

void Player::SetStartCallback(StartCallback cb) { impl_->SetStartCallback(std::move(cb)); }

bool Player::PlayAt(int64_t local_ms) { return impl_->PlayAt(local_ms); }

void Player::Stop() { impl_->Stop(); }

bool Player::IsPlaying() const { return impl_->IsPlaying(); }

}  // namespace syncplay
