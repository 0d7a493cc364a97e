#pragma once

#include "parley/voice_chat/service/AudioCache.h"
#include "parley/voice_chat/service/BeepCoordinator.h"
#include "parley/voice_chat/service/CoordinationState.h"
#include "parley/voice_chat/service/ErrorHandler.h"
#include "parley/voice_chat/service/SpeechClient.h"
#include "parley/voice_chat/service/SupersessionGuard.h"
#include "parley/voice_chat/service/utils/AudioBackend.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace parley::voice_chat::service {

struct SpeakRequest {
    std::string text;
    std::string voice;
    std::string apiKey;
    std::optional<std::string> cacheKey; // 缺省：voice + text
    float beepVolume{1.0f};              // 提示音开启时的音量 = on_volume * beepVolume
    bool preFetch{false};                // 只取回并缓存，不播放（不受门控）
    bool noCache{false};                 // 不写缓存
};

enum class PlaybackOutcome {
    Finished,    // 播放完毕（或空剪辑）
    Superseded,  // 被新的播放或 stopAudio 抢占
    Prefetched,  // 预取完成，未播放
    Skipped      // preFetch && noCache：无事可做
};

const char* playbackOutcomeToString(PlaybackOutcome o);

enum class SoundCue {
    SpeakerTest,          // 256 Hz, 1 s
    FocusInput,           // 880 Hz, 100 ms
    WaitingForCompletion  // 440 Hz, 200 ms
};

/**
 * @brief 语音播放：缓存查询 -> （提示音 + 合成）-> 写缓存 -> 受代际门控的播放
 */
class PlaybackController {
public:
    PlaybackController(CoordinationState& state,
                       utils::AudioBackend& backend,
                       SpeechSynthesizer& synthesizer,
                       AudioCache& cache,
                       const ErrorHandler& log,
                       BeepPattern beepPattern = {},
                       std::chrono::milliseconds pollInterval = SupersessionGuard::kDefaultPollInterval);

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    PlaybackOutcome speak(const SpeakRequest& request);

    // 播放编码后的剪辑，直到播放完毕或 token 过期；空剪辑直接返回 Finished
    PlaybackOutcome playClip(const std::vector<std::uint8_t>& encoded, const OperationToken& token);

    void stopAudio();

    // 不受门控的短提示音，阻塞到播放时长结束
    void playCue(SoundCue cue);

private:
    CoordinationState& state_;
    utils::AudioBackend& backend_;
    SpeechSynthesizer& synthesizer_;
    AudioCache& cache_;
    const ErrorHandler& log_;
    BeepPattern beepPattern_;
    std::chrono::milliseconds pollInterval_;
};

} // namespace parley::voice_chat::service
