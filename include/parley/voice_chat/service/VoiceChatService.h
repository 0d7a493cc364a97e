#pragma once

#include "parley/voice_chat/service/AudioCache.h"
#include "parley/voice_chat/service/ChatCompletionStreamer.h"
#include "parley/voice_chat/service/ChatEventBuffer.h"
#include "parley/voice_chat/service/ConfigManager.h"
#include "parley/voice_chat/service/CoordinationState.h"
#include "parley/voice_chat/service/ErrorHandler.h"
#include "parley/voice_chat/service/PlaybackController.h"
#include "parley/voice_chat/service/RecordingController.h"
#include "parley/voice_chat/service/SpeechClient.h"
#include "parley/voice_chat/service/utils/AudioBackend.h"

#include <future>
#include <string>
#include <vector>

namespace parley::voice_chat::service {

/**
 * @brief 面向 UI 层的命令入口
 *
 * 阻塞的设备/网络操作在 std::async 工作线程中执行，调用方通过 future 等待结果；
 * 标量命令（stop/cancel/loudness/drain）立即返回。
 * 失败通过 future 抛出 VoiceChatError；取消与抢占以返回值体现，不是错误。
 *
 * 协作方（音频后端、合成、转写、缓存）由调用方持有，生命周期需长于本对象；
 * 析构前应等待所有返回的 future。
 */
class VoiceChatService {
public:
    VoiceChatService(ConfigManager& cfg,
                     utils::AudioBackend& backend,
                     SpeechSynthesizer& synthesizer,
                     Transcriber& transcriber,
                     AudioCache& cache);

    VoiceChatService(const VoiceChatService&) = delete;
    VoiceChatService& operator=(const VoiceChatService&) = delete;

    // ========== 录音 ==========
    // 返回转写文本；会话被取消时为空串
    std::future<std::string> startListening(const std::string& authToken, const std::string& language);
    void stopListening();
    void cancelListening();
    // [0, ∞) 为输入响度；-1 表示正在等待转写结果
    float getInputLoudness() const;

    // ========== 流式 chat completion ==========
    // endpoint 为空时使用 chat.endpoint
    std::future<StreamOutcome> startChatCompletion(ChatCompletionRequest request);
    // 自上次调用以来的事件（原子取走）
    std::vector<std::string> getChatCompletion(RequestId id);
    void cancelChatCompletion(RequestId id);
    void stopAllChatCompletions();

    // ========== 播放 ==========
    std::future<PlaybackOutcome> speak(SpeakRequest request);
    void stopAudio();
    std::future<void> playCue(SoundCue cue);

    const ErrorHandler& errorHandler() const { return m_log; }
    const ChatEventBuffer& chatEvents() const { return m_events; }

private:
    ConfigManager& m_cfg;
    ErrorHandler m_log;
    CoordinationState m_state;
    ChatEventBuffer m_events;
    ChatCompletionStreamer m_streamer;
    RecordingController m_recording;
    PlaybackController m_playback;
};

} // namespace parley::voice_chat::service
