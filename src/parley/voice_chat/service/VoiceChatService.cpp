#include "parley/voice_chat/service/VoiceChatService.h"

#include <chrono>
#include <utility>

namespace parley::voice_chat::service {

static std::chrono::milliseconds pollIntervalFrom(const ConfigManager& cfg) {
    const auto ms = cfg.getInt("audio.poll_interval_ms", SupersessionGuard::kDefaultPollInterval.count());
    return ms > 0 ? std::chrono::milliseconds(ms) : SupersessionGuard::kDefaultPollInterval;
}

VoiceChatService::VoiceChatService(ConfigManager& cfg,
                                   utils::AudioBackend& backend,
                                   SpeechSynthesizer& synthesizer,
                                   Transcriber& transcriber,
                                   AudioCache& cache)
    : m_cfg(cfg)
    , m_log(ErrorHandler::makeLoggerConfig(cfg))
    , m_streamer(m_events, m_log, static_cast<int>(cfg.getInt("chat.timeout_ms", 120000)))
    , m_recording(m_state, backend, transcriber, m_log, pollIntervalFrom(cfg))
    , m_playback(m_state, backend, synthesizer, cache, m_log, BeepPattern::fromConfig(cfg), pollIntervalFrom(cfg))
{}

std::future<std::string> VoiceChatService::startListening(const std::string& authToken, const std::string& language) {
    ListenRequest req;
    req.authToken = authToken;
    req.language = language;
    return std::async(std::launch::async, [this, req]() {
        return m_recording.listen(req);
    });
}

void VoiceChatService::stopListening() {
    m_recording.stop();
}

void VoiceChatService::cancelListening() {
    m_recording.cancel();
}

float VoiceChatService::getInputLoudness() const {
    return m_recording.inputLoudness();
}

std::future<StreamOutcome> VoiceChatService::startChatCompletion(ChatCompletionRequest request) {
    if (request.endpoint.empty()) {
        request.endpoint = m_cfg.getString("chat.endpoint");
    }
    // 先登记 id，调用方在工作线程启动前发出的取消也能生效
    m_events.open(request.id);
    return std::async(std::launch::async, [this, request = std::move(request)]() {
        return m_streamer.stream(request);
    });
}

std::vector<std::string> VoiceChatService::getChatCompletion(RequestId id) {
    return m_events.drain(id);
}

void VoiceChatService::cancelChatCompletion(RequestId id) {
    if (!m_events.cancel(id)) {
        m_log.log(ErrorHandler::LogLevel::Debug, "Chat completion " + std::to_string(id) + " is not tracked, nothing to cancel");
    }
}

void VoiceChatService::stopAllChatCompletions() {
    const auto n = m_events.cancelAll();
    m_log.log(ErrorHandler::LogLevel::Debug, "Cancelled " + std::to_string(n) + " chat completion(s)");
}

std::future<PlaybackOutcome> VoiceChatService::speak(SpeakRequest request) {
    return std::async(std::launch::async, [this, request = std::move(request)]() {
        return m_playback.speak(request);
    });
}

void VoiceChatService::stopAudio() {
    m_playback.stopAudio();
}

std::future<void> VoiceChatService::playCue(SoundCue cue) {
    return std::async(std::launch::async, [this, cue]() {
        m_playback.playCue(cue);
    });
}

} // namespace parley::voice_chat::service
