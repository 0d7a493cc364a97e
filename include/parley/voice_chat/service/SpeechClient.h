#pragma once

#include "parley/voice_chat/service/ConfigManager.h"
#include "parley/voice_chat/service/ErrorHandler.h"

#include <cstdint>
#include <string>
#include <vector>

namespace parley::voice_chat::service {

struct SynthesisRequest {
    std::string text;
    std::string voice;  // 空：使用 speech.tts.voice
    std::string apiKey; // 空：使用 speech.tts.api_key / api.api_key
};

struct TranscriptionRequest {
    std::string apiKey;   // 空：使用 speech.stt.api_key / api.api_key
    std::string language; // 空：自动识别（不发送 language 字段）
    std::vector<std::uint8_t> wav;
};

/**
 * @brief 文本转语音协作方：返回编码后的音频剪辑
 */
class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;
    virtual std::vector<std::uint8_t> synthesize(const SynthesisRequest& request) = 0;
};

/**
 * @brief 语音转文本协作方
 */
class Transcriber {
public:
    virtual ~Transcriber() = default;
    virtual std::string transcribe(const TranscriptionRequest& request) = 0;
};

/**
 * @brief OpenAI 兼容的 TTS / STT 客户端
 *
 * - TTS：POST {base}/audio/speech，JSON {model, input, voice, response_format}
 * - STT：POST {base}/audio/transcriptions，multipart：file=audio.wav (audio/x-wav)、model、language（非空时）
 *
 * 失败抛出 VoiceChatError（UpstreamFailure 携带 "<status>: <body>"，或 NetworkError）。
 */
class SpeechClient : public SpeechSynthesizer, public Transcriber {
public:
    SpeechClient(const ConfigManager& cfg, const ErrorHandler& log);

    std::vector<std::uint8_t> synthesize(const SynthesisRequest& request) override;
    std::string transcribe(const TranscriptionRequest& request) override;

    // 解析 {"text": "..."}；形状不符时抛出 UpstreamFailure
    static std::string parseTranscript(const std::string& body);

private:
    struct Endpoint {
        std::string baseUrl;
        std::string apiKey;
        int timeoutMs{60000};
    };

    // section: "tts" 或 "stt"；空字段回退到 api.*
    Endpoint resolveEndpoint(const std::string& section, const std::string& apiKeyOverride) const;

    const ConfigManager& cfg_;
    const ErrorHandler& log_;
};

} // namespace parley::voice_chat::service
