#include "parley/voice_chat/service/AudioCache.h"
#include "parley/voice_chat/service/ConfigManager.h"
#include "parley/voice_chat/service/ErrorTypes.h"
#include "parley/voice_chat/service/SpeechClient.h"
#include "parley/voice_chat/service/VoiceChatService.h"
#include "parley/voice_chat/service/utils/MiniaudioBackend.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

using parley::voice_chat::service::ChatCompletionRequest;
using parley::voice_chat::service::ConfigManager;
using parley::voice_chat::service::ErrorHandler;
using parley::voice_chat::service::ErrorInfo;
using parley::voice_chat::service::MemoryAudioCache;
using parley::voice_chat::service::RequestId;
using parley::voice_chat::service::SoundCue;
using parley::voice_chat::service::SpeakRequest;
using parley::voice_chat::service::SpeechClient;
using parley::voice_chat::service::StreamOutcome;
using parley::voice_chat::service::VoiceChatError;
using parley::voice_chat::service::VoiceChatService;
using parley::voice_chat::service::utils::MiniaudioBackend;

// 从一条 chat.completion.chunk 中取出增量文本
static std::string deltaContent(const std::string& event) {
    auto j = nlohmann::json::parse(event, nullptr, false);
    if (j.is_discarded() || !j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        return {};
    }
    const auto& choice = j["choices"][0];
    if (choice.contains("delta") && choice["delta"].is_object() && choice["delta"].contains("content") &&
        choice["delta"]["content"].is_string()) {
        return choice["delta"]["content"].get<std::string>();
    }
    return {};
}

static std::string waitLine() {
    std::string line;
    if (!std::getline(std::cin, line)) return "q";
    return line;
}

// 录音直到用户按回车；输入 c 回车则取消
static std::string recordOnce(VoiceChatService& svc, const std::string& apiKey, const std::string& language) {
    svc.playCue(SoundCue::FocusInput).get();
    auto transcript = svc.startListening(apiKey, language);

    std::atomic<bool> metering{true};
    std::thread meter([&] {
        while (metering.load()) {
            const float v = svc.getInputLoudness();
            const int bars = v < 0.0f ? 0 : std::min(40, static_cast<int>(v * 200.0f));
            std::cout << "\r[rec] " << std::string(static_cast<size_t>(bars), '#')
                      << std::string(static_cast<size_t>(40 - bars), ' ') << std::flush;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    const auto line = waitLine();
    if (line == "c") {
        svc.cancelListening();
    } else {
        svc.stopListening();
    }
    metering.store(false);
    meter.join();
    std::cout << "\r[rec] transcribing..." << std::string(30, ' ') << "\n";
    return transcript.get();
}

int main() {
    ConfigManager cfg;
    ErrorInfo err;
    if (!cfg.loadFromFile("config/voice_chat_config.json", &err)) {
        std::cerr << "Failed to load config: " << err.toString() << "\n";
        return 1;
    }
    cfg.applyEnvironmentOverrides();
    for (const auto& issue : cfg.validate()) {
        std::cerr << "[config] " << issue << "\n";
    }

    const auto apiKey = cfg.getString("api.api_key");
    const auto language = cfg.getString("speech.stt.language");
    const auto model = cfg.getString("chat.model", "gpt-4o-mini");

    MiniaudioBackend audio;
    ErrorHandler log(ErrorHandler::makeLoggerConfig(cfg));
    SpeechClient speech(cfg, log);
    MemoryAudioCache cache(cfg);
    VoiceChatService svc(cfg, audio, speech, speech, cache);

    nlohmann::json messages = nlohmann::json::array();
    messages.push_back({{"role", "system"}, {"content", "You are a helpful voice assistant. Answer briefly."}});

    std::cout << "Enter: start recording, Enter again: stop (c + Enter: cancel), q + Enter: quit\n";
    RequestId nextId = 1;
    for (;;) {
        if (waitLine() == "q") break;

        std::string text;
        try {
            text = recordOnce(svc, apiKey, language);
        } catch (const VoiceChatError& e) {
            std::cerr << "[rec] failed: " << e.info().toString() << "\n";
            continue;
        }
        if (text.empty()) {
            std::cout << "[rec] cancelled\n";
            continue;
        }
        std::cout << "You: " << text << "\n";
        messages.push_back({{"role", "user"}, {"content", text}});

        ChatCompletionRequest req;
        req.id = nextId++;
        req.secretKey = apiKey;
        req.apiKeyAuthentication = cfg.getBool("chat.api_key_authentication", false);
        req.body = nlohmann::json{{"model", model}, {"messages", messages}, {"stream", true}}.dump();

        auto waiting = svc.playCue(SoundCue::WaitingForCompletion);
        auto done = svc.startChatCompletion(req);

        std::string answer;
        std::cout << "Assistant: " << std::flush;
        for (;;) {
            const bool finished = done.wait_for(std::chrono::milliseconds(50)) == std::future_status::ready;
            for (const auto& ev : svc.getChatCompletion(req.id)) {
                const auto piece = deltaContent(ev);
                answer += piece;
                std::cout << piece << std::flush;
            }
            if (finished) break;
        }
        std::cout << "\n";
        waiting.get();

        try {
            if (done.get() == StreamOutcome::Cancelled) continue;
        } catch (const VoiceChatError& e) {
            std::cerr << "[chat] failed: " << e.info().toString() << "\n";
            messages.erase(messages.end() - 1);
            continue;
        }
        messages.push_back({{"role", "assistant"}, {"content", answer}});

        SpeakRequest sr;
        sr.text = answer;
        sr.apiKey = apiKey;
        sr.beepVolume = 0.3f;
        try {
            svc.speak(sr).get();
        } catch (const VoiceChatError& e) {
            std::cerr << "[tts] failed: " << e.info().toString() << "\n";
        }
    }

    svc.stopAudio();
    svc.stopAllChatCompletions();
    return 0;
}
