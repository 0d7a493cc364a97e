#include "parley/voice_chat/service/SpeechClient.h"

#include "parley/voice_chat/service/utils/HttpClient.h"

#include <map>
#include <optional>
#include <string>

namespace parley::voice_chat::service {

using utils::HttpClient;
using utils::HttpMethod;
using utils::HttpRequest;
using utils::HttpResponse;

static std::string joinUrl(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;
    if (base.back() == '/' && path.front() == '/') return base.substr(0, base.size() - 1) + path;
    if (base.back() != '/' && path.front() != '/') return base + "/" + path;
    return base + path;
}

static ErrorInfo upstreamError(const HttpResponse& resp, const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    return ErrorHandler::fromHttpResponse(resp, std::optional<HttpRequest>{req});
}

SpeechClient::SpeechClient(const ConfigManager& cfg, const ErrorHandler& log)
    : cfg_(cfg)
    , log_(log)
{}

SpeechClient::Endpoint SpeechClient::resolveEndpoint(const std::string& section,
                                                     const std::string& apiKeyOverride) const {
    const std::string prefix = "speech." + section + ".";
    Endpoint ep;
    ep.baseUrl = cfg_.getString(prefix + "base_url");
    if (ep.baseUrl.empty()) ep.baseUrl = cfg_.getString("api.base_url", "https://api.openai.com/v1");
    ep.apiKey = apiKeyOverride;
    if (ep.apiKey.empty()) ep.apiKey = cfg_.getString(prefix + "api_key");
    if (ep.apiKey.empty()) ep.apiKey = cfg_.getString("api.api_key");
    ep.timeoutMs = static_cast<int>(cfg_.getInt(prefix + "timeout_ms", cfg_.getInt("api.default_timeout_ms", 60000)));
    return ep;
}

std::vector<std::uint8_t> SpeechClient::synthesize(const SynthesisRequest& request) {
    const auto ep = resolveEndpoint("tts", request.apiKey);

    nlohmann::json body;
    body["model"] = cfg_.getString("speech.tts.model_id", "tts-1");
    body["input"] = request.text;
    body["voice"] = request.voice.empty() ? cfg_.getString("speech.tts.voice", "alloy") : request.voice;
    const auto format = cfg_.getString("speech.tts.response_format", "mp3");
    if (!format.empty()) {
        body["response_format"] = format;
    }

    HttpClient client(ep.baseUrl);
    client.setTimeout(ep.timeoutMs);
    std::map<std::string, std::string> headers;
    headers["Authorization"] = "Bearer " + ep.apiKey;

    log_.log(ErrorHandler::LogLevel::Debug,
             "TTS request: " + std::to_string(request.text.size()) + " bytes of text, key=" +
                 ConfigManager::redactSensitive("speech.tts.api_key", ep.apiKey));
    auto resp = client.postJson("/audio/speech", body.dump(), headers);
    if (!resp.isSuccess()) {
        auto info = upstreamError(resp, joinUrl(ep.baseUrl, "/audio/speech"));
        log_.log(ErrorHandler::LogLevel::Warning, "TTS request failed", info);
        throw VoiceChatError(info);
    }

    return std::vector<std::uint8_t>(resp.body.begin(), resp.body.end());
}

std::string SpeechClient::transcribe(const TranscriptionRequest& request) {
    const auto ep = resolveEndpoint("stt", request.apiKey);

    std::map<std::string, std::string> fields;
    fields["model"] = cfg_.getString("speech.stt.model_id", "whisper-1");
    const auto language = request.language.empty() ? cfg_.getString("speech.stt.language") : request.language;
    if (!language.empty()) {
        fields["language"] = language;
    }

    HttpClient::MultipartFile filePart;
    filePart.filename = "audio.wav";
    filePart.contentType = "audio/x-wav";
    filePart.data.assign(request.wav.begin(), request.wav.end());

    std::map<std::string, HttpClient::MultipartFile> files;
    files["file"] = std::move(filePart);

    HttpClient client(ep.baseUrl);
    client.setTimeout(ep.timeoutMs);
    std::map<std::string, std::string> headers;
    headers["Authorization"] = "Bearer " + ep.apiKey;

    auto resp = client.postMultipart("/audio/transcriptions", fields, files, headers);
    if (!resp.isSuccess()) {
        auto info = upstreamError(resp, joinUrl(ep.baseUrl, "/audio/transcriptions"));
        log_.log(ErrorHandler::LogLevel::Warning, "Transcription request failed", info);
        throw VoiceChatError(info);
    }
    return parseTranscript(resp.body);
}

std::string SpeechClient::parseTranscript(const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("text") || !j["text"].is_string()) {
        throw VoiceChatError(ErrorType::UpstreamFailure, "Unexpected response: " + body.substr(0, 512));
    }
    return j["text"].get<std::string>();
}

} // namespace parley::voice_chat::service
