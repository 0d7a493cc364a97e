#include "parley/voice_chat/service/SpeechClient.h"

#include "MiniTest.h"

#include <httplib.h>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace parley::voice_chat::service;

static std::string makeLocalBaseUrl(int port) {
    return "http://127.0.0.1:" + std::to_string(port) + "/v1";
}

struct ServerGuard {
    httplib::Server& server;
    std::thread th;
    int port{0};
    explicit ServerGuard(httplib::Server& s) : server(s) {}
    ~ServerGuard() {
        server.stop();
        if (th.joinable()) th.join();
    }
    void start() {
        port = server.bind_to_any_port("127.0.0.1");
        th = std::thread([this]() { server.listen_after_bind(); });
        server.wait_until_ready();
    }
};

static ErrorHandler quietLog() {
    ErrorHandler::LoggerConfig cfg;
    cfg.enabled = false;
    return ErrorHandler(cfg);
}

int main() {
    using mini_test::TestCase;
    std::vector<TestCase> tests;

    tests.push_back({"synthesize_posts_json_and_returns_bytes", []() {
        std::mutex mu;
        nlohmann::json seenBody;
        std::string seenAuth;

        httplib::Server server;
        server.Post("/v1/audio/speech", [&](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lk(mu);
                seenBody = nlohmann::json::parse(req.body, nullptr, false);
                seenAuth = req.get_header_value("Authorization");
            }
            res.set_content(std::string("ID3\x01\x02", 5), "audio/mpeg");
        });
        ServerGuard guard(server);
        guard.start();

        ConfigManager cm;
        cm.set("api.base_url", makeLocalBaseUrl(guard.port));
        cm.set("api.api_key", "sk-global");
        cm.set("speech.tts.voice", "nova");
        const auto log = quietLog();
        SpeechClient client(cm, log);

        SynthesisRequest req;
        req.text = "hello";
        const auto bytes = client.synthesize(req);
        CHECK_EQ(bytes.size(), static_cast<size_t>(5));
        CHECK_EQ(static_cast<int>(bytes[0]), static_cast<int>('I'));

        std::lock_guard<std::mutex> lk(mu);
        CHECK_EQ(seenAuth, std::string("Bearer sk-global"));
        CHECK_EQ(seenBody["input"].get<std::string>(), std::string("hello"));
        CHECK_EQ(seenBody["voice"].get<std::string>(), std::string("nova"));
        CHECK_EQ(seenBody["model"].get<std::string>(), std::string("tts-1"));
        CHECK_EQ(seenBody["response_format"].get<std::string>(), std::string("mp3"));
    }});

    tests.push_back({"request_key_and_voice_override_config", []() {
        std::mutex mu;
        std::string seenAuth;
        std::string seenVoice;

        httplib::Server server;
        server.Post("/v1/audio/speech", [&](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lk(mu);
            seenAuth = req.get_header_value("Authorization");
            seenVoice = nlohmann::json::parse(req.body).value("voice", "");
            res.set_content("x", "audio/mpeg");
        });
        ServerGuard guard(server);
        guard.start();

        ConfigManager cm;
        cm.set("api.base_url", "https://unused.invalid/v1");
        cm.set("speech.tts.base_url", makeLocalBaseUrl(guard.port));
        cm.set("speech.tts.api_key", "sk-tts");
        const auto log = quietLog();
        SpeechClient client(cm, log);

        SynthesisRequest req;
        req.text = "hi";
        req.voice = "echo";
        req.apiKey = "sk-user";
        client.synthesize(req);

        std::lock_guard<std::mutex> lk(mu);
        CHECK_EQ(seenAuth, std::string("Bearer sk-user"));
        CHECK_EQ(seenVoice, std::string("echo"));
    }});

    tests.push_back({"synthesize_failure_is_upstream_failure", []() {
        httplib::Server server;
        server.Post("/v1/audio/speech", [](const httplib::Request&, httplib::Response& res) {
            res.status = 401;
            res.set_content(R"({"error":{"message":"bad key"}})", "application/json");
        });
        ServerGuard guard(server);
        guard.start();

        ConfigManager cm;
        cm.set("api.base_url", makeLocalBaseUrl(guard.port));
        cm.set("api.api_key", "sk-x");
        const auto log = quietLog();
        SpeechClient client(cm, log);

        bool thrown = false;
        try {
            client.synthesize(SynthesisRequest{"hi", "", ""});
        } catch (const VoiceChatError& e) {
            thrown = true;
            CHECK_TRUE(e.type() == ErrorType::UpstreamFailure);
            CHECK_EQ(e.info().errorCode, 401);
            CHECK_EQ(std::string(e.what()), std::string(R"(401: {"error":{"message":"bad key"}})"));
        }
        CHECK_TRUE(thrown);
    }});

    tests.push_back({"transcribe_posts_multipart_and_parses_text", []() {
        std::mutex mu;
        std::string seenContentType;
        std::string seenAuth;

        httplib::Server server;
        server.Post("/v1/audio/transcriptions", [&](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lk(mu);
                seenContentType = req.get_header_value("Content-Type");
                seenAuth = req.get_header_value("Authorization");
            }
            res.set_content(R"({"text":"turn on the lights"})", "application/json");
        });
        ServerGuard guard(server);
        guard.start();

        ConfigManager cm;
        cm.set("speech.stt.base_url", makeLocalBaseUrl(guard.port));
        cm.set("api.api_key", "sk-global");
        const auto log = quietLog();
        SpeechClient client(cm, log);

        TranscriptionRequest req;
        req.apiKey = "sk-user";
        req.language = "en";
        req.wav = {'R', 'I', 'F', 'F'};
        CHECK_EQ(client.transcribe(req), std::string("turn on the lights"));

        std::lock_guard<std::mutex> lk(mu);
        CHECK_EQ(seenContentType.rfind("multipart/form-data; boundary=", 0), static_cast<size_t>(0));
        CHECK_EQ(seenAuth, std::string("Bearer sk-user"));
    }});

    tests.push_back({"parse_transcript_shapes", []() {
        CHECK_EQ(SpeechClient::parseTranscript(R"({"text":"ok"})"), std::string("ok"));
        CHECK_EQ(SpeechClient::parseTranscript(R"({"text":""})"), std::string(""));
        CHECK_THROWS_AS(SpeechClient::parseTranscript("not json"), VoiceChatError);
        CHECK_THROWS_AS(SpeechClient::parseTranscript(R"({"transcript":"x"})"), VoiceChatError);
        CHECK_THROWS_AS(SpeechClient::parseTranscript(R"({"text":1})"), VoiceChatError);
    }});

    return mini_test::run(tests);
}
