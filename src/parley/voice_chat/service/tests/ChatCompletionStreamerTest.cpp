#include "parley/voice_chat/service/ChatCompletionStreamer.h"

#include "MiniTest.h"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace parley::voice_chat::service;

namespace {

// 进程内 SSE 上游
class LocalUpstream {
public:
    LocalUpstream() {
        m_server.Post("/ok", [](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("text/event-stream", [](size_t, httplib::DataSink& sink) {
                const std::vector<std::string> chunks = {
                    "data: {\"a\":1}\n\n", "data: hel", "lo\n\n", ": keep-alive\n\n", "data: [DONE]\n\n"};
                for (const auto& c : chunks) {
                    if (!sink.write(c.data(), c.size())) return false;
                }
                sink.done();
                return true;
            });
        });

        m_server.Post("/no-trailing-blank-line", [](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("text/event-stream", [](size_t, httplib::DataSink& sink) {
                const std::string body = "data: first\n\ndata: last";
                sink.write(body.data(), body.size());
                sink.done();
                return true;
            });
        });

        m_server.Post("/auth", [](const httplib::Request& req, httplib::Response& res) {
            const std::string body = "data: api-key=" + req.get_header_value("api-key") +
                                     "\n\ndata: authorization=" + req.get_header_value("Authorization") +
                                     "\n\ndata: [DONE]\n\n";
            res.set_content(body, "text/event-stream");
        });

        m_server.Post("/fail", [](const httplib::Request&, httplib::Response& res) {
            res.status = 500;
            res.set_content("boom", "text/plain");
        });

        m_server.Post("/truncated", [](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("text/event-stream", [](size_t, httplib::DataSink& sink) {
                const std::string body = "data: x\n\ndata: partial";
                sink.write(body.data(), body.size());
                // 不发送结束块，直接断开
                return false;
            });
        });

        m_server.Post("/endless", [this](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("text/event-stream", [this](size_t, httplib::DataSink& sink) {
                for (int i = 0; i < 500 && !m_stopping.load(); ++i) {
                    const std::string frame = "data: " + std::to_string(i) + "\n\n";
                    if (!sink.write(frame.data(), frame.size())) return false;
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
                sink.done();
                return true;
            });
        });

        m_port = m_server.bind_to_any_port("127.0.0.1");
        m_thread = std::thread([this]() { m_server.listen_after_bind(); });
        m_server.wait_until_ready();
    }

    ~LocalUpstream() {
        m_stopping = true;
        m_server.stop();
        if (m_thread.joinable()) m_thread.join();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(m_port) + path;
    }

private:
    httplib::Server m_server;
    int m_port{0};
    std::thread m_thread;
    std::atomic<bool> m_stopping{false};
};

ErrorHandler quietLog() {
    ErrorHandler::LoggerConfig cfg;
    cfg.enabled = false;
    return ErrorHandler(cfg);
}

ChatCompletionRequest makeRequest(RequestId id, const std::string& endpoint) {
    ChatCompletionRequest req;
    req.id = id;
    req.endpoint = endpoint;
    req.secretKey = "sk-test";
    req.body = R"({"model":"m","stream":true,"messages":[]})";
    return req;
}

} // namespace

int main() {
    LocalUpstream upstream;
    const ErrorHandler log = quietLog();

    std::vector<mini_test::TestCase> tests;

    tests.push_back({"completed_stream_delivers_data_payloads", [&]() {
        ChatEventBuffer buffer;
        ChatCompletionStreamer streamer(buffer, log, 5000);
        const auto outcome = streamer.stream(makeRequest(1, upstream.url("/ok")));
        CHECK_TRUE(outcome == StreamOutcome::Completed);
        CHECK_EQ(buffer.drain(1), (std::vector<std::string>{"{\"a\":1}", "hello"}));
        // 流已结束：首次 drain 之后 id 被淘汰
        CHECK_EQ(buffer.trackedCount(), static_cast<size_t>(0));
    }});

    tests.push_back({"residual_frame_is_flushed", [&]() {
        ChatEventBuffer buffer;
        ChatCompletionStreamer streamer(buffer, log, 5000);
        CHECK_TRUE(streamer.stream(makeRequest(2, upstream.url("/no-trailing-blank-line"))) == StreamOutcome::Completed);
        CHECK_EQ(buffer.drain(2), (std::vector<std::string>{"first", "last"}));
    }});

    tests.push_back({"bearer_and_api_key_authentication", [&]() {
        ChatEventBuffer buffer;
        ChatCompletionStreamer streamer(buffer, log, 5000);

        auto bearer = makeRequest(3, upstream.url("/auth"));
        streamer.stream(bearer);
        CHECK_EQ(buffer.drain(3), (std::vector<std::string>{"api-key=", "authorization=Bearer sk-test"}));

        auto apiKey = makeRequest(4, upstream.url("/auth"));
        apiKey.apiKeyAuthentication = true;
        streamer.stream(apiKey);
        CHECK_EQ(buffer.drain(4), (std::vector<std::string>{"api-key=sk-test", "authorization="}));
    }});

    tests.push_back({"upstream_failure_carries_status_and_body", [&]() {
        ChatEventBuffer buffer;
        ChatCompletionStreamer streamer(buffer, log, 5000);
        bool thrown = false;
        try {
            streamer.stream(makeRequest(5, upstream.url("/fail")));
        } catch (const VoiceChatError& e) {
            thrown = true;
            CHECK_TRUE(e.type() == ErrorType::UpstreamFailure);
            CHECK_EQ(std::string(e.what()), std::string("500: boom"));
            CHECK_EQ(e.info().errorCode, 500);
        }
        CHECK_TRUE(thrown);
        CHECK_TRUE(buffer.drain(5).empty());
        CHECK_EQ(buffer.trackedCount(), static_cast<size_t>(0));
    }});

    tests.push_back({"truncated_stream_flushes_then_fails", [&]() {
        ChatEventBuffer buffer;
        ChatCompletionStreamer streamer(buffer, log, 5000);
        bool thrown = false;
        try {
            streamer.stream(makeRequest(6, upstream.url("/truncated")));
        } catch (const VoiceChatError& e) {
            thrown = true;
            CHECK_TRUE(e.type() == ErrorType::StreamTerminatedEarly);
        }
        CHECK_TRUE(thrown);
        CHECK_EQ(buffer.drain(6), (std::vector<std::string>{"x", "partial"}));
    }});

    tests.push_back({"connection_refused_is_network_error", [&]() {
        ChatEventBuffer buffer;
        ChatCompletionStreamer streamer(buffer, log, 2000);
        bool thrown = false;
        try {
            streamer.stream(makeRequest(7, "http://127.0.0.1:1/v1/chat/completions"));
        } catch (const VoiceChatError& e) {
            thrown = true;
            CHECK_TRUE(e.type() == ErrorType::NetworkError);
        }
        CHECK_TRUE(thrown);
    }});

    tests.push_back({"empty_endpoint_is_invalid_request", [&]() {
        ChatEventBuffer buffer;
        ChatCompletionStreamer streamer(buffer, log);
        CHECK_THROWS_AS(streamer.stream(makeRequest(8, "")), VoiceChatError);
        CHECK_EQ(buffer.trackedCount(), static_cast<size_t>(1));
        buffer.drain(8);
        CHECK_EQ(buffer.trackedCount(), static_cast<size_t>(0));
    }});

    tests.push_back({"cancel_stops_at_frame_boundary", [&]() {
        ChatEventBuffer buffer;
        ChatCompletionStreamer streamer(buffer, log, 5000);
        auto running = std::async(std::launch::async, [&]() {
            return streamer.stream(makeRequest(9, upstream.url("/endless")));
        });

        std::vector<std::string> seen;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (seen.empty() && std::chrono::steady_clock::now() < deadline) {
            seen = buffer.drain(9);
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        CHECK_FALSE(seen.empty());
        CHECK_EQ(seen.front(), std::string("0"));

        CHECK_TRUE(buffer.cancel(9));
        CHECK_TRUE(running.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
        CHECK_TRUE(running.get() == StreamOutcome::Cancelled);

        buffer.drain(9);
        CHECK_EQ(buffer.trackedCount(), static_cast<size_t>(0));
        CHECK_FALSE(buffer.isCancelled(9));
    }});

    tests.push_back({"cancel_before_start_produces_no_events", [&]() {
        ChatEventBuffer buffer;
        ChatCompletionStreamer streamer(buffer, log, 5000);
        buffer.open(10);
        CHECK_TRUE(buffer.cancel(10));
        CHECK_TRUE(streamer.stream(makeRequest(10, upstream.url("/ok"))) == StreamOutcome::Cancelled);
        CHECK_TRUE(buffer.drain(10).empty());
    }});

    tests.push_back({"outcome_names", []() {
        CHECK_EQ(std::string(streamOutcomeToString(StreamOutcome::Completed)), std::string("completed"));
        CHECK_EQ(std::string(streamOutcomeToString(StreamOutcome::Cancelled)), std::string("cancelled"));
    }});

    return mini_test::run(tests);
}
