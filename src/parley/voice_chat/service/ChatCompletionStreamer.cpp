#include "parley/voice_chat/service/ChatCompletionStreamer.h"

#include "parley/voice_chat/service/SseFrameSplitter.h"

#include <optional>
#include <string>

namespace parley::voice_chat::service {

using utils::HttpMethod;
using utils::HttpRequest;
using utils::HttpResponse;

namespace {

// 任意退出路径都把该 id 标记为结束，便于后续 drain 淘汰
class FinishOnExit {
public:
    FinishOnExit(ChatEventBuffer& buffer, RequestId id, const ErrorHandler& log)
        : m_buffer(buffer), m_id(id), m_log(log) {}

    ~FinishOnExit() {
        try {
            m_buffer.finish(m_id);
        } catch (const VoiceChatError& e) {
            m_log.log(ErrorHandler::LogLevel::Error, "Failed to finish chat completion " + std::to_string(m_id), e.info());
        }
    }

private:
    ChatEventBuffer& m_buffer;
    RequestId m_id;
    const ErrorHandler& m_log;
};

} // namespace

const char* streamOutcomeToString(StreamOutcome o) {
    switch (o) {
        case StreamOutcome::Completed: return "completed";
        case StreamOutcome::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

ChatCompletionStreamer::ChatCompletionStreamer(ChatEventBuffer& buffer, const ErrorHandler& log, int timeoutMs)
    : m_buffer(buffer)
    , m_log(log)
    , m_timeoutMs(timeoutMs > 0 ? timeoutMs : 120000)
{}

HttpRequest ChatCompletionStreamer::buildRequest(const ChatCompletionRequest& request) const {
    HttpRequest hreq;
    hreq.method = HttpMethod::POST;
    hreq.url = request.endpoint;
    hreq.body = request.body;
    hreq.timeoutMs = m_timeoutMs;
    hreq.followRedirects = true;
    if (request.apiKeyAuthentication) {
        hreq.headers["api-key"] = request.secretKey;
    } else {
        hreq.headers["Authorization"] = "Bearer " + request.secretKey;
    }
    hreq.headers["Content-Type"] = "application/json";
    hreq.headers["Accept"] = "text/event-stream";
    return hreq;
}

bool ChatCompletionStreamer::deliver(RequestId id, std::string_view frame) {
    auto ev = interpretFrame(frame);
    switch (ev.kind) {
        case FrameEvent::Kind::Data:
            m_buffer.append(id, std::move(ev.text));
            return false;
        case FrameEvent::Kind::Done:
            return true;
        default:
            return false;
    }
}

StreamOutcome ChatCompletionStreamer::stream(const ChatCompletionRequest& request) {
    const auto id = request.id;
    m_buffer.open(id);
    FinishOnExit finishGuard(m_buffer, id, m_log);

    if (request.endpoint.empty()) {
        throw VoiceChatError(ErrorType::InvalidRequest, "Chat completion endpoint is empty");
    }

    SseFrameSplitter splitter;
    bool sawDone = false;
    bool cancelled = false;

    auto hreq = buildRequest(request);
    hreq.streamHandler = [&](std::string_view chunk) {
        if (!splitter.hasPartialFrame() && m_buffer.isCancelled(id)) {
            cancelled = true;
            return false;
        }
        splitter.feed(chunk, [&](std::string_view frame) {
            if (deliver(id, frame)) sawDone = true;
            if (m_buffer.isCancelled(id)) {
                cancelled = true;
                return false;
            }
            return true;
        });
        return !cancelled;
    };

    m_log.log(ErrorHandler::LogLevel::Debug, "Chat completion " + std::to_string(id) + " started: " + request.endpoint);
    const HttpResponse resp = m_http.executeStream(hreq);

    if (cancelled) {
        m_log.log(ErrorHandler::LogLevel::Info, "Chat completion " + std::to_string(id) + " cancelled");
        return StreamOutcome::Cancelled;
    }

    if (resp.statusCode == 0 || !resp.isSuccess()) {
        // 不把请求头（含密钥）写进错误上下文
        HttpRequest redacted;
        redacted.method = hreq.method;
        redacted.url = hreq.url;
        auto info = ErrorHandler::fromHttpResponse(resp, std::optional<HttpRequest>{redacted});
        m_log.log(ErrorHandler::LogLevel::Warning, "Chat completion " + std::to_string(id) + " failed", info);
        throw VoiceChatError(info);
    }

    // 没有结尾空行的最后一帧也要交付
    if (auto residual = splitter.finish(); residual.has_value()) {
        if (deliver(id, *residual)) sawDone = true;
    }

    if (!resp.error.empty() && !sawDone) {
        auto info = ErrorInfo::make(ErrorType::StreamTerminatedEarly,
                                    "Chat completion stream terminated early: " + resp.error,
                                    resp.statusCode);
        info.context = std::map<std::string, std::string>{{"url", hreq.url}, {"request_id", std::to_string(id)}};
        m_log.log(ErrorHandler::LogLevel::Warning, "Chat completion " + std::to_string(id) + " interrupted", info);
        throw VoiceChatError(info);
    }

    m_log.log(ErrorHandler::LogLevel::Debug, "Chat completion " + std::to_string(id) + " completed");
    return StreamOutcome::Completed;
}

} // namespace parley::voice_chat::service
