#pragma once

#include "parley/voice_chat/service/ChatEventBuffer.h"
#include "parley/voice_chat/service/ErrorHandler.h"
#include "parley/voice_chat/service/utils/HttpClient.h"

#include <string>

namespace parley::voice_chat::service {

struct ChatCompletionRequest {
    RequestId id{0};
    std::string endpoint;   // 例如 https://api.openai.com/v1/chat/completions
    std::string secretKey;  // API key 或 Azure AD token
    std::string body;       // 原样透传的 JSON 请求体
    bool apiKeyAuthentication{false}; // true: "api-key" 头；false: "Authorization: Bearer"
};

enum class StreamOutcome {
    Completed,
    Cancelled // 正常结束，不是错误
};

const char* streamOutcomeToString(StreamOutcome o);

/**
 * @brief 流式 chat completion 接收：分帧、解码并写入 ChatEventBuffer
 *
 * 取消只在帧边界检查：每交付一帧之后，以及每个从帧边界开始的数据块之前。
 * 失败抛出 VoiceChatError：
 * - 非 2xx：UpstreamFailure（"<status>: <body>"）
 * - 尚未收到响应：NetworkError
 * - 2xx 之后、[DONE] 之前连接中断：先冲刷残留帧，再 StreamTerminatedEarly
 * 无论哪条路径都会调用 ChatEventBuffer::finish。
 */
class ChatCompletionStreamer {
public:
    ChatCompletionStreamer(ChatEventBuffer& buffer, const ErrorHandler& log, int timeoutMs = 120000);

    ChatCompletionStreamer(const ChatCompletionStreamer&) = delete;
    ChatCompletionStreamer& operator=(const ChatCompletionStreamer&) = delete;

    StreamOutcome stream(const ChatCompletionRequest& request);

private:
    // 返回 true 表示遇到终止哨兵
    bool deliver(RequestId id, std::string_view frame);
    utils::HttpRequest buildRequest(const ChatCompletionRequest& request) const;

    ChatEventBuffer& m_buffer;
    const ErrorHandler& m_log;
    int m_timeoutMs;
    utils::HttpClient m_http;
};

} // namespace parley::voice_chat::service
