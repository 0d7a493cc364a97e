#pragma once

#include "parley/voice_chat/service/ErrorTypes.h"
#include "parley/voice_chat/service/utils/HttpTypes.h"

#include <optional>
#include <string>

namespace parley::voice_chat::service {

class ConfigManager;

/**
 * @brief 错误识别与日志输出
 *
 * - HTTP 响应 -> ErrorInfo（UpstreamFailure 的 message 固定为 "<status>: <body>"）
 * - 结构化日志写入 stderr
 */
class ErrorHandler {
public:
    enum class LogLevel {
        Error,
        Warning,
        Info,
        Debug
    };

    struct LoggerConfig {
        LogLevel minLevel{LogLevel::Warning};
        bool enabled{true};
    };

    ErrorHandler();
    explicit ErrorHandler(LoggerConfig cfg);

    void setLoggerConfig(LoggerConfig cfg);
    const LoggerConfig& getLoggerConfig() const;

    // 读取 logging.enabled / logging.min_level
    static LoggerConfig makeLoggerConfig(const ConfigManager& cfg);

    // "error" | "warning" | "info" | "debug"（大小写不敏感）；无法识别返回 nullopt
    static std::optional<LogLevel> parseLogLevel(const std::string& text);

    // ========== 识别/解析 ==========
    // statusCode == 0 -> NetworkError；非 2xx -> UpstreamFailure
    static ErrorType mapHttpStatusToErrorType(int statusCode);

    static ErrorInfo fromHttpResponse(
        const utils::HttpResponse& resp,
        const std::optional<utils::HttpRequest>& req = std::nullopt);

    // OpenAI 兼容 {"error": {"message": ...}}；非该形状返回 nullopt
    static std::optional<ErrorInfo> parseApiErrorJson(
        const nlohmann::json& root,
        int httpStatusCode = 0);

    // ========== 日志 ==========
    void log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err = std::nullopt) const;

    static const char* logLevelToString(LogLevel level);

private:
    LoggerConfig m_loggerCfg;
};

} // namespace parley::voice_chat::service
