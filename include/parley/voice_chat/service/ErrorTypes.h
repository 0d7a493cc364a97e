#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"

namespace parley::voice_chat::service {

/**
 * @brief 统一错误类型
 *
 * 取消/被抢占不是错误：它们通过返回值（空转写、StreamOutcome::Cancelled 等）体现。
 */
enum class ErrorType {
    ResourceUnavailable,    // 音频设备无法打开/启动，或剪辑无法解码
    UpstreamFailure,        // 上游返回非 2xx（附带 status 与 body）
    StreamTerminatedEarly,  // 流在终止哨兵之前被传输层中断
    SharedStateUnavailable, // 共享结构加锁失败
    NetworkError,           // 连接失败、DNS 等（尚未拿到响应）
    InvalidRequest,         // 调用参数非法
    UnknownError            // 未知错误
};

/**
 * @brief 错误严重程度
 */
enum class ErrorSeverity {
    Critical,
    Warning,
    Info
};

/**
 * @brief 结构化错误信息
 */
struct ErrorInfo {
    ErrorType errorType{ErrorType::UnknownError};
    int errorCode{0}; // HTTP status 或内部错误码（0 表示无/未知）
    std::string message;
    std::optional<nlohmann::json> details;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::optional<std::map<std::string, std::string>> context;

    static const char* errorTypeToString(ErrorType t) {
        switch (t) {
            case ErrorType::ResourceUnavailable: return "ResourceUnavailable";
            case ErrorType::UpstreamFailure: return "UpstreamFailure";
            case ErrorType::StreamTerminatedEarly: return "StreamTerminatedEarly";
            case ErrorType::SharedStateUnavailable: return "SharedStateUnavailable";
            case ErrorType::NetworkError: return "NetworkError";
            case ErrorType::InvalidRequest: return "InvalidRequest";
            default: return "UnknownError";
        }
    }

    static const char* severityToString(ErrorSeverity s) {
        switch (s) {
            case ErrorSeverity::Critical: return "Critical";
            case ErrorSeverity::Warning: return "Warning";
            default: return "Info";
        }
    }

    static ErrorSeverity defaultSeverity(ErrorType t) {
        switch (t) {
            case ErrorType::SharedStateUnavailable:
                return ErrorSeverity::Critical;
            case ErrorType::ResourceUnavailable:
            case ErrorType::UpstreamFailure:
            case ErrorType::StreamTerminatedEarly:
            case ErrorType::NetworkError:
            case ErrorType::InvalidRequest:
                return ErrorSeverity::Warning;
            default:
                return ErrorSeverity::Info;
        }
    }

    static ErrorInfo make(ErrorType type, std::string message, int code = 0) {
        ErrorInfo info;
        info.errorType = type;
        info.errorCode = code;
        info.message = std::move(message);
        return info;
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["error_type"] = errorTypeToString(errorType);
        j["error_code"] = errorCode;
        j["message"] = message;
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
        j["timestamp_ms"] = ms;
        if (details.has_value()) j["details"] = details.value();
        if (context.has_value()) j["context"] = context.value();
        return j;
    }

    std::string toString() const {
        // JSON 作为统一字符串化输出，便于日志/调试
        return toJson().dump();
    }
};

/**
 * @brief 命令失败时抛出的异常，携带结构化 ErrorInfo
 */
class VoiceChatError : public std::runtime_error {
public:
    explicit VoiceChatError(const ErrorInfo& info)
        : std::runtime_error(info.message.empty() ? info.toString() : info.message)
        , m_info(info)
    {}

    VoiceChatError(ErrorType type, const std::string& message, int code = 0)
        : VoiceChatError(ErrorInfo::make(type, message, code))
    {}

    const ErrorInfo& info() const { return m_info; }
    ErrorType type() const { return m_info.errorType; }

private:
    ErrorInfo m_info;
};

} // namespace parley::voice_chat::service
