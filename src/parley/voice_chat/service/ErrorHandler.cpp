#include "parley/voice_chat/service/ErrorHandler.h"

#include "parley/voice_chat/service/ConfigManager.h"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <string>

namespace parley::voice_chat::service {

static uint64_t nowEpochMs() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

ErrorHandler::ErrorHandler()
    : m_loggerCfg(LoggerConfig{})
{}

ErrorHandler::ErrorHandler(LoggerConfig cfg)
    : m_loggerCfg(cfg)
{}

void ErrorHandler::setLoggerConfig(LoggerConfig cfg) {
    m_loggerCfg = cfg;
}

const ErrorHandler::LoggerConfig& ErrorHandler::getLoggerConfig() const {
    return m_loggerCfg;
}

ErrorHandler::LoggerConfig ErrorHandler::makeLoggerConfig(const ConfigManager& cfg) {
    LoggerConfig out;
    out.enabled = cfg.getBool("logging.enabled", true);
    if (auto lv = parseLogLevel(cfg.getString("logging.min_level", "warning")); lv.has_value()) {
        out.minLevel = *lv;
    }
    return out;
}

std::optional<ErrorHandler::LogLevel> ErrorHandler::parseLogLevel(const std::string& text) {
    const auto low = toLowerCopy(text);
    if (low == "error") return LogLevel::Error;
    if (low == "warning" || low == "warn") return LogLevel::Warning;
    if (low == "info") return LogLevel::Info;
    if (low == "debug") return LogLevel::Debug;
    return std::nullopt;
}

const char* ErrorHandler::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Info: return "INFO";
        default: return "DEBUG";
    }
}

ErrorType ErrorHandler::mapHttpStatusToErrorType(int statusCode) {
    if (statusCode == 0) return ErrorType::NetworkError;
    if (statusCode < 200 || statusCode >= 300) return ErrorType::UpstreamFailure;
    return ErrorType::UnknownError;
}

std::optional<ErrorInfo> ErrorHandler::parseApiErrorJson(const nlohmann::json& root, int httpStatusCode) {
    if (!root.is_object()) return std::nullopt;
    if (!root.contains("error")) return std::nullopt;
    const auto& e = root.at("error");

    ErrorInfo info;
    info.errorCode = httpStatusCode;
    info.errorType = mapHttpStatusToErrorType(httpStatusCode);

    std::string msg;
    if (e.is_object() && e.contains("message") && e.at("message").is_string()) {
        msg = e.at("message").get<std::string>();
    } else if (e.is_string()) {
        msg = e.get<std::string>();
    } else {
        return std::nullopt;
    }
    info.message = msg.empty() ? "API error" : msg;
    info.details = e;
    return info;
}

ErrorInfo ErrorHandler::fromHttpResponse(
    const utils::HttpResponse& resp,
    const std::optional<utils::HttpRequest>& req) {

    ErrorInfo info;
    info.errorCode = resp.statusCode;
    info.errorType = mapHttpStatusToErrorType(resp.statusCode);

    if (resp.statusCode == 0) {
        info.message = resp.error.empty() ? "HTTP request failed" : resp.error;
    } else {
        // 上游失败：原样带回状态码与响应体
        info.message = std::to_string(resp.statusCode) + ": " + resp.body;
    }

    nlohmann::json d;
    d["http_status"] = resp.statusCode;
    if (!resp.error.empty()) d["transport_error"] = resp.error;
    if (resp.isJson()) {
        auto j = nlohmann::json::parse(resp.body, nullptr, false);
        if (!j.is_discarded()) {
            if (auto api = parseApiErrorJson(j, resp.statusCode); api.has_value()) {
                d["api_message"] = api->message;
            }
            d["body_json"] = std::move(j);
        }
    }
    if (!d.contains("body_json") && !resp.body.empty()) {
        d["body_snippet"] = resp.body.substr(0, 1024);
    }
    info.details = std::move(d);

    // 仅记录 method/url，不记录 Authorization 等请求头
    if (req.has_value()) {
        std::map<std::string, std::string> ctx;
        ctx["url"] = req->url;
        ctx["method"] = req->method == utils::HttpMethod::POST ? "POST" : "GET";
        info.context = std::move(ctx);
    }

    return info;
}

void ErrorHandler::log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err) const {
    if (!m_loggerCfg.enabled) return;
    if (static_cast<int>(level) > static_cast<int>(m_loggerCfg.minLevel)) return;

    // 结构化输出到 stderr：timestamp + level + message + optional error json
    std::ostringstream oss;
    oss << "[" << nowEpochMs() << "] "
        << logLevelToString(level) << " "
        << message;
    if (err.has_value()) {
        oss << " " << err->toString();
    }
    oss << "\n";
    const auto line = oss.str();
    std::fwrite(line.c_str(), 1, line.size(), stderr);
    std::fflush(stderr);
}

} // namespace parley::voice_chat::service
