#pragma once

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace parley::voice_chat::service::utils {

/**
 * @brief HTTP请求方法枚举
 */
enum class HttpMethod {
    GET,
    POST
};

/**
 * @brief HTTP请求结构
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeoutMs = 30000;  // 默认30秒超时
    bool followRedirects = true;

    /**
     * @brief 流式响应回调（仅 executeStream 使用）
     *
     * 每收到一段 2xx 响应体调用一次；返回 false 表示中止传输（响应 error 置为 "Cancelled"）。
     */
    std::function<bool(std::string_view chunk)> streamHandler;

    void setHeader(const std::string& key, const std::string& value) {
        headers[key] = value;
    }

    std::optional<std::string> getHeader(const std::string& key) const {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }
        return std::nullopt;
    }
};

/**
 * @brief HTTP错误/状态分类
 */
enum class HttpErrorType {
    None,
    Network,       // statusCode == 0 or transport error
    Timeout,       // 408
    RateLimit,     // 429
    Client,        // 4xx
    Server,        // 5xx
};

struct HttpHeaders {
    // 小写键 -> 多值列表（按插入顺序保留）
    std::map<std::string, std::vector<std::string>> entries;

    static std::string toLower(const std::string& s) {
        std::string out = s;
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return out;
    }

    void add(const std::string& key, const std::string& value) {
        entries[toLower(key)].push_back(value);
    }

    bool has(const std::string& key) const {
        return entries.find(toLower(key)) != entries.end();
    }

    std::optional<std::string> getFirst(const std::string& key) const {
        auto it = entries.find(toLower(key));
        if (it == entries.end() || it->second.empty()) return std::nullopt;
        return it->second.front();
    }

    std::optional<std::string> contentType() const {
        return getFirst("content-type");
    }
};

/**
 * @brief HTTP响应结构
 */
struct HttpResponse {
    int statusCode = 0;
    HttpHeaders headers;
    std::string body;
    std::string error;  // 传输层错误信息（如果有）；流被回调中止时为 "Cancelled"

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }

    bool isClientError() const {
        return statusCode >= 400 && statusCode < 500;
    }

    bool isServerError() const {
        return statusCode >= 500 && statusCode < 600;
    }

    bool wasCancelled() const {
        return error == "Cancelled";
    }

    std::optional<std::string> getHeader(const std::string& key) const {
        return headers.getFirst(key);
    }

    bool isJson() const {
        auto ct = headers.contentType();
        return ct.has_value() && ct->find("application/json") != std::string::npos;
    }
};

/**
 * @brief 连接池配置
 */
struct ConnectionPoolConfig {
    size_t maxConnections = 8;                            // 最大缓存的 host 客户端数
    std::chrono::milliseconds idleTimeout{30000};         // 空闲超时（30秒）
    std::chrono::milliseconds connectionTimeout{10000};   // 连接超时（10秒）
};

/**
 * @brief 重试配置（流式请求不重试）
 */
struct RetryConfig {
    int maxRetries = 2;                              // 最大重试次数
    std::chrono::milliseconds initialDelay{500};      // 初始延迟
    double backoffMultiplier = 2.0;                  // 退避倍数
    std::chrono::milliseconds maxDelay{8000};         // 最大延迟
    bool enableJitter = true;                         // 是否启用随机抖动
    bool retryOnRateLimit = true;                     // 是否对429重试
    bool retryOnServerError = true;                   // 是否对5xx重试

    /**
     * @brief 计算重试延迟
     * @param attempt 当前重试次数（从0开始）
     */
    std::chrono::milliseconds getRetryDelay(int attempt) const {
        const double scaled = static_cast<double>(initialDelay.count()) *
                              std::pow(backoffMultiplier, attempt);
        const auto clamped = std::min(scaled, static_cast<double>(maxDelay.count()));

        double withJitter = clamped;
        if (enableJitter) {
            const double jitterRange = clamped * 0.2;  // ±20%
            const double randomFactor = (std::rand() % 200 - 100) / 100.0; // -1..1
            withJitter += jitterRange * randomFactor;
        }

        const auto millis = static_cast<std::chrono::milliseconds::rep>(std::max(0.0, withJitter));
        return std::chrono::milliseconds{millis};
    }
};

} // namespace parley::voice_chat::service::utils
