#pragma once

#include "HttpTypes.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// 前向声明，避免包含整个httplib.h头文件
// 实际使用时会在cpp文件中包含
namespace httplib {
    class Client;
}

namespace parley::voice_chat::service::utils {

/**
 * @brief HTTP客户端封装类
 *
 * 基于cpp-httplib实现：
 * - 普通请求复用按 host 缓存的客户端，并按 RetryConfig 对网络错误/429/5xx 重试
 * - executeStream 每次独占一个客户端，按块回调响应体，不做重试
 *
 * 使用示例：
 * ```
 * HttpClient client("https://api.openai.com/v1");
 * auto resp = client.postJson("/audio/speech", R"({"input":"hi"})", {{"Authorization", "Bearer ..."}});
 * if (!resp.isSuccess()) {
 *     // resp.statusCode / resp.body / resp.error
 * }
 * ```
 */
class HttpClient {
public:
    explicit HttpClient(const std::string& baseUrl = "");
    ~HttpClient();

    // 禁止拷贝与移动（含mutex，不可安全移动）
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) = delete;
    HttpClient& operator=(HttpClient&&) = delete;

    void setDefaultHeader(const std::string& key, const std::string& value);

    void setConnectionPoolConfig(const ConnectionPoolConfig& config);
    ConnectionPoolConfig getConnectionPoolConfig() const { return m_poolConfig; }

    void setRetryConfig(const RetryConfig& config);
    RetryConfig getRetryConfig() const { return m_retryConfig; }

    /**
     * @brief 设置读取超时时间（毫秒）
     */
    void setTimeout(int timeoutMs);
    int getTimeout() const { return m_timeoutMs; }

    void setFollowRedirects(bool follow);

    // ========== 同步请求方法 ==========

    HttpResponse post(const std::string& path,
                      const std::string& body = "",
                      const std::string& contentType = "application/json",
                      const std::map<std::string, std::string>& headers = {});

    HttpResponse postJson(const std::string& path,
                          const std::string& jsonBody,
                          const std::map<std::string, std::string>& headers = {});

    struct MultipartFile {
        std::string filename;
        std::string contentType;
        std::string data; // 内存数据
    };

    /**
     * @brief multipart/form-data POST
     *
     * 字段名/文件名中含 CR 或 LF 时不发送请求，直接返回 statusCode=400。
     */
    HttpResponse postMultipart(const std::string& path,
                               const std::map<std::string, std::string>& fields,
                               const std::map<std::string, MultipartFile>& files,
                               const std::map<std::string, std::string>& headers = {});

    /**
     * @brief 通用请求方法（带重试）
     */
    HttpResponse execute(const HttpRequest& request);

    /**
     * @brief 流式请求：2xx 响应体按块交给 request.streamHandler
     *
     * - 非 2xx：响应体收集到 response.body，不调用回调
     * - 回调返回 false：立即停止读取，response.error == "Cancelled"
     * - 收到响应头之后的传输错误：保留 statusCode，并设置 response.error
     */
    HttpResponse executeStream(const HttpRequest& request);

    size_t getCachedClientCount() const;

    // 测试辅助访问（gtest友元）
    friend class HttpClientTestAccessor;

private:
    struct UrlParts {
        std::string origin; // scheme://host[:port]
        std::string path;   // 以 '/' 开头
    };

    static UrlParts splitUrl(const std::string& url);

    std::shared_ptr<httplib::Client> getOrCreateClient(const std::string& url);
    std::shared_ptr<httplib::Client> makeClient(const std::string& origin, int timeoutMs, bool followRedirects) const;

    HttpResponse executeWithRetry(const HttpRequest& request);
    HttpResponse executeOnce(const HttpRequest& request);

    static std::string methodToString(HttpMethod method);
    std::string buildFullUrl(const std::string& path) const;
    bool isRetryableError(const HttpResponse& response) const;
    std::map<std::string, std::string> mergeHeaders(
        const std::map<std::string, std::string>& requestHeaders) const;

    /**
     * @brief 组装 multipart 请求体；非法字段返回 false 并写入 error
     */
    static bool buildMultipartBody(const std::string& boundary,
                                   const std::map<std::string, std::string>& fields,
                                   const std::map<std::string, MultipartFile>& files,
                                   std::string& out,
                                   std::string& error);
    static std::string makeBoundary();
    static HttpErrorType classifyStatus(int statusCode);

    std::string m_baseUrl;
    std::map<std::string, std::string> m_defaultHeaders;
    ConnectionPoolConfig m_poolConfig;
    RetryConfig m_retryConfig;
    int m_timeoutMs;
    bool m_followRedirects;

    // 连接池管理（host 级缓存）
    mutable std::mutex m_clientMutex;
    struct ClientEntry {
        std::shared_ptr<httplib::Client> client;
        std::chrono::steady_clock::time_point lastUsed;
    };
    std::map<std::string, ClientEntry> m_clientPool;

    void pruneIdleClients();
    void enforcePoolLimits();
};

} // namespace parley::voice_chat::service::utils
