#include "parley/voice_chat/service/utils/HttpClient.h"
#include "parley/voice_chat/service/utils/HttpTypes.h"

// HTTPS 由构建选项 PARLEY_ENABLE_HTTPS 定义 CPPHTTPLIB_OPENSSL_SUPPORT 开启
#include "httplib.h"

#include <iomanip>
#include <random>
#include <sstream>
#include <thread>
#include <utility>

namespace parley::voice_chat::service::utils {

HttpClient::HttpClient(const std::string& baseUrl)
    : m_baseUrl(baseUrl)
    , m_timeoutMs(30000)
    , m_followRedirects(true)
{
    m_defaultHeaders["User-Agent"] = "Parley-VoiceChat/1.0";
}

HttpClient::~HttpClient() = default;

void HttpClient::setDefaultHeader(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_clientMutex);
    m_defaultHeaders[key] = value;
}

void HttpClient::setConnectionPoolConfig(const ConnectionPoolConfig& config) {
    m_poolConfig = config;
}

void HttpClient::setRetryConfig(const RetryConfig& config) {
    m_retryConfig = config;
}

void HttpClient::setTimeout(int timeoutMs) {
    m_timeoutMs = timeoutMs;
}

void HttpClient::setFollowRedirects(bool follow) {
    m_followRedirects = follow;
}

// ========== 同步请求方法 ==========

HttpResponse HttpClient::post(const std::string& path,
                              const std::string& body,
                              const std::string& contentType,
                              const std::map<std::string, std::string>& headers) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = buildFullUrl(path);
    request.body = body;
    request.timeoutMs = m_timeoutMs;
    request.followRedirects = m_followRedirects;

    auto mergedHeaders = mergeHeaders(headers);
    mergedHeaders["Content-Type"] = contentType;
    request.headers = std::move(mergedHeaders);

    return execute(request);
}

HttpResponse HttpClient::postJson(const std::string& path,
                                  const std::string& jsonBody,
                                  const std::map<std::string, std::string>& headers) {
    return post(path, jsonBody, "application/json", headers);
}

HttpResponse HttpClient::postMultipart(const std::string& path,
                                       const std::map<std::string, std::string>& fields,
                                       const std::map<std::string, MultipartFile>& files,
                                       const std::map<std::string, std::string>& headers) {
    const auto boundary = makeBoundary();
    std::string body;
    std::string error;
    if (!buildMultipartBody(boundary, fields, files, body, error)) {
        HttpResponse rejected;
        rejected.statusCode = 400;
        rejected.error = error;
        return rejected;
    }
    return post(path, body, "multipart/form-data; boundary=" + boundary, headers);
}

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return executeWithRetry(request);
}

HttpResponse HttpClient::executeStream(const HttpRequest& request) {
    HttpResponse response;

    try {
        const auto parts = splitUrl(request.url);
        // 流式请求独占客户端：httplib::Client 对同一实例的请求是串行的，长流会阻塞同 host 的其他请求
        auto client = makeClient(parts.origin, request.timeoutMs, request.followRedirects);

        httplib::Request req;
        req.method = methodToString(request.method);
        req.path = parts.path;
        for (const auto& [key, value] : mergeHeaders(request.headers)) {
            req.headers.emplace(key, value);
        }
        req.body = request.body;

        bool abortedByHandler = false;
        req.response_handler = [&response](const httplib::Response& r) {
            response.statusCode = r.status;
            for (const auto& [key, value] : r.headers) {
                response.headers.add(key, value);
            }
            return true;
        };
        req.content_receiver = [&](const char* data, size_t len, uint64_t /*offset*/, uint64_t /*total*/) {
            if (!response.isSuccess() || !request.streamHandler) {
                response.body.append(data, len);
                return true;
            }
            if (!request.streamHandler(std::string_view(data, len))) {
                abortedByHandler = true;
                return false;
            }
            return true;
        };

        httplib::Response res;
        httplib::Error err = httplib::Error::Success;
        if (!client->send(req, res, err)) {
            if (abortedByHandler) {
                response.error = "Cancelled";
            } else {
                response.error = "Request failed: error_code=" + std::to_string(static_cast<int>(err));
            }
        } else if (response.statusCode == 0) {
            // 未经过 response_handler（例如重定向后的最终响应），以 send 的结果为准
            response.statusCode = res.status;
        }
    } catch (const std::exception& e) {
        response.error = "Exception: " + std::string(e.what());
    }

    return response;
}

size_t HttpClient::getCachedClientCount() const {
    std::lock_guard<std::mutex> lock(m_clientMutex);
    return m_clientPool.size();
}

// ========== 私有方法 ==========

HttpClient::UrlParts HttpClient::splitUrl(const std::string& url) {
    UrlParts parts;
    const auto schemeEnd = url.find("://");
    const auto hostStart = (schemeEnd == std::string::npos) ? 0 : schemeEnd + 3;
    const auto pathStart = url.find('/', hostStart);
    if (pathStart == std::string::npos) {
        parts.origin = url;
        parts.path = "/";
    } else {
        parts.origin = url.substr(0, pathStart);
        parts.path = url.substr(pathStart);
    }
    return parts;
}

std::shared_ptr<httplib::Client> HttpClient::makeClient(const std::string& origin,
                                                        int timeoutMs,
                                                        bool followRedirects) const {
    // httplib::Client 接受 scheme://host:port；https 需在编译层开启 CPPHTTPLIB_OPENSSL_SUPPORT
    auto client = std::make_shared<httplib::Client>(origin);
    client->set_connection_timeout(m_poolConfig.connectionTimeout.count() / 1000,
                                   (m_poolConfig.connectionTimeout.count() % 1000) * 1000);
    client->set_read_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
    client->set_write_timeout(5, 0);
    client->set_follow_location(followRedirects);
    return client;
}

std::shared_ptr<httplib::Client> HttpClient::getOrCreateClient(const std::string& url) {
    const auto origin = splitUrl(url).origin;

    std::lock_guard<std::mutex> lock(m_clientMutex);
    pruneIdleClients();

    auto it = m_clientPool.find(origin);
    if (it != m_clientPool.end() && it->second.client) {
        it->second.lastUsed = std::chrono::steady_clock::now();
        return it->second.client;
    }

    ClientEntry entry;
    entry.client = makeClient(origin, m_timeoutMs, m_followRedirects);
    entry.lastUsed = std::chrono::steady_clock::now();
    enforcePoolLimits();
    auto client = entry.client;
    m_clientPool[origin] = std::move(entry);
    return client;
}

HttpResponse HttpClient::executeWithRetry(const HttpRequest& request) {
    HttpResponse response;
    int attempt = 0;

    while (attempt <= m_retryConfig.maxRetries) {
        response = executeOnce(request);

        if (response.isSuccess() || !isRetryableError(response)) {
            break;
        }

        if (attempt < m_retryConfig.maxRetries) {
            std::this_thread::sleep_for(m_retryConfig.getRetryDelay(attempt));
            attempt++;
        } else {
            break;
        }
    }

    return response;
}

HttpResponse HttpClient::executeOnce(const HttpRequest& request) {
    HttpResponse response;

    try {
        auto client = getOrCreateClient(request.url);
        if (!client) {
            response.error = "Failed to create HTTP client";
            return response;
        }

        httplib::Headers headers;
        for (const auto& [key, value] : request.headers) {
            headers.emplace(key, value);
        }

        const auto path = splitUrl(request.url).path;
        httplib::Result result;
        switch (request.method) {
            case HttpMethod::GET:
                result = client->Get(path, headers);
                break;
            case HttpMethod::POST:
                result = client->Post(path, headers, request.body,
                                      request.getHeader("Content-Type").value_or("application/json"));
                break;
            default:
                response.error = "Unsupported HTTP method";
                response.statusCode = 501;
                return response;
        }

        if (result) {
            response.statusCode = result->status;
            response.body = result->body;
            for (const auto& [key, value] : result->headers) {
                response.headers.add(key, value);
            }
        } else {
            response.statusCode = 0;
            response.error = "Request failed: error_code=" +
                             std::to_string(static_cast<int>(result.error()));
        }
    } catch (const std::exception& e) {
        response.statusCode = 0;
        response.error = "Exception: " + std::string(e.what());
    }

    return response;
}

std::string HttpClient::methodToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        default: return "UNKNOWN";
    }
}

std::string HttpClient::buildFullUrl(const std::string& path) const {
    if (m_baseUrl.empty() || path.find("://") != std::string::npos) {
        return path;
    }
    if (path.empty()) {
        return m_baseUrl;
    }

    std::string fullUrl = m_baseUrl;
    if (fullUrl.back() == '/' && path.front() == '/') {
        fullUrl.pop_back();
    } else if (fullUrl.back() != '/' && path.front() != '/') {
        fullUrl += '/';
    }
    fullUrl += path;
    return fullUrl;
}

bool HttpClient::isRetryableError(const HttpResponse& response) const {
    switch (classifyStatus(response.statusCode)) {
        case HttpErrorType::Network:
        case HttpErrorType::Timeout:
            return true;
        case HttpErrorType::RateLimit:
            return m_retryConfig.retryOnRateLimit;
        case HttpErrorType::Server:
            return m_retryConfig.retryOnServerError;
        default:
            return false;
    }
}

std::map<std::string, std::string> HttpClient::mergeHeaders(
    const std::map<std::string, std::string>& requestHeaders) const {
    std::lock_guard<std::mutex> lock(m_clientMutex);
    std::map<std::string, std::string> merged = requestHeaders;
    merged.insert(m_defaultHeaders.begin(), m_defaultHeaders.end());
    return merged;
}

bool HttpClient::buildMultipartBody(const std::string& boundary,
                                    const std::map<std::string, std::string>& fields,
                                    const std::map<std::string, MultipartFile>& files,
                                    std::string& out,
                                    std::string& error) {
    auto hasCtrl = [](const std::string& s) {
        return s.find('\r') != std::string::npos || s.find('\n') != std::string::npos ||
               s.find('"') != std::string::npos;
    };

    std::ostringstream body;
    for (const auto& [name, value] : fields) {
        if (hasCtrl(name)) {
            error = "Invalid multipart field name: " + name;
            return false;
        }
        body << "--" << boundary << "\r\n"
             << "Content-Disposition: form-data; name=\"" << name << "\"\r\n\r\n"
             << value << "\r\n";
    }
    for (const auto& [name, file] : files) {
        if (hasCtrl(name) || hasCtrl(file.filename) || hasCtrl(file.contentType)) {
            error = "Invalid multipart file part: " + name;
            return false;
        }
        body << "--" << boundary << "\r\n"
             << "Content-Disposition: form-data; name=\"" << name << "\"; filename=\"" << file.filename << "\"\r\n"
             << "Content-Type: " << (file.contentType.empty() ? "application/octet-stream" : file.contentType)
             << "\r\n\r\n";
        body.write(file.data.data(), static_cast<std::streamsize>(file.data.size()));
        body << "\r\n";
    }
    body << "--" << boundary << "--\r\n";
    out = body.str();
    return true;
}

std::string HttpClient::makeBoundary() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << "----ParleyBoundary" << std::hex << std::setfill('0') << std::setw(16) << rng();
    return oss.str();
}

HttpErrorType HttpClient::classifyStatus(int statusCode) {
    if (statusCode == 0) {
        return HttpErrorType::Network;
    }
    if (statusCode == 408) {
        return HttpErrorType::Timeout;
    }
    if (statusCode == 429) {
        return HttpErrorType::RateLimit;
    }
    if (statusCode >= 500 && statusCode < 600) {
        return HttpErrorType::Server;
    }
    if (statusCode >= 400 && statusCode < 500) {
        return HttpErrorType::Client;
    }
    return HttpErrorType::None;
}

void HttpClient::pruneIdleClients() {
    const auto now = std::chrono::steady_clock::now();
    for (auto it = m_clientPool.begin(); it != m_clientPool.end(); ) {
        if (now - it->second.lastUsed > m_poolConfig.idleTimeout) {
            it = m_clientPool.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpClient::enforcePoolLimits() {
    // 超出上限时淘汰最久未使用的
    while (!m_clientPool.empty() && m_clientPool.size() >= m_poolConfig.maxConnections) {
        auto oldest = m_clientPool.begin();
        for (auto it = m_clientPool.begin(); it != m_clientPool.end(); ++it) {
            if (it->second.lastUsed < oldest->second.lastUsed) {
                oldest = it;
            }
        }
        m_clientPool.erase(oldest);
    }
}

} // namespace parley::voice_chat::service::utils
