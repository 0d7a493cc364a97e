#include "parley/voice_chat/service/ConfigManager.h"
#include "parley/voice_chat/service/ErrorHandler.h"

#include "MiniTest.h"

#include <string>
#include <vector>

using namespace parley::voice_chat::service;
using parley::voice_chat::service::utils::HttpMethod;
using parley::voice_chat::service::utils::HttpRequest;
using parley::voice_chat::service::utils::HttpResponse;

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    tests.push_back({"map_status_to_error_type", []() {
        CHECK_TRUE(ErrorHandler::mapHttpStatusToErrorType(0) == ErrorType::NetworkError);
        CHECK_TRUE(ErrorHandler::mapHttpStatusToErrorType(401) == ErrorType::UpstreamFailure);
        CHECK_TRUE(ErrorHandler::mapHttpStatusToErrorType(500) == ErrorType::UpstreamFailure);
        CHECK_TRUE(ErrorHandler::mapHttpStatusToErrorType(302) == ErrorType::UpstreamFailure);
        CHECK_TRUE(ErrorHandler::mapHttpStatusToErrorType(200) == ErrorType::UnknownError);
    }});

    tests.push_back({"upstream_failure_message_is_status_and_body", []() {
        HttpResponse resp;
        resp.statusCode = 429;
        resp.body = "rate limited";
        const auto info = ErrorHandler::fromHttpResponse(resp);
        CHECK_TRUE(info.errorType == ErrorType::UpstreamFailure);
        CHECK_EQ(info.errorCode, 429);
        CHECK_EQ(info.message, std::string("429: rate limited"));
        CHECK_EQ(info.details->at("body_snippet").get<std::string>(), std::string("rate limited"));
        CHECK_FALSE(info.context.has_value());
    }});

    tests.push_back({"json_error_body_is_parsed", []() {
        HttpResponse resp;
        resp.statusCode = 401;
        resp.headers.add("Content-Type", "application/json; charset=utf-8");
        resp.body = R"({"error":{"message":"Incorrect API key provided","type":"invalid_request_error"}})";

        HttpRequest req;
        req.method = HttpMethod::POST;
        req.url = "https://api.example.com/v1/audio/speech";
        req.headers["Authorization"] = "Bearer sk-secret";

        const auto info = ErrorHandler::fromHttpResponse(resp, req);
        CHECK_EQ(info.message, std::string("401: ") + resp.body);
        CHECK_EQ(info.details->at("api_message").get<std::string>(), std::string("Incorrect API key provided"));
        CHECK_TRUE(info.details->contains("body_json"));
        CHECK_EQ(info.context->at("url"), req.url);
        CHECK_EQ(info.context->at("method"), std::string("POST"));
        // 请求头不进入错误上下文
        CHECK_EQ(info.toString().find("sk-secret"), std::string::npos);
    }});

    tests.push_back({"transport_failure_is_network_error", []() {
        HttpResponse resp;
        resp.error = "Request failed: error_code=2";
        const auto info = ErrorHandler::fromHttpResponse(resp);
        CHECK_TRUE(info.errorType == ErrorType::NetworkError);
        CHECK_EQ(info.message, resp.error);
        CHECK_EQ(info.details->at("transport_error").get<std::string>(), resp.error);
    }});

    tests.push_back({"parse_api_error_shapes", []() {
        const auto obj = ErrorHandler::parseApiErrorJson(nlohmann::json::parse(R"({"error":{"message":"bad"}})"), 400);
        CHECK_TRUE(obj.has_value());
        CHECK_EQ(obj->message, std::string("bad"));
        CHECK_EQ(obj->errorCode, 400);

        const auto str = ErrorHandler::parseApiErrorJson(nlohmann::json::parse(R"({"error":"plain"})"), 500);
        CHECK_TRUE(str.has_value());
        CHECK_EQ(str->message, std::string("plain"));

        CHECK_FALSE(ErrorHandler::parseApiErrorJson(nlohmann::json::parse(R"({"detail":"x"})")).has_value());
        CHECK_FALSE(ErrorHandler::parseApiErrorJson(nlohmann::json::parse(R"({"error":{"code":1}})")).has_value());
        CHECK_FALSE(ErrorHandler::parseApiErrorJson(nlohmann::json::array()).has_value());
    }});

    tests.push_back({"log_levels_parse_and_print", []() {
        CHECK_TRUE(ErrorHandler::parseLogLevel("DEBUG") == ErrorHandler::LogLevel::Debug);
        CHECK_TRUE(ErrorHandler::parseLogLevel("warn") == ErrorHandler::LogLevel::Warning);
        CHECK_FALSE(ErrorHandler::parseLogLevel("verbose").has_value());
        CHECK_EQ(std::string(ErrorHandler::logLevelToString(ErrorHandler::LogLevel::Error)), std::string("ERROR"));
    }});

    tests.push_back({"logger_config_from_config_manager", []() {
        ConfigManager cm;
        CHECK_TRUE(cm.set("logging.min_level", "info"));
        CHECK_TRUE(cm.set("logging.enabled", false));
        const auto cfg = ErrorHandler::makeLoggerConfig(cm);
        CHECK_TRUE(cfg.minLevel == ErrorHandler::LogLevel::Info);
        CHECK_FALSE(cfg.enabled);

        CHECK_TRUE(cm.set("logging.min_level", "nonsense"));
        CHECK_TRUE(ErrorHandler::makeLoggerConfig(cm).minLevel == ErrorHandler::LogLevel::Warning);
    }});

    tests.push_back({"voice_chat_error_carries_info", []() {
        const VoiceChatError e(ErrorType::ResourceUnavailable, "no input device");
        CHECK_EQ(std::string(e.what()), std::string("no input device"));
        CHECK_TRUE(e.type() == ErrorType::ResourceUnavailable);
        CHECK_TRUE(ErrorInfo::defaultSeverity(ErrorType::SharedStateUnavailable) == ErrorSeverity::Critical);
        const auto j = e.info().toJson();
        CHECK_EQ(j.at("error_type").get<std::string>(), std::string("ResourceUnavailable"));
    }});

    tests.push_back({"log_does_not_throw", []() {
        ErrorHandler h(ErrorHandler::LoggerConfig{ErrorHandler::LogLevel::Debug, true});
        h.log(ErrorHandler::LogLevel::Info, "info line");
        h.log(ErrorHandler::LogLevel::Error, "error line", ErrorInfo::make(ErrorType::UnknownError, "x"));
        h.setLoggerConfig(ErrorHandler::LoggerConfig{ErrorHandler::LogLevel::Error, false});
        h.log(ErrorHandler::LogLevel::Error, "suppressed");
        CHECK_FALSE(h.getLoggerConfig().enabled);
    }});

    return mini_test::run(tests);
}
