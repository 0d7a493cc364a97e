#include "parley/voice_chat/service/ConfigManager.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace parley::voice_chat::service {

static std::string trimCopy(std::string s) {
    auto notSpace = [](int ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

ConfigManager::ConfigManager()
    : m_cfg(makeDefaultConfig())
{}

bool ConfigManager::loadFromFile(const std::string& path, ErrorInfo* err) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_cfg = makeDefaultConfig();
            applyEnvMappingOverrides(m_cfg);
            replaceEnvPlaceholdersRecursive(m_cfg);
        }

        // 落盘的是模板，保持 ${OPENAI_API_KEY} 占位符，不写入 env 替换后的明文
        ErrorInfo saveErr;
        const bool created = saveToFile(path, &saveErr);

        if (err) {
            err->errorType = ErrorType::UnknownError;
            err->errorCode = 0;
            err->message = "Config file not found, using default config: " + path;
            err->details = nlohmann::json{
                {"path", path},
                {"fallback", "default_config"},
                {"auto_created", created}
            };
            if (!created) {
                (*err->details)["auto_create_failed"] = saveErr.toJson();
            }
        }
        return true;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return loadFromString(buffer.str(), err);
}

bool ConfigManager::loadFromString(const std::string& jsonText, ErrorInfo* err) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(jsonText);
    } catch (const nlohmann::json::parse_error& e) {
        if (err) {
            err->errorType = ErrorType::InvalidRequest;
            err->errorCode = 0;
            err->message = std::string("Config JSON parse failed: ") + e.what();
            err->details = nlohmann::json{{"snippet", jsonText.substr(0, 256)}};
        }
        return false;
    }

    if (!parsed.is_object()) {
        if (err) {
            err->errorType = ErrorType::InvalidRequest;
            err->errorCode = 0;
            err->message = "Config root must be a JSON object";
        }
        return false;
    }

    // 在锁外处理 env 逻辑，避免长期占用
    applyEnvMappingOverrides(parsed);
    replaceEnvPlaceholdersRecursive(parsed);

    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_cfg = std::move(parsed);
    }
    return true;
}

nlohmann::json ConfigManager::getRaw() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_cfg;
}

bool ConfigManager::saveToFile(const std::string& path, ErrorInfo* err) const {
    const std::filesystem::path p(path);
    const auto parent = p.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec && !std::filesystem::exists(parent)) {
            if (err) {
                err->errorType = ErrorType::UnknownError;
                err->errorCode = 1;
                err->message = "Failed to create config directory: " + parent.string();
                err->details = nlohmann::json{{"path", path}, {"ec", ec.value()}, {"what", ec.message()}};
            }
            return false;
        }
    }

    std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        if (err) {
            err->errorType = ErrorType::UnknownError;
            err->errorCode = 2;
            err->message = "Failed to open config file for write: " + path;
            err->details = nlohmann::json{{"path", path}};
        }
        return false;
    }

    ofs << makeDefaultConfig().dump(2) << "\n";
    ofs.flush();
    if (!ofs) {
        if (err) {
            err->errorType = ErrorType::UnknownError;
            err->errorCode = 3;
            err->message = "Failed to write config file: " + path;
            err->details = nlohmann::json{{"path", path}};
        }
        return false;
    }
    return true;
}

std::optional<nlohmann::json> ConfigManager::get(const std::string& keyPath) const {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lk(m_mu);
    const nlohmann::json* p = getPtrByPath(m_cfg, parts);
    if (!p) return std::nullopt;
    return std::optional<nlohmann::json>{*p};
}

std::string ConfigManager::getString(const std::string& keyPath, const std::string& fallback) const {
    if (auto v = get(keyPath); v.has_value() && v->is_string()) {
        return trimCopy(v->get<std::string>());
    }
    return fallback;
}

long long ConfigManager::getInt(const std::string& keyPath, long long fallback) const {
    if (auto v = get(keyPath); v.has_value()) {
        if (v->is_number_integer()) return v->get<long long>();
        if (v->is_number()) return static_cast<long long>(v->get<double>());
    }
    return fallback;
}

double ConfigManager::getNumber(const std::string& keyPath, double fallback) const {
    if (auto v = get(keyPath); v.has_value() && v->is_number()) {
        return v->get<double>();
    }
    return fallback;
}

bool ConfigManager::getBool(const std::string& keyPath, bool fallback) const {
    if (auto v = get(keyPath); v.has_value() && v->is_boolean()) {
        return v->get<bool>();
    }
    return fallback;
}

bool ConfigManager::set(const std::string& keyPath, const nlohmann::json& v, ErrorInfo* err) {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) {
        if (err) {
            err->errorType = ErrorType::InvalidRequest;
            err->errorCode = 0;
            err->message = "Empty keyPath";
        }
        return false;
    }

    std::lock_guard<std::mutex> lk(m_mu);
    nlohmann::json* p = getOrCreatePtrByPath(m_cfg, parts);
    *p = v;
    return true;
}

void ConfigManager::applyEnvironmentOverrides() {
    std::lock_guard<std::mutex> lk(m_mu);
    applyEnvMappingOverrides(m_cfg);
    replaceEnvPlaceholdersRecursive(m_cfg);
}

std::vector<std::string> ConfigManager::validate() const {
    return validateJson(getRaw());
}

nlohmann::json ConfigManager::makeDefaultConfig() {
    nlohmann::json j;
    j["_comment"] = "Parley voice chat service config template (auto-generated). JSON has no comments; use _comment fields.";
    j["api"] = {
        {"_comment", "api_key is recommended to be injected via env var, avoid plaintext on disk."},
        {"base_url", "https://api.openai.com/v1"},
        {"api_key", "${OPENAI_API_KEY}"},
        {"default_timeout_ms", 30000}
    };
    j["chat"] = {
        {"_comment", "Streaming chat completion endpoint. api_key_authentication=true sends 'api-key' instead of 'Authorization: Bearer'."},
        {"endpoint", "https://api.openai.com/v1/chat/completions"},
        {"model", "gpt-4o-mini"},
        {"api_key_authentication", false},
        {"timeout_ms", 120000}
    };
    j["speech"] = {
        {"tts",
         {
             {"_comment", "OpenAI compatible /audio/speech. Empty base_url/api_key fall back to api.*"},
             {"base_url", ""},
             {"api_key", ""},
             {"model_id", "tts-1"},
             {"voice", "alloy"},
             {"response_format", "mp3"},
             {"timeout_ms", 60000}
         }},
        {"stt",
         {
             {"_comment", "OpenAI compatible /audio/transcriptions. Empty base_url/api_key fall back to api.*"},
             {"base_url", ""},
             {"api_key", ""},
             {"model_id", "whisper-1"},
             {"language", ""},
             {"timeout_ms", 60000}
         }}
    };
    j["audio"] = {
        {"poll_interval_ms", 50},
        {"beep",
         {
             {"_comment", "Duty-cycled waiting tone while a speech clip is fetched."},
             {"frequency_hz", 659.25},
             {"on_volume", 0.5},
             {"tick_ms", 200},
             {"on_ticks", 1},
             {"period_ticks", 5}
         }}
    };
    j["cache"] = {
        {"max_entries", 256}
    };
    j["logging"] = {
        {"enabled", true},
        {"min_level", "warning"}
    };
    return j;
}

std::string ConfigManager::redactSensitive(const std::string& keyPath, const std::string& value) {
    if (!isSensitiveKeyPath(keyPath)) return value;
    const auto v = trimCopy(value);
    if (v.size() <= 8) return "******";
    return v.substr(0, 2) + "******" + v.substr(v.size() - 2);
}

bool ConfigManager::looksLikeEnvPlaceholder(const std::string& s) {
    return s.find("${") != std::string::npos;
}

std::optional<std::string> ConfigManager::getEnv(const std::string& name) {
    if (name.empty()) return std::nullopt;
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    std::string s = v;
    if (s.empty()) return std::nullopt;
    return s;
}

bool ConfigManager::isSensitiveKeyPath(const std::string& keyPath) {
    std::string low = keyPath;
    std::transform(low.begin(), low.end(), low.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return low.find("api_key") != std::string::npos || low.find("apikey") != std::string::npos ||
           low.find("secret") != std::string::npos || low.find("token") != std::string::npos;
}

std::vector<std::string> ConfigManager::splitKeyPath(const std::string& keyPath) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : keyPath) {
        if (c == '.') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

const nlohmann::json* ConfigManager::getPtrByPath(const nlohmann::json& root, const std::vector<std::string>& parts) {
    const nlohmann::json* p = &root;
    for (const auto& k : parts) {
        if (!p->is_object()) return nullptr;
        auto it = p->find(k);
        if (it == p->end()) return nullptr;
        p = &(*it);
    }
    return p;
}

nlohmann::json* ConfigManager::getOrCreatePtrByPath(nlohmann::json& root, const std::vector<std::string>& parts) {
    nlohmann::json* p = &root;
    for (const auto& k : parts) {
        if (!p->is_object()) {
            *p = nlohmann::json::object();
        }
        p = &((*p)[k]);
    }
    return p;
}

void ConfigManager::applyEnvMappingOverrides(nlohmann::json& root) {
    // 固定映射：env -> keyPath
    struct MapItem {
        const char* env;
        const char* keyPath;
        bool integer;
    };
    const MapItem mapping[] = {
        {"OPENAI_API_KEY", "api.api_key", false},
        {"OPENAI_BASE_URL", "api.base_url", false},
        {"PARLEY_CHAT_ENDPOINT", "chat.endpoint", false},
        {"PARLEY_LOG_LEVEL", "logging.min_level", false},
        {"PARLEY_POLL_INTERVAL_MS", "audio.poll_interval_ms", true},
    };

    for (const auto& m : mapping) {
        auto v = getEnv(m.env);
        if (!v.has_value()) continue;
        const auto val = trimCopy(v.value());
        if (val.empty()) continue;
        nlohmann::json* p = getOrCreatePtrByPath(root, splitKeyPath(m.keyPath));
        if (m.integer) {
            try {
                *p = std::stoll(val);
            } catch (const std::exception&) {
                // 保留字符串，validate() 会报告类型错误
                *p = val;
            }
        } else {
            *p = val;
        }
    }
}

void ConfigManager::replaceEnvPlaceholdersRecursive(nlohmann::json& node) {
    if (node.is_object() || node.is_array()) {
        for (auto& v : node) {
            replaceEnvPlaceholdersRecursive(v);
        }
        return;
    }
    if (node.is_string()) {
        node = replaceEnvPlaceholdersInString(node.get<std::string>());
    }
}

std::string ConfigManager::replaceEnvPlaceholdersInString(const std::string& s) {
    // 替换 ${ENV_NAME} 形式的占位符；未找到 env 时保留原样
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        if (i + 2 < s.size() && s[i] == '$' && s[i + 1] == '{') {
            const auto end = s.find('}', i + 2);
            if (end != std::string::npos) {
                const auto name = s.substr(i + 2, end - (i + 2));
                auto v = getEnv(name);
                if (v.has_value()) {
                    out += v.value();
                } else {
                    out += s.substr(i, end - i + 1);
                }
                i = end + 1;
                continue;
            }
        }
        out.push_back(s[i]);
        i++;
    }
    return out;
}

std::vector<std::string> ConfigManager::validateJson(const nlohmann::json& cfgCopy) {
    std::vector<std::string> out;

    auto checkIntRange = [&out](const nlohmann::json* node, const std::string& name, long long lo, long long hi) {
        if (!node) return;
        if (!node->is_number_integer()) {
            out.push_back("Invalid '" + name + "' (integer required)");
            return;
        }
        const auto v = node->get<long long>();
        if (v < lo || v > hi) {
            out.push_back("Invalid '" + name + "' (range " + std::to_string(lo) + ".." + std::to_string(hi) + ")");
        }
    };

    // api
    if (!cfgCopy.contains("api") || !cfgCopy["api"].is_object()) {
        out.push_back("Missing or invalid 'api' object");
        return out;
    }
    const auto& api = cfgCopy["api"];
    if (!api.contains("base_url") || !api["base_url"].is_string() || trimCopy(api["base_url"].get<std::string>()).empty()) {
        out.push_back("Missing or invalid 'api.base_url' (string required)");
    } else {
        const auto baseUrl = trimCopy(api["base_url"].get<std::string>());
        if (!(startsWith(baseUrl, "http://") || startsWith(baseUrl, "https://"))) {
            out.push_back("Invalid 'api.base_url' (must start with http:// or https://)");
        }
    }

    if (!api.contains("api_key") || !api["api_key"].is_string()) {
        out.push_back("Missing or invalid 'api.api_key' (string required)");
    } else {
        const auto key = trimCopy(api["api_key"].get<std::string>());
        if (key.empty()) {
            out.push_back("Invalid 'api.api_key' (empty)");
        } else if (startsWith(key, "${") && key.find('}') != std::string::npos) {
            // 仍为占位符，通常意味着 env 未提供
            out.push_back("Invalid 'api.api_key' (unresolved env placeholder): " + redactSensitive("api.api_key", key));
        }
    }
    checkIntRange(getPtrByPath(cfgCopy, {"api", "default_timeout_ms"}), "api.default_timeout_ms", 1, 300000);

    // chat
    if (const auto* endpoint = getPtrByPath(cfgCopy, {"chat", "endpoint"})) {
        if (!endpoint->is_string() ||
            !(startsWith(endpoint->get<std::string>(), "http://") || startsWith(endpoint->get<std::string>(), "https://"))) {
            out.push_back("Invalid 'chat.endpoint' (http(s) URL required)");
        }
    } else {
        out.push_back("WARN: 'chat.endpoint' not set; every chat completion request must carry its own endpoint");
    }

    // audio
    checkIntRange(getPtrByPath(cfgCopy, {"audio", "poll_interval_ms"}), "audio.poll_interval_ms", 1, 1000);
    checkIntRange(getPtrByPath(cfgCopy, {"audio", "beep", "tick_ms"}), "audio.beep.tick_ms", 1, 10000);
    const auto* onTicks = getPtrByPath(cfgCopy, {"audio", "beep", "on_ticks"});
    const auto* periodTicks = getPtrByPath(cfgCopy, {"audio", "beep", "period_ticks"});
    checkIntRange(onTicks, "audio.beep.on_ticks", 0, 1000);
    checkIntRange(periodTicks, "audio.beep.period_ticks", 1, 1000);
    if (onTicks && periodTicks && onTicks->is_number_integer() && periodTicks->is_number_integer() &&
        onTicks->get<long long>() > periodTicks->get<long long>()) {
        out.push_back("Invalid 'audio.beep.on_ticks' (must not exceed audio.beep.period_ticks)");
    }
    if (const auto* onVolume = getPtrByPath(cfgCopy, {"audio", "beep", "on_volume"})) {
        if (!onVolume->is_number() || onVolume->get<double>() < 0.0 || onVolume->get<double>() > 1.0) {
            out.push_back("Invalid 'audio.beep.on_volume' (number in 0..1 required)");
        }
    }

    // cache
    checkIntRange(getPtrByPath(cfgCopy, {"cache", "max_entries"}), "cache.max_entries", 0, 1000000);

    // logging
    if (const auto* level = getPtrByPath(cfgCopy, {"logging", "min_level"})) {
        static const char* kLevels[] = {"error", "warning", "info", "debug"};
        const bool known = level->is_string() &&
            std::find_if(std::begin(kLevels), std::end(kLevels), [&](const char* l) {
                return level->get<std::string>() == l;
            }) != std::end(kLevels);
        if (!known) {
            out.push_back("Invalid 'logging.min_level' (error|warning|info|debug)");
        }
    }

    return out;
}

bool ConfigManager::startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace parley::voice_chat::service
