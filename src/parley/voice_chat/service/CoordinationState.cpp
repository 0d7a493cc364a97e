#include "parley/voice_chat/service/CoordinationState.h"

#include "parley/voice_chat/service/ErrorTypes.h"

#include <string>
#include <system_error>

namespace parley::voice_chat::service {

std::unique_lock<std::mutex> lockSharedState(std::mutex& mu, const char* what) {
    try {
        return std::unique_lock<std::mutex>(mu);
    } catch (const std::system_error& e) {
        ErrorInfo info = ErrorInfo::make(ErrorType::SharedStateUnavailable,
                                         std::string("Failed to lock shared state: ") + (what ? what : "unknown"),
                                         e.code().value());
        info.details = nlohmann::json{{"what", e.what()}};
        throw VoiceChatError(info);
    }
}

} // namespace parley::voice_chat::service
