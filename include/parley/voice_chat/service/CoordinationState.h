#pragma once

#include "parley/voice_chat/service/GenerationRegistry.h"
#include "parley/voice_chat/service/RecordingSignals.h"

#include <mutex>

namespace parley::voice_chat::service {

/**
 * @brief 进程级共享协调状态
 *
 * 由 VoiceChatService 持有，通过构造函数注入到各控制器。
 */
struct CoordinationState {
    GenerationRegistry generations;
    CancellationMarker recordingCancel;
    TelemetryCell inputLoudness;
};

/**
 * @brief 获取共享结构的锁
 *
 * 加锁失败（std::system_error）时抛出 VoiceChatError{SharedStateUnavailable}，
 * 只终止当前调用。
 */
std::unique_lock<std::mutex> lockSharedState(std::mutex& mu, const char* what);

} // namespace parley::voice_chat::service
