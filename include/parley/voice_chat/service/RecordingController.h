#pragma once

#include "parley/voice_chat/service/CoordinationState.h"
#include "parley/voice_chat/service/ErrorHandler.h"
#include "parley/voice_chat/service/SpeechClient.h"
#include "parley/voice_chat/service/SupersessionGuard.h"
#include "parley/voice_chat/service/utils/AudioBackend.h"

#include <chrono>
#include <string>

namespace parley::voice_chat::service {

struct ListenRequest {
    std::string authToken;
    std::string language; // 空：自动识别
};

/**
 * @brief 录音会话控制
 *
 * listen 阻塞直到会话被 stop/cancel（或被新会话抢占）：
 * - stop：结束采集，继续转写
 * - cancel：结束采集并标记取消，跳过转写并返回空串
 * 响度遥测：会话开始复位为 0，采集中为最近一帧 RMS，采集结束、转写之前置为 -1。
 */
class RecordingController {
public:
    RecordingController(CoordinationState& state,
                        utils::AudioBackend& backend,
                        Transcriber& transcriber,
                        const ErrorHandler& log,
                        std::chrono::milliseconds pollInterval = SupersessionGuard::kDefaultPollInterval);

    RecordingController(const RecordingController&) = delete;
    RecordingController& operator=(const RecordingController&) = delete;

    std::string listen(const ListenRequest& request);

    void stop();
    void cancel();

    float inputLoudness() const;

private:
    CoordinationState& state_;
    utils::AudioBackend& backend_;
    Transcriber& transcriber_;
    const ErrorHandler& log_;
    std::chrono::milliseconds pollInterval_;
};

} // namespace parley::voice_chat::service
