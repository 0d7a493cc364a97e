#include "parley/voice_chat/service/RecordingController.h"

#include <mutex>
#include <vector>

namespace parley::voice_chat::service {

RecordingController::RecordingController(CoordinationState& state,
                                         utils::AudioBackend& backend,
                                         Transcriber& transcriber,
                                         const ErrorHandler& log,
                                         std::chrono::milliseconds pollInterval)
    : state_(state)
    , backend_(backend)
    , transcriber_(transcriber)
    , log_(log)
    , pollInterval_(pollInterval)
{}

std::string RecordingController::listen(const ListenRequest& request) {
    const auto token = state_.generations.begin(ResourceClass::Recording);
    const SupersessionGuard guard(state_.generations, ResourceClass::Recording, token, pollInterval_);
    const auto session = std::to_string(token.generation());
    if (!state_.inputLoudness.claim(token)) {
        // 更新的会话已先接管遥测单元，本会话只会读到过期结果
        log_.log(ErrorHandler::LogLevel::Debug, "Recording session " + session + " superseded before telemetry claim");
    }

    std::mutex samplesMutex;
    std::vector<float> samples;

    auto input = backend_.openInput();
    auto* source = input.get();
    input->start([&, source](const void* frames, std::uint32_t frameCount) {
        // 过期的采集回调不再写入样本与遥测
        if (!guard.stillCurrent()) return;
        std::vector<float> mono;
        utils::downmixToMono(source->streamFormat(), frames, frameCount, mono);
        const float rms = utils::computeRms(mono.data(), mono.size());
        {
            std::lock_guard<std::mutex> lk(samplesMutex);
            samples.insert(samples.end(), mono.begin(), mono.end());
        }
        state_.inputLoudness.publish(token, rms);
    });
    log_.log(ErrorHandler::LogLevel::Info, "Recording session " + session + " started");

    guard.waitWhile([]() { return true; });
    input->stop();
    const auto sampleRate = input->streamFormat().sampleRate;

    if (state_.recordingCancel.isCancelled(token)) {
        log_.log(ErrorHandler::LogLevel::Info, "Recording session " + session + " cancelled");
        return "";
    }

    // 采集结束：在发起转写之前通知观察方
    state_.inputLoudness.publish(token, TelemetryCell::kAwaitingResult);

    std::vector<float> captured;
    {
        std::lock_guard<std::mutex> lk(samplesMutex);
        captured.swap(samples);
    }
    log_.log(ErrorHandler::LogLevel::Info,
             "Recording session " + session + " finished with " + std::to_string(captured.size()) + " samples");

    TranscriptionRequest tr;
    tr.apiKey = request.authToken;
    tr.language = request.language;
    tr.wav = backend_.encodeWav(captured, sampleRate);
    return transcriber_.transcribe(tr);
}

void RecordingController::stop() {
    const auto vacated = state_.generations.forceStop(ResourceClass::Recording);
    log_.log(ErrorHandler::LogLevel::Debug, "Recording stop requested, generation " + std::to_string(vacated));
}

void RecordingController::cancel() {
    const auto vacated = state_.generations.forceStop(ResourceClass::Recording);
    state_.recordingCancel.mark(vacated);
    log_.log(ErrorHandler::LogLevel::Debug, "Recording cancel requested, generation " + std::to_string(vacated));
}

float RecordingController::inputLoudness() const {
    return state_.inputLoudness.read();
}

} // namespace parley::voice_chat::service
