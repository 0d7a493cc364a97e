#include "parley/voice_chat/service/PlaybackController.h"

#include "parley/voice_chat/service/OneShotSignal.h"

#include <thread>

namespace parley::voice_chat::service {

namespace {

struct CueTone {
    double frequencyHz;
    std::chrono::milliseconds duration;
};

CueTone toneFor(SoundCue cue) {
    switch (cue) {
        case SoundCue::SpeakerTest: return {256.0, std::chrono::milliseconds(1000)};
        case SoundCue::FocusInput: return {880.0, std::chrono::milliseconds(100)};
        default: return {440.0, std::chrono::milliseconds(200)};
    }
}

constexpr float kCueVolume = 0.5f;

} // namespace

const char* playbackOutcomeToString(PlaybackOutcome o) {
    switch (o) {
        case PlaybackOutcome::Finished: return "finished";
        case PlaybackOutcome::Superseded: return "superseded";
        case PlaybackOutcome::Prefetched: return "prefetched";
        case PlaybackOutcome::Skipped: return "skipped";
        default: return "unknown";
    }
}

PlaybackController::PlaybackController(CoordinationState& state,
                                       utils::AudioBackend& backend,
                                       SpeechSynthesizer& synthesizer,
                                       AudioCache& cache,
                                       const ErrorHandler& log,
                                       BeepPattern beepPattern,
                                       std::chrono::milliseconds pollInterval)
    : state_(state)
    , backend_(backend)
    , synthesizer_(synthesizer)
    , cache_(cache)
    , log_(log)
    , beepPattern_(beepPattern)
    , pollInterval_(pollInterval)
{}

PlaybackOutcome PlaybackController::speak(const SpeakRequest& request) {
    if (request.noCache && request.preFetch) {
        return PlaybackOutcome::Skipped;
    }
    const auto token = request.preFetch ? OperationToken::ungated()
                                        : state_.generations.begin(ResourceClass::Playback);
    const auto key = request.cacheKey.value_or(MemoryAudioCache::makeKey(request.voice, request.text));

    if (auto cached = cache_.get(key); cached.has_value()) {
        log_.log(ErrorHandler::LogLevel::Debug, "Speech cache hit");
        if (request.preFetch) return PlaybackOutcome::Prefetched;
        return playClip(*cached, token);
    }

    std::vector<std::uint8_t> data;
    {
        auto signal = makeOneShot();
        BeepCoordinator beep(backend_, beepPattern_, request.beepVolume, std::move(signal.second), log_);
        // 声明在 beep 之后：异常退出时先析构（自动通知），beep 才能 join
        OneShotSender beepStop = std::move(signal.first);
        beep.start();

        SynthesisRequest sr;
        sr.text = request.text;
        sr.voice = request.voice;
        sr.apiKey = request.apiKey;
        data = synthesizer_.synthesize(sr);
        beepStop.notify();
    }

    if (!request.noCache) {
        cache_.put(key, data);
    }
    if (request.preFetch) {
        return PlaybackOutcome::Prefetched;
    }
    return playClip(data, token);
}

PlaybackOutcome PlaybackController::playClip(const std::vector<std::uint8_t>& encoded, const OperationToken& token) {
    if (encoded.empty()) {
        return PlaybackOutcome::Finished;
    }
    const SupersessionGuard guard(state_.generations, ResourceClass::Playback, token, pollInterval_);
    if (!guard.stillCurrent()) {
        return PlaybackOutcome::Superseded;
    }

    auto output = backend_.openOutput();
    output->playEncoded(encoded, 1.0f);
    const auto exit = guard.waitWhile([&output]() { return output->isPlaying(); });
    output->stop();

    if (exit == GuardExit::Superseded) {
        log_.log(ErrorHandler::LogLevel::Info,
                 "Playback generation " + std::to_string(token.generation()) + " superseded");
        return PlaybackOutcome::Superseded;
    }
    return PlaybackOutcome::Finished;
}

void PlaybackController::stopAudio() {
    const auto vacated = state_.generations.forceStop(ResourceClass::Playback);
    log_.log(ErrorHandler::LogLevel::Debug, "Playback stop requested, generation " + std::to_string(vacated));
}

void PlaybackController::playCue(SoundCue cue) {
    const auto tone = toneFor(cue);
    auto output = backend_.openOutput();
    output->playTone(tone.frequencyHz, kCueVolume);
    std::this_thread::sleep_for(tone.duration);
    output->stop();
}

} // namespace parley::voice_chat::service
