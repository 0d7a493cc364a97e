#include "parley/voice_chat/service/BeepCoordinator.h"

#include "parley/voice_chat/service/ConfigManager.h"

#include <algorithm>

namespace parley::voice_chat::service {

BeepPattern BeepPattern::fromConfig(const ConfigManager& cfg) {
    BeepPattern p;
    p.frequencyHz = cfg.getNumber("audio.beep.frequency_hz", p.frequencyHz);
    p.onVolume = static_cast<float>(cfg.getNumber("audio.beep.on_volume", p.onVolume));
    p.tick = std::chrono::milliseconds(std::max<long long>(1, cfg.getInt("audio.beep.tick_ms", p.tick.count())));
    p.periodTicks = static_cast<std::uint32_t>(std::max<long long>(1, cfg.getInt("audio.beep.period_ticks", p.periodTicks)));
    p.onTicks = static_cast<std::uint32_t>(
        std::clamp<long long>(cfg.getInt("audio.beep.on_ticks", p.onTicks), 0, p.periodTicks));
    return p;
}

float BeepPattern::gainAt(std::uint64_t tickIndex, float beepVolume) const {
    if (periodTicks == 0) return 0.0f;
    return (tickIndex % periodTicks) < onTicks ? onVolume * beepVolume : 0.0f;
}

BeepCoordinator::BeepCoordinator(utils::AudioBackend& backend,
                                 BeepPattern pattern,
                                 float beepVolume,
                                 OneShotReceiver stopSignal,
                                 const ErrorHandler& log)
    : backend_(backend)
    , pattern_(pattern)
    , beepVolume_(beepVolume)
    , stopSignal_(std::move(stopSignal))
    , log_(log)
{}

BeepCoordinator::~BeepCoordinator() {
    join();
}

void BeepCoordinator::start() {
    if (worker_.joinable()) return;
    worker_ = std::thread([this]() { run(); });
}

void BeepCoordinator::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void BeepCoordinator::run() {
    std::unique_ptr<utils::AudioOutput> output;
    try {
        output = backend_.openOutput();
        output->playTone(pattern_.frequencyHz, 0.0f);
    } catch (const VoiceChatError& e) {
        log_.log(ErrorHandler::LogLevel::Warning, "Beep output unavailable", e.info());
        return;
    }

    for (std::uint64_t i = 0;; ++i) {
        if (stopSignal_.received()) break;
        output->setVolume(pattern_.gainAt(i, beepVolume_));
        ticks_.fetch_add(1);
        if (stopSignal_.waitFor(pattern_.tick)) break;
    }
    output->stop();
    log_.log(ErrorHandler::LogLevel::Debug, "Beep stopped after " + std::to_string(ticks_.load()) + " ticks");
}

} // namespace parley::voice_chat::service
