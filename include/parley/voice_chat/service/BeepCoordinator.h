#pragma once

#include "parley/voice_chat/service/ErrorHandler.h"
#include "parley/voice_chat/service/OneShotSignal.h"
#include "parley/voice_chat/service/utils/AudioBackend.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

namespace parley::voice_chat::service {

class ConfigManager;

/**
 * @brief 提示音占空比：每 periodTicks 个 tick 中前 onTicks 个为开
 */
struct BeepPattern {
    double frequencyHz{659.25};
    float onVolume{0.5f};
    std::chrono::milliseconds tick{200};
    std::uint32_t onTicks{1};
    std::uint32_t periodTicks{5};

    // 读取 audio.beep.*
    static BeepPattern fromConfig(const ConfigManager& cfg);

    float gainAt(std::uint64_t tickIndex, float beepVolume) const;
};

/**
 * @brief 单次请求范围内的"处理中"提示音
 *
 * 独立于代际计数器；只操作自己的输出流，收到一次性信号后停止并退出。
 * 析构时等待线程结束，因此发送端必须先于析构通知（OneShotSender 析构会自动通知）。
 */
class BeepCoordinator {
public:
    BeepCoordinator(utils::AudioBackend& backend,
                    BeepPattern pattern,
                    float beepVolume,
                    OneShotReceiver stopSignal,
                    const ErrorHandler& log);
    ~BeepCoordinator();

    BeepCoordinator(const BeepCoordinator&) = delete;
    BeepCoordinator& operator=(const BeepCoordinator&) = delete;

    void start();
    void join();

    // 已执行的 tick 数（测试观测用）
    std::uint64_t ticksElapsed() const { return ticks_.load(); }

private:
    void run();

    utils::AudioBackend& backend_;
    BeepPattern pattern_;
    float beepVolume_;
    OneShotReceiver stopSignal_;
    const ErrorHandler& log_;
    std::thread worker_;
    std::atomic<std::uint64_t> ticks_{0};
};

} // namespace parley::voice_chat::service
