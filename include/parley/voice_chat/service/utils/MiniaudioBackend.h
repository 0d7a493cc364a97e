#pragma once

#include "AudioBackend.h"

#include <mutex>

namespace parley::voice_chat::service::utils {

/**
 * @brief 基于 miniaudio 的音频后端
 * - 输出：共享一个 ma_engine，每个 AudioOutput 独占一个 ma_sound
 * - 输入：每个 AudioInput 独占 ma_context + capture ma_device，使用设备默认格式
 * - 编码：ma_encoder 写入内存（32-bit float 单声道 WAV）
 *
 * ma_engine 在首次 openOutput 时初始化。
 */
class MiniaudioBackend : public AudioBackend {
public:
    MiniaudioBackend();
    ~MiniaudioBackend() override;

    MiniaudioBackend(const MiniaudioBackend&) = delete;
    MiniaudioBackend& operator=(const MiniaudioBackend&) = delete;

    std::unique_ptr<AudioOutput> openOutput() override;
    std::unique_ptr<AudioInput> openInput() override;
    std::vector<std::uint8_t> encodeWav(const std::vector<float>& monoSamples,
                                        std::uint32_t sampleRate) override;

private:
    void* ensureEngine();

    std::mutex engineMutex_;
    void* engine_{nullptr}; // ma_engine*
};

} // namespace parley::voice_chat::service::utils
