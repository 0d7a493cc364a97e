#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parley::voice_chat::service::utils {

/**
 * @brief 输入设备原生采样格式
 */
enum class SampleFormat {
    U8,
    S16,
    S24, // 3 字节小端打包
    S32,
    F32,
};

struct AudioStreamFormat {
    SampleFormat format{SampleFormat::F32};
    std::uint32_t channels{1};
    std::uint32_t sampleRate{16000};
};

std::size_t bytesPerSample(SampleFormat format);

/**
 * @brief 输出流（每次播放/提示音独占一个）
 *
 * 实现失败时抛出 VoiceChatError{ResourceUnavailable}。
 */
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    // 解码编码后的剪辑（wav/mp3/flac）并开始播放
    virtual void playEncoded(const std::vector<std::uint8_t>& encoded, float volume) = 0;
    // 开始连续正弦波
    virtual void playTone(double frequencyHz, float volume) = 0;
    virtual void setVolume(float volume) = 0;
    // "还有内容要播放"
    virtual bool isPlaying() const = 0;
    virtual void stop() = 0;
};

/**
 * @brief 输入流
 */
class AudioInput {
public:
    // frames：交错排列的原生帧；frameCount：帧数
    using FrameCallback = std::function<void(const void* frames, std::uint32_t frameCount)>;

    virtual ~AudioInput() = default;

    virtual void start(FrameCallback onFrames) = 0;
    virtual void stop() = 0;
    // start 之后反映设备实际参数
    virtual AudioStreamFormat streamFormat() const = 0;
};

/**
 * @brief 音频设备与编码的抽象，便于测试替换
 */
class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    virtual std::unique_ptr<AudioOutput> openOutput() = 0;
    virtual std::unique_ptr<AudioInput> openInput() = 0;

    // 单声道 float 样本 -> 32-bit float WAV 字节
    virtual std::vector<std::uint8_t> encodeWav(const std::vector<float>& monoSamples,
                                                std::uint32_t sampleRate) = 0;
};

// ---- 归一化（纯内存，便于测试）----

/**
 * @brief 读取第 index 个样本并归一化到 [-1, 1]
 */
float normalizeSample(SampleFormat format, const void* data, std::size_t index);

/**
 * @brief 交错多声道帧按帧求均值，追加到 out
 */
void downmixToMono(const AudioStreamFormat& format,
                   const void* frames,
                   std::uint32_t frameCount,
                   std::vector<float>& out);

float computeRms(const float* samples, std::size_t count);

} // namespace parley::voice_chat::service::utils
