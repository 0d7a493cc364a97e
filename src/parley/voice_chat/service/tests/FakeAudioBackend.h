#pragma once

#include "parley/voice_chat/service/ErrorTypes.h"
#include "parley/voice_chat/service/utils/AudioBackend.h"

#include <atomic>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// 测试用音频后端：不访问设备，记录所有调用
namespace fake_audio {

using parley::voice_chat::service::ErrorType;
using parley::voice_chat::service::VoiceChatError;
using parley::voice_chat::service::utils::AudioBackend;
using parley::voice_chat::service::utils::AudioInput;
using parley::voice_chat::service::utils::AudioOutput;
using parley::voice_chat::service::utils::AudioStreamFormat;
using parley::voice_chat::service::utils::SampleFormat;

struct OutputLog {
    std::mutex mu;
    std::vector<std::vector<std::uint8_t>> clips;
    std::vector<double> toneFrequencies;
    std::vector<float> volumes; // playEncoded/playTone 初始音量 + 每次 setVolume
    int stops{0};
};

class FakeOutput : public AudioOutput {
public:
    FakeOutput(std::shared_ptr<OutputLog> log, std::shared_ptr<std::atomic<bool>> clipPlaying)
        : log_(std::move(log)), clipPlaying_(std::move(clipPlaying)) {}

    void playEncoded(const std::vector<std::uint8_t>& encoded, float volume) override {
        std::lock_guard<std::mutex> lk(log_->mu);
        log_->clips.push_back(encoded);
        log_->volumes.push_back(volume);
        active_ = true;
    }
    void playTone(double frequencyHz, float volume) override {
        std::lock_guard<std::mutex> lk(log_->mu);
        log_->toneFrequencies.push_back(frequencyHz);
        log_->volumes.push_back(volume);
    }
    void setVolume(float volume) override {
        std::lock_guard<std::mutex> lk(log_->mu);
        log_->volumes.push_back(volume);
    }
    bool isPlaying() const override { return active_ && clipPlaying_->load(); }
    void stop() override {
        std::lock_guard<std::mutex> lk(log_->mu);
        log_->stops++;
        active_ = false;
    }

private:
    std::shared_ptr<OutputLog> log_;
    std::shared_ptr<std::atomic<bool>> clipPlaying_;
    bool active_{false};
};

// 后台线程每 5ms 推送一帧固定幅度的 S16 立体声数据
class FakeInput : public AudioInput {
public:
    explicit FakeInput(std::int16_t amplitude) : amplitude_(amplitude) {}
    ~FakeInput() override { stop(); }

    void start(FrameCallback onFrames) override {
        running_ = true;
        worker_ = std::thread([this, cb = std::move(onFrames)]() {
            std::vector<std::int16_t> frames(kFrames * 2, amplitude_);
            while (running_.load()) {
                cb(frames.data(), static_cast<std::uint32_t>(kFrames));
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        });
    }
    void stop() override {
        running_ = false;
        if (worker_.joinable()) worker_.join();
    }
    AudioStreamFormat streamFormat() const override {
        return AudioStreamFormat{SampleFormat::S16, 2, 16000};
    }

private:
    static constexpr std::size_t kFrames = 160;
    std::int16_t amplitude_;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

class FakeAudioBackend : public AudioBackend {
public:
    std::shared_ptr<OutputLog> outputs = std::make_shared<OutputLog>();
    // 为 true 时剪辑一直处于播放状态，直到测试把它置为 false
    std::shared_ptr<std::atomic<bool>> clipPlaying = std::make_shared<std::atomic<bool>>(false);
    std::atomic<bool> failOutput{false};
    std::atomic<bool> failInput{false};
    std::atomic<int> outputsOpened{0};
    std::atomic<int> inputsOpened{0};
    std::int16_t inputAmplitude{16384}; // 0.5 满幅

    std::mutex encodedMu;
    std::vector<float> lastEncoded;
    std::uint32_t lastEncodedRate{0};

    std::unique_ptr<AudioOutput> openOutput() override {
        if (failOutput) throw VoiceChatError(ErrorType::ResourceUnavailable, "no output device");
        outputsOpened++;
        return std::make_unique<FakeOutput>(outputs, clipPlaying);
    }
    std::unique_ptr<AudioInput> openInput() override {
        if (failInput) throw VoiceChatError(ErrorType::ResourceUnavailable, "no input device");
        inputsOpened++;
        return std::make_unique<FakeInput>(inputAmplitude);
    }
    std::vector<std::uint8_t> encodeWav(const std::vector<float>& monoSamples, std::uint32_t sampleRate) override {
        std::lock_guard<std::mutex> lk(encodedMu);
        lastEncoded = monoSamples;
        lastEncodedRate = sampleRate;
        const std::string tag = "RIFF" + std::to_string(monoSamples.size());
        return std::vector<std::uint8_t>(tag.begin(), tag.end());
    }

    size_t clipCount() {
        std::lock_guard<std::mutex> lk(outputs->mu);
        return outputs->clips.size();
    }
    std::vector<double> tones() {
        std::lock_guard<std::mutex> lk(outputs->mu);
        return outputs->toneFrequencies;
    }
    std::vector<float> volumes() {
        std::lock_guard<std::mutex> lk(outputs->mu);
        return outputs->volumes;
    }
};

} // namespace fake_audio
