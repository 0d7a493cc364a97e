#include "parley/voice_chat/service/utils/MiniaudioBackend.h"

#include "parley/voice_chat/service/ErrorTypes.h"

#include <algorithm>
#include <cstring>
#include <miniaudio.h>
#include <string>

namespace {

using parley::voice_chat::service::ErrorType;
using parley::voice_chat::service::VoiceChatError;
using parley::voice_chat::service::utils::AudioInput;
using parley::voice_chat::service::utils::AudioOutput;
using parley::voice_chat::service::utils::AudioStreamFormat;
using parley::voice_chat::service::utils::SampleFormat;

ma_engine* toEngine(void* ptr) { return reinterpret_cast<ma_engine*>(ptr); }

[[noreturn]] void throwDeviceError(const std::string& what, ma_result result) {
    throw VoiceChatError(ErrorType::ResourceUnavailable,
                         what + " failed: " + ma_result_description(result),
                         static_cast<int>(result));
}

SampleFormat fromMiniaudioFormat(ma_format fmt) {
    switch (fmt) {
        case ma_format_u8: return SampleFormat::U8;
        case ma_format_s16: return SampleFormat::S16;
        case ma_format_s24: return SampleFormat::S24;
        case ma_format_s32: return SampleFormat::S32;
        default: return SampleFormat::F32;
    }
}

class MiniaudioOutput : public AudioOutput {
public:
    explicit MiniaudioOutput(ma_engine* engine) : engine_(engine) {}
    ~MiniaudioOutput() override { release(); }

    void playEncoded(const std::vector<std::uint8_t>& encoded, float volume) override {
        release();
        if (encoded.empty()) {
            return;
        }
        // 解码器直接引用内存，数据需在播放期间保持有效
        data_ = encoded;

        auto* decoder = new ma_decoder();
        ma_decoder_config decCfg = ma_decoder_config_init(ma_format_f32, 0, 0);
        ma_result r = ma_decoder_init_memory(data_.data(), data_.size(), &decCfg, decoder);
        if (r != MA_SUCCESS) {
            delete decoder;
            data_.clear();
            throwDeviceError("ma_decoder_init_memory", r);
        }
        decoder_ = decoder;
        startSound(decoder, volume, "playEncoded");
    }

    void playTone(double frequencyHz, float volume) override {
        release();
        auto* waveform = new ma_waveform();
        ma_waveform_config cfg = ma_waveform_config_init(ma_format_f32,
                                                         ma_engine_get_channels(engine_),
                                                         ma_engine_get_sample_rate(engine_),
                                                         ma_waveform_type_sine,
                                                         1.0,
                                                         frequencyHz);
        ma_result r = ma_waveform_init(&cfg, waveform);
        if (r != MA_SUCCESS) {
            delete waveform;
            throwDeviceError("ma_waveform_init", r);
        }
        waveform_ = waveform;
        startSound(waveform, volume, "playTone");
    }

    void setVolume(float volume) override {
        if (sound_) {
            ma_sound_set_volume(sound_, volume);
        }
    }

    bool isPlaying() const override {
        if (!sound_) return false;
        return ma_sound_is_playing(sound_) == MA_TRUE && ma_sound_at_end(sound_) == MA_FALSE;
    }

    void stop() override { release(); }

private:
    void startSound(ma_data_source* source, float volume, const char* what) {
        auto* sound = new ma_sound();
        ma_result r = ma_sound_init_from_data_source(engine_, source, 0, nullptr, sound);
        if (r != MA_SUCCESS) {
            delete sound;
            release();
            throwDeviceError(std::string(what) + ": ma_sound_init_from_data_source", r);
        }
        sound_ = sound;
        ma_sound_set_volume(sound_, volume);
        r = ma_sound_start(sound_);
        if (r != MA_SUCCESS) {
            release();
            throwDeviceError(std::string(what) + ": ma_sound_start", r);
        }
    }

    void release() {
        if (sound_) {
            ma_sound_stop(sound_);
            ma_sound_uninit(sound_);
            delete sound_;
            sound_ = nullptr;
        }
        if (decoder_) {
            ma_decoder_uninit(decoder_);
            delete decoder_;
            decoder_ = nullptr;
        }
        if (waveform_) {
            ma_waveform_uninit(waveform_);
            delete waveform_;
            waveform_ = nullptr;
        }
        data_.clear();
    }

    ma_engine* engine_;
    ma_sound* sound_{nullptr};
    ma_decoder* decoder_{nullptr};
    ma_waveform* waveform_{nullptr};
    std::vector<std::uint8_t> data_;
};

class MiniaudioInput : public AudioInput {
public:
    ~MiniaudioInput() override { stop(); }

    void start(FrameCallback onFrames) override {
        stop();
        onFrames_ = std::move(onFrames);

        auto* ctx = new ma_context();
        ma_result r = ma_context_init(nullptr, 0, nullptr, ctx);
        if (r != MA_SUCCESS) {
            delete ctx;
            throwDeviceError("ma_context_init", r);
        }
        context_ = ctx;

        ma_device_config deviceConfig = ma_device_config_init(ma_device_type_capture);
        // 使用设备默认格式/声道/采样率，由调用方归一化
        deviceConfig.capture.format = ma_format_unknown;
        deviceConfig.capture.channels = 0;
        deviceConfig.sampleRate = 0;
        deviceConfig.dataCallback = [](ma_device* device, void* /*pOutput*/, const void* pInput, ma_uint32 frameCount) {
            auto* self = static_cast<MiniaudioInput*>(device->pUserData);
            if (self && self->onFrames_ && pInput) {
                self->onFrames_(pInput, frameCount);
            }
        };
        deviceConfig.pUserData = this;

        auto* device = new ma_device();
        r = ma_device_init(context_, &deviceConfig, device);
        if (r != MA_SUCCESS) {
            delete device;
            stop();
            throwDeviceError("ma_device_init", r);
        }
        device_ = device;
        format_.format = fromMiniaudioFormat(device->capture.format);
        format_.channels = device->capture.channels;
        format_.sampleRate = device->sampleRate;

        r = ma_device_start(device_);
        if (r != MA_SUCCESS) {
            stop();
            throwDeviceError("ma_device_start", r);
        }
    }

    void stop() override {
        if (device_) {
            // ma_device_uninit 会先停止设备，返回后不再有回调
            ma_device_uninit(device_);
            delete device_;
            device_ = nullptr;
        }
        if (context_) {
            ma_context_uninit(context_);
            delete context_;
            context_ = nullptr;
        }
    }

    AudioStreamFormat streamFormat() const override { return format_; }

private:
    FrameCallback onFrames_;
    ma_context* context_{nullptr};
    ma_device* device_{nullptr};
    AudioStreamFormat format_{};
};

// ---- 内存 WAV 编码 ----
struct MemorySink {
    std::vector<std::uint8_t> bytes;
    std::size_t cursor{0};
};

ma_result sinkWrite(ma_encoder* pEncoder, const void* pBufferIn, size_t bytesToWrite, size_t* pBytesWritten) {
    auto* sink = static_cast<MemorySink*>(pEncoder->pUserData);
    const auto end = sink->cursor + bytesToWrite;
    if (end > sink->bytes.size()) {
        sink->bytes.resize(end);
    }
    std::memcpy(sink->bytes.data() + sink->cursor, pBufferIn, bytesToWrite);
    sink->cursor = end;
    if (pBytesWritten) *pBytesWritten = bytesToWrite;
    return MA_SUCCESS;
}

ma_result sinkSeek(ma_encoder* pEncoder, ma_int64 offset, ma_seek_origin origin) {
    auto* sink = static_cast<MemorySink*>(pEncoder->pUserData);
    ma_int64 base = 0;
    if (origin == ma_seek_origin_current) {
        base = static_cast<ma_int64>(sink->cursor);
    } else if (origin != ma_seek_origin_start) {
        base = static_cast<ma_int64>(sink->bytes.size());
    }
    const ma_int64 target = base + offset;
    if (target < 0) return MA_INVALID_ARGS;
    sink->cursor = static_cast<std::size_t>(target);
    return MA_SUCCESS;
}

} // namespace

namespace parley::voice_chat::service::utils {

MiniaudioBackend::MiniaudioBackend() = default;

MiniaudioBackend::~MiniaudioBackend() {
    std::lock_guard<std::mutex> lock(engineMutex_);
    if (engine_) {
        ma_engine_uninit(toEngine(engine_));
        delete toEngine(engine_);
        engine_ = nullptr;
    }
}

void* MiniaudioBackend::ensureEngine() {
    std::lock_guard<std::mutex> lock(engineMutex_);
    if (engine_) return engine_;

    ma_engine_config cfg = ma_engine_config_init();
    auto* engine = new ma_engine();
    ma_result r = ma_engine_init(&cfg, engine);
    if (r != MA_SUCCESS) {
        delete engine;
        throwDeviceError("ma_engine_init", r);
    }
    engine_ = engine;
    return engine_;
}

std::unique_ptr<AudioOutput> MiniaudioBackend::openOutput() {
    return std::make_unique<MiniaudioOutput>(toEngine(ensureEngine()));
}

std::unique_ptr<AudioInput> MiniaudioBackend::openInput() {
    return std::make_unique<MiniaudioInput>();
}

std::vector<std::uint8_t> MiniaudioBackend::encodeWav(const std::vector<float>& monoSamples,
                                                      std::uint32_t sampleRate) {
    MemorySink sink;
    ma_encoder_config encCfg = ma_encoder_config_init(ma_encoding_format_wav, ma_format_f32, 1, sampleRate);
    ma_encoder encoder;
    ma_result r = ma_encoder_init(sinkWrite, sinkSeek, &sink, &encCfg, &encoder);
    if (r != MA_SUCCESS) {
        throwDeviceError("ma_encoder_init", r);
    }
    ma_uint64 written = 0;
    r = ma_encoder_write_pcm_frames(&encoder, monoSamples.data(), monoSamples.size(), &written);
    // uninit 时回写 RIFF/data 长度
    ma_encoder_uninit(&encoder);
    if (r != MA_SUCCESS) {
        throwDeviceError("ma_encoder_write_pcm_frames", r);
    }
    return std::move(sink.bytes);
}

} // namespace parley::voice_chat::service::utils
