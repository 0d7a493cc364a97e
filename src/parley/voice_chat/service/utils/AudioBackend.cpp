#include "parley/voice_chat/service/utils/AudioBackend.h"

#include <cmath>
#include <cstring>

namespace parley::voice_chat::service::utils {

std::size_t bytesPerSample(SampleFormat format) {
    switch (format) {
        case SampleFormat::U8: return 1;
        case SampleFormat::S16: return 2;
        case SampleFormat::S24: return 3;
        case SampleFormat::S32: return 4;
        case SampleFormat::F32: return 4;
        default: return 0;
    }
}

float normalizeSample(SampleFormat format, const void* data, std::size_t index) {
    const auto* bytes = static_cast<const std::uint8_t*>(data);
    switch (format) {
        case SampleFormat::U8:
            return (static_cast<float>(bytes[index]) - 128.0f) / 128.0f;
        case SampleFormat::S16: {
            std::int16_t v = 0;
            std::memcpy(&v, bytes + index * 2, sizeof(v));
            return static_cast<float>(v) / 32768.0f;
        }
        case SampleFormat::S24: {
            const auto* p = bytes + index * 3;
            std::int32_t v = static_cast<std::int32_t>(p[0]) |
                             (static_cast<std::int32_t>(p[1]) << 8) |
                             (static_cast<std::int32_t>(p[2]) << 16);
            if (v & 0x800000) v |= ~0xFFFFFF; // 符号扩展
            return static_cast<float>(v) / 8388608.0f;
        }
        case SampleFormat::S32: {
            std::int32_t v = 0;
            std::memcpy(&v, bytes + index * 4, sizeof(v));
            return static_cast<float>(static_cast<double>(v) / 2147483648.0);
        }
        case SampleFormat::F32: {
            float v = 0.0f;
            std::memcpy(&v, bytes + index * 4, sizeof(v));
            return v;
        }
        default:
            return 0.0f;
    }
}

void downmixToMono(const AudioStreamFormat& format,
                   const void* frames,
                   std::uint32_t frameCount,
                   std::vector<float>& out) {
    if (frames == nullptr || frameCount == 0 || format.channels == 0) return;
    out.reserve(out.size() + frameCount);
    const std::size_t channels = format.channels;
    for (std::size_t f = 0; f < frameCount; ++f) {
        float sum = 0.0f;
        for (std::size_t c = 0; c < channels; ++c) {
            sum += normalizeSample(format.format, frames, f * channels + c);
        }
        out.push_back(sum / static_cast<float>(channels));
    }
}

float computeRms(const float* samples, std::size_t count) {
    if (samples == nullptr || count == 0) return 0.0f;
    double accum = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        accum += static_cast<double>(samples[i]) * static_cast<double>(samples[i]);
    }
    return static_cast<float>(std::sqrt(accum / static_cast<double>(count)));
}

} // namespace parley::voice_chat::service::utils
