#include "parley/voice_chat/service/utils/AudioBackend.h"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <vector>

using namespace parley::voice_chat::service::utils;

TEST(AudioBackendTests, BytesPerSample) {
    EXPECT_EQ(bytesPerSample(SampleFormat::U8), 1u);
    EXPECT_EQ(bytesPerSample(SampleFormat::S16), 2u);
    EXPECT_EQ(bytesPerSample(SampleFormat::S24), 3u);
    EXPECT_EQ(bytesPerSample(SampleFormat::S32), 4u);
    EXPECT_EQ(bytesPerSample(SampleFormat::F32), 4u);
}

TEST(AudioBackendTests, NormalizeIntegerFormats) {
    const std::uint8_t u8[] = {0, 128, 255};
    EXPECT_FLOAT_EQ(normalizeSample(SampleFormat::U8, u8, 0), -1.0f);
    EXPECT_FLOAT_EQ(normalizeSample(SampleFormat::U8, u8, 1), 0.0f);

    const std::int16_t s16[] = {-32768, 0, 16384};
    EXPECT_FLOAT_EQ(normalizeSample(SampleFormat::S16, s16, 0), -1.0f);
    EXPECT_FLOAT_EQ(normalizeSample(SampleFormat::S16, s16, 2), 0.5f);

    // 小端 24 位：-4194304 (0xC00000) 与 4194304 (0x400000)
    const std::uint8_t s24[] = {0x00, 0x00, 0xC0, 0x00, 0x00, 0x40};
    EXPECT_FLOAT_EQ(normalizeSample(SampleFormat::S24, s24, 0), -0.5f);
    EXPECT_FLOAT_EQ(normalizeSample(SampleFormat::S24, s24, 1), 0.5f);

    const std::int32_t s32[] = {1073741824};
    EXPECT_FLOAT_EQ(normalizeSample(SampleFormat::S32, s32, 0), 0.5f);

    const float f32[] = {0.25f, -0.75f};
    EXPECT_FLOAT_EQ(normalizeSample(SampleFormat::F32, f32, 1), -0.75f);
}

TEST(AudioBackendTests, DownmixAveragesChannels) {
    const std::int16_t stereo[] = {16384, 0, -16384, -16384};
    AudioStreamFormat fmt{SampleFormat::S16, 2, 48000};
    std::vector<float> mono{9.0f};
    downmixToMono(fmt, stereo, 2, mono);
    ASSERT_EQ(mono.size(), 3u);
    EXPECT_FLOAT_EQ(mono[0], 9.0f); // 追加，不覆盖
    EXPECT_FLOAT_EQ(mono[1], 0.25f);
    EXPECT_FLOAT_EQ(mono[2], -0.5f);
}

TEST(AudioBackendTests, DownmixIgnoresEmptyInput) {
    std::vector<float> mono;
    downmixToMono(AudioStreamFormat{}, nullptr, 10, mono);
    AudioStreamFormat zeroChannels{SampleFormat::F32, 0, 16000};
    const float frames[] = {1.0f};
    downmixToMono(zeroChannels, frames, 1, mono);
    EXPECT_TRUE(mono.empty());
}

TEST(AudioBackendTests, RmsOfConstantAndSine) {
    const std::vector<float> constant(100, -0.5f);
    EXPECT_NEAR(computeRms(constant.data(), constant.size()), 0.5f, 1e-6f);

    std::vector<float> sine(1600);
    for (size_t i = 0; i < sine.size(); ++i) {
        sine[i] = static_cast<float>(std::sin(2.0 * 3.14159265358979 * 100.0 * static_cast<double>(i) / 16000.0));
    }
    EXPECT_NEAR(computeRms(sine.data(), sine.size()), 1.0f / std::sqrt(2.0f), 1e-3f);

    EXPECT_FLOAT_EQ(computeRms(nullptr, 0), 0.0f);
    EXPECT_FLOAT_EQ(computeRms(constant.data(), 0), 0.0f);
}

TEST(AudioBackendTests, DefaultStreamFormat) {
    AudioStreamFormat fmt;
    EXPECT_EQ(fmt.channels, 1u);
    EXPECT_EQ(fmt.sampleRate, 16000u);
}
