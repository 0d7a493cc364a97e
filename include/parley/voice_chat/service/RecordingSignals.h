#pragma once

#include "parley/voice_chat/service/GenerationRegistry.h"

#include <atomic>
#include <cstdint>
#include <optional>

namespace parley::voice_chat::service {

/**
 * @brief 录音取消标记：记录被显式取消的最高代际
 *
 * 0 表示"无"（有效代际从 1 开始）。标记只增不减。
 */
class CancellationMarker {
public:
    void mark(std::uint64_t generation);

    // token.generation() <= 已标记代际 时返回 true；不受门控的令牌恒为 false
    bool isCancelled(const OperationToken& token) const;

    std::optional<std::uint64_t> lastCancelled() const;

private:
    std::atomic<std::uint64_t> m_marked{0};
};

/**
 * @brief 输入响度遥测单元
 *
 * 取值：>= 0 为最近一帧的 RMS；kAwaitingResult 表示采集已结束、正在等待转写结果。
 * 归属代际与数值打包在同一个原子量中，只有当前归属的令牌能写入，
 * 过期的采集任务无法覆盖新会话的数值。
 */
class TelemetryCell {
public:
    static constexpr float kAwaitingResult = -1.0f;

    // 新会话接管：仅当 token 比当前归属更新时切换归属并把数值复位为 0；返回是否接管
    bool claim(const OperationToken& token);

    // 仅当 token 仍持有本单元时写入；返回是否写入
    bool publish(const OperationToken& token, float value);

    float read() const;

private:
    // 高 32 位为归属代际的低 32 位，低 32 位为 float 数值。
    // 相隔 2^32 个录音代际的两个会话会被视为同一归属，同时存活的会话不可能相隔这么远。
    static std::uint64_t pack(std::uint32_t owner, float value);
    static bool isNewer(std::uint32_t candidate, std::uint32_t owner);
    static std::uint32_t ownerOf(std::uint64_t packed);
    static float valueOf(std::uint64_t packed);

    std::atomic<std::uint64_t> m_state{0};
};

} // namespace parley::voice_chat::service
