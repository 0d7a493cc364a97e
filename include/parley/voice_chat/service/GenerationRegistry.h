#pragma once

#include <array>
#include <atomic>
#include <cstdint>

namespace parley::voice_chat::service {

/**
 * @brief 受代际计数器管理的资源类别
 */
enum class ResourceClass {
    Playback,
    Recording
};

const char* resourceClassToString(ResourceClass c);

/**
 * @brief 操作令牌：启动时捕获的代际值，或"不受门控"
 *
 * 不受门控的令牌从不消耗代际，isCurrent 恒为 true（用于预取等不进入播放循环的路径）。
 */
class OperationToken {
public:
    static OperationToken ungated() { return OperationToken(); }
    static OperationToken forGeneration(std::uint64_t generation) { return OperationToken(generation); }

    bool isGated() const { return m_gated; }
    // 不受门控的令牌返回 0
    std::uint64_t generation() const { return m_generation; }

    bool operator==(const OperationToken& o) const { return m_gated == o.m_gated && m_generation == o.m_generation; }
    bool operator!=(const OperationToken& o) const { return !(*this == o); }

private:
    OperationToken() = default;
    explicit OperationToken(std::uint64_t generation) : m_gated(true), m_generation(generation) {}

    bool m_gated{false};
    std::uint64_t m_generation{0};
};

/**
 * @brief 按资源类别维护单调递增的代际计数器
 *
 * - begin：计数器加一并返回新值作为令牌
 * - forceStop：计数器加一但不发放令牌，使当前持有者失去权威
 * - 每类资源同一时刻至多一个令牌有效；令牌一旦过期不会恢复
 */
class GenerationRegistry {
public:
    GenerationRegistry() = default;

    GenerationRegistry(const GenerationRegistry&) = delete;
    GenerationRegistry& operator=(const GenerationRegistry&) = delete;

    OperationToken begin(ResourceClass c);

    bool isCurrent(ResourceClass c, const OperationToken& token) const;

    /**
     * @brief 推进代际，不发放新令牌
     * @return 被腾出的代际（推进前的值）
     */
    std::uint64_t forceStop(ResourceClass c);

    std::uint64_t current(ResourceClass c) const;

private:
    std::atomic<std::uint64_t>& counter(ResourceClass c);
    const std::atomic<std::uint64_t>& counter(ResourceClass c) const;

    std::array<std::atomic<std::uint64_t>, 2> m_counters{};
};

} // namespace parley::voice_chat::service
