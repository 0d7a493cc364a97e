#pragma once

#include "parley/voice_chat/service/GenerationRegistry.h"

#include <chrono>
#include <functional>

namespace parley::voice_chat::service {

enum class GuardExit {
    Finished,   // keepGoing 返回 false，正常结束
    Superseded  // 令牌已过期，调用方应释放资源并正常返回
};

/**
 * @brief 长任务的轮询式权威检查
 *
 * 每个轮询间隔检查一次令牌是否仍有效；被抢占不是错误。
 * 轮询间隔内新旧两个任务可能同时存活（例如两段声音短暂重叠）。
 */
class SupersessionGuard {
public:
    static constexpr std::chrono::milliseconds kDefaultPollInterval{50};

    SupersessionGuard(const GenerationRegistry& registry,
                      ResourceClass resourceClass,
                      OperationToken token,
                      std::chrono::milliseconds pollInterval = kDefaultPollInterval);

    bool stillCurrent() const;

    /**
     * @brief 阻塞等待，直到 keepGoing 返回 false 或令牌过期
     *
     * 每轮先检查过期，再检查 keepGoing。
     */
    GuardExit waitWhile(const std::function<bool()>& keepGoing) const;

    const OperationToken& token() const { return m_token; }
    std::chrono::milliseconds pollInterval() const { return m_pollInterval; }

private:
    const GenerationRegistry& m_registry;
    ResourceClass m_class;
    OperationToken m_token;
    std::chrono::milliseconds m_pollInterval;
};

} // namespace parley::voice_chat::service
