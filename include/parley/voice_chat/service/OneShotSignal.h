#pragma once

#include <chrono>
#include <future>
#include <utility>

namespace parley::voice_chat::service {

/**
 * @brief 单生产者/单消费者的一次性信号（发送端）
 *
 * 只能移动；析构时若尚未通知则自动通知，保证接收端最终一定收到。
 */
class OneShotSender {
public:
    OneShotSender() = default;
    explicit OneShotSender(std::promise<void> promise);
    ~OneShotSender();

    OneShotSender(OneShotSender&& other) noexcept;
    OneShotSender& operator=(OneShotSender&& other) noexcept;
    OneShotSender(const OneShotSender&) = delete;
    OneShotSender& operator=(const OneShotSender&) = delete;

    // 第一次调用返回 true，之后返回 false
    bool notify();
    bool notified() const { return m_notified; }

private:
    std::promise<void> m_promise;
    bool m_notified{true}; // 默认构造的发送端视为已通知
};

/**
 * @brief 一次性信号（接收端）
 */
class OneShotReceiver {
public:
    OneShotReceiver() = default;
    explicit OneShotReceiver(std::future<void> future);

    // 非阻塞查询
    bool received() const;

    // 最多等待 timeout；收到信号返回 true
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    std::future<void> m_future;
};

std::pair<OneShotSender, OneShotReceiver> makeOneShot();

} // namespace parley::voice_chat::service
