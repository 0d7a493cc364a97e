#include "parley/voice_chat/service/OneShotSignal.h"

namespace parley::voice_chat::service {

OneShotSender::OneShotSender(std::promise<void> promise)
    : m_promise(std::move(promise))
    , m_notified(false)
{}

OneShotSender::~OneShotSender() {
    notify();
}

OneShotSender::OneShotSender(OneShotSender&& other) noexcept
    : m_promise(std::move(other.m_promise))
    , m_notified(other.m_notified)
{
    other.m_notified = true;
}

OneShotSender& OneShotSender::operator=(OneShotSender&& other) noexcept {
    if (this != &other) {
        notify();
        m_promise = std::move(other.m_promise);
        m_notified = other.m_notified;
        other.m_notified = true;
    }
    return *this;
}

bool OneShotSender::notify() {
    if (m_notified) return false;
    m_notified = true;
    m_promise.set_value();
    return true;
}

OneShotReceiver::OneShotReceiver(std::future<void> future)
    : m_future(std::move(future))
{}

bool OneShotReceiver::received() const {
    return waitFor(std::chrono::milliseconds(0));
}

bool OneShotReceiver::waitFor(std::chrono::milliseconds timeout) const {
    if (!m_future.valid()) return true;
    return m_future.wait_for(timeout) == std::future_status::ready;
}

std::pair<OneShotSender, OneShotReceiver> makeOneShot() {
    std::promise<void> promise;
    auto future = promise.get_future();
    return {OneShotSender(std::move(promise)), OneShotReceiver(std::move(future))};
}

} // namespace parley::voice_chat::service
