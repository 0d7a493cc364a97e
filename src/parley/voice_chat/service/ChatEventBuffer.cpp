#include "parley/voice_chat/service/ChatEventBuffer.h"

#include "parley/voice_chat/service/CoordinationState.h"

namespace parley::voice_chat::service {

void ChatEventBuffer::open(RequestId id) {
    auto lk = lockSharedState(m_queuesMutex, "chat event queues");
    m_queues[id].finished = false;
}

void ChatEventBuffer::append(RequestId id, std::string event) {
    auto lk = lockSharedState(m_queuesMutex, "chat event queues");
    m_queues[id].events.push_back(std::move(event));
}

std::vector<std::string> ChatEventBuffer::drain(RequestId id) {
    std::vector<std::string> out;
    auto lk = lockSharedState(m_queuesMutex, "chat event queues");
    auto it = m_queues.find(id);
    if (it == m_queues.end()) return out;
    out.swap(it->second.events);
    if (it->second.finished) {
        // 已结束的流不会再追加，取走剩余事件后即可淘汰
        auto cancelLk = lockSharedState(m_cancelMutex, "chat cancellation set");
        m_cancelled.erase(id);
        m_queues.erase(it);
    }
    return out;
}

bool ChatEventBuffer::cancel(RequestId id) {
    auto lk = lockSharedState(m_queuesMutex, "chat event queues");
    // 未登记或已淘汰的 id 没有可停止的流
    if (m_queues.find(id) == m_queues.end()) return false;
    auto cancelLk = lockSharedState(m_cancelMutex, "chat cancellation set");
    m_cancelled.insert(id);
    return true;
}

std::size_t ChatEventBuffer::cancelAll() {
    auto lk = lockSharedState(m_queuesMutex, "chat event queues");
    auto cancelLk = lockSharedState(m_cancelMutex, "chat cancellation set");
    for (const auto& kv : m_queues) {
        m_cancelled.insert(kv.first);
    }
    return m_queues.size();
}

bool ChatEventBuffer::isCancelled(RequestId id) const {
    auto lk = lockSharedState(m_cancelMutex, "chat cancellation set");
    return m_cancelled.count(id) > 0;
}

void ChatEventBuffer::finish(RequestId id) {
    auto lk = lockSharedState(m_queuesMutex, "chat event queues");
    auto it = m_queues.find(id);
    if (it != m_queues.end()) {
        it->second.finished = true;
    }
}

std::size_t ChatEventBuffer::trackedCount() const {
    auto lk = lockSharedState(m_queuesMutex, "chat event queues");
    return m_queues.size();
}

} // namespace parley::voice_chat::service
