#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace parley::voice_chat::service {

using RequestId = std::uint64_t;

/**
 * @brief 按请求 id 缓存流式事件，供轮询方原子取走
 *
 * - drain 原子地返回并清空当前队列：不丢失、不重复、跨 drain 保持顺序
 * - 取消集合只在帧边界被检查
 * - 流结束（finish）后，首次 drain 在返回剩余事件的同时淘汰该 id
 *
 * 队列与取消集合各有一把锁；需要同时持有时先锁队列、再锁取消集合。
 * 取消集合只记录仍在队列表中的 id，淘汰时一并移除。
 * 加锁失败抛出 VoiceChatError{SharedStateUnavailable}。
 */
class ChatEventBuffer {
public:
    ChatEventBuffer() = default;

    ChatEventBuffer(const ChatEventBuffer&) = delete;
    ChatEventBuffer& operator=(const ChatEventBuffer&) = delete;

    // 登记 id（不存在时创建空队列），并清除之前的结束标记
    void open(RequestId id);

    // 不存在时惰性创建
    void append(RequestId id, std::string event);

    std::vector<std::string> drain(RequestId id);

    // 仅对仍在跟踪的 id 生效；返回是否记录了取消
    bool cancel(RequestId id);

    // 取消当前已知的所有 id；返回数量
    std::size_t cancelAll();

    bool isCancelled(RequestId id) const;

    // 标记该 id 的流已结束（任意退出路径都会调用）
    void finish(RequestId id);

    std::size_t trackedCount() const;

private:
    struct Entry {
        std::vector<std::string> events;
        bool finished{false};
    };

    mutable std::mutex m_queuesMutex;
    std::map<RequestId, Entry> m_queues;

    mutable std::mutex m_cancelMutex;
    std::set<RequestId> m_cancelled;
};

} // namespace parley::voice_chat::service
