#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace parley::voice_chat::service {

/**
 * @brief 增量 SSE 分帧器
 *
 * 不依赖块边界：连续两个 '\n'（空行）即为帧边界。
 * 边界处第一个 '\n' 留在帧内，第二个丢弃；单个 '\n' 作为普通内容保留。
 */
class SseFrameSplitter {
public:
    // 返回 false 表示停止消费后续字节
    using FrameHandler = std::function<bool(std::string_view frame)>;

    /**
     * @brief 喂入一段字节
     * @return 实际消费的字节数；handler 返回 false 时小于 bytes.size()
     */
    std::size_t feed(std::string_view bytes, const FrameHandler& onFrame);

    /**
     * @brief 流结束：返回残留的非空缓冲（没有结尾空行的最后一帧）
     */
    std::optional<std::string> finish();

    bool hasPartialFrame() const { return !m_buf.empty(); }

private:
    std::string m_buf;
    bool m_prevNewline{false};
};

/**
 * @brief 帧解释结果
 */
struct FrameEvent {
    enum class Kind {
        Data,    // "data: " 前缀，text 为去掉前缀后的有损 UTF-8 文本
        Done,    // 终止哨兵 "data: [DONE]"
        Ignored  // 注释、keep-alive 等其他形状
    };
    Kind kind{Kind::Ignored};
    std::string text;
};

inline constexpr std::string_view kSseDataPrefix = "data: ";
inline constexpr std::string_view kSseDoneSentinel = "data: [DONE]";

/**
 * @brief 解释一帧
 *
 * 以终止哨兵开头的帧为 Done；行终止符（帧末尾的 '\n' / "\r\n"）不属于负载。
 */
FrameEvent interpretFrame(std::string_view frame);

} // namespace parley::voice_chat::service
