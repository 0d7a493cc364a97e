#include "parley/voice_chat/service/SseFrameSplitter.h"

#include "parley/voice_chat/service/utils/TextDecoding.h"

namespace parley::voice_chat::service {

std::size_t SseFrameSplitter::feed(std::string_view bytes, const FrameHandler& onFrame) {
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        const char c = bytes[i];
        const bool newline = c == '\n';
        if (newline && m_prevNewline) {
            m_prevNewline = false;
            std::string frame;
            frame.swap(m_buf);
            if (!onFrame(frame)) {
                return i + 1;
            }
        } else {
            m_buf.push_back(c);
            m_prevNewline = newline;
        }
    }
    return bytes.size();
}

std::optional<std::string> SseFrameSplitter::finish() {
    m_prevNewline = false;
    if (m_buf.empty()) return std::nullopt;
    std::string residual;
    residual.swap(m_buf);
    return residual;
}

FrameEvent interpretFrame(std::string_view frame) {
    FrameEvent ev;
    if (frame.substr(0, kSseDoneSentinel.size()) == kSseDoneSentinel) {
        ev.kind = FrameEvent::Kind::Done;
        return ev;
    }
    if (frame.substr(0, kSseDataPrefix.size()) != kSseDataPrefix) {
        return ev;
    }

    auto payload = frame.substr(kSseDataPrefix.size());
    if (!payload.empty() && payload.back() == '\n') payload.remove_suffix(1);
    if (!payload.empty() && payload.back() == '\r') payload.remove_suffix(1);

    ev.kind = FrameEvent::Kind::Data;
    ev.text = utils::decodeUtf8Lossy(payload);
    return ev;
}

} // namespace parley::voice_chat::service
