#include "parley/voice_chat/service/RecordingSignals.h"

#include <cstring>

namespace parley::voice_chat::service {

void CancellationMarker::mark(std::uint64_t generation) {
    auto cur = m_marked.load(std::memory_order_seq_cst);
    while (cur < generation &&
           !m_marked.compare_exchange_weak(cur, generation, std::memory_order_seq_cst)) {
    }
}

bool CancellationMarker::isCancelled(const OperationToken& token) const {
    if (!token.isGated()) return false;
    return token.generation() <= m_marked.load(std::memory_order_seq_cst);
}

std::optional<std::uint64_t> CancellationMarker::lastCancelled() const {
    const auto v = m_marked.load(std::memory_order_seq_cst);
    if (v == 0) return std::nullopt;
    return v;
}

std::uint64_t TelemetryCell::pack(std::uint32_t owner, float value) {
    std::uint32_t bits = 0;
    static_assert(sizeof(bits) == sizeof(value), "float must be 32-bit");
    std::memcpy(&bits, &value, sizeof(bits));
    return (static_cast<std::uint64_t>(owner) << 32) | bits;
}

std::uint32_t TelemetryCell::ownerOf(std::uint64_t packed) {
    return static_cast<std::uint32_t>(packed >> 32);
}

float TelemetryCell::valueOf(std::uint64_t packed) {
    const auto bits = static_cast<std::uint32_t>(packed & 0xFFFFFFFFull);
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

bool TelemetryCell::isNewer(std::uint32_t candidate, std::uint32_t owner) {
    // 序号算术：回绕后仍能比较相距不足 2^31 的两个代际
    return static_cast<std::int32_t>(candidate - owner) > 0;
}

bool TelemetryCell::claim(const OperationToken& token) {
    const auto owner = static_cast<std::uint32_t>(token.generation());
    auto cur = m_state.load(std::memory_order_seq_cst);
    while (isNewer(owner, ownerOf(cur))) {
        if (m_state.compare_exchange_weak(cur, pack(owner, 0.0f), std::memory_order_seq_cst)) {
            return true;
        }
    }
    return false;
}

bool TelemetryCell::publish(const OperationToken& token, float value) {
    const auto owner = static_cast<std::uint32_t>(token.generation());
    auto cur = m_state.load(std::memory_order_seq_cst);
    while (ownerOf(cur) == owner) {
        if (m_state.compare_exchange_weak(cur, pack(owner, value), std::memory_order_seq_cst)) {
            return true;
        }
    }
    return false;
}

float TelemetryCell::read() const {
    return valueOf(m_state.load(std::memory_order_seq_cst));
}

} // namespace parley::voice_chat::service
