#include "parley/voice_chat/service/GenerationRegistry.h"

namespace parley::voice_chat::service {

const char* resourceClassToString(ResourceClass c) {
    switch (c) {
        case ResourceClass::Playback: return "playback";
        case ResourceClass::Recording: return "recording";
        default: return "unknown";
    }
}

std::atomic<std::uint64_t>& GenerationRegistry::counter(ResourceClass c) {
    return m_counters[c == ResourceClass::Playback ? 0 : 1];
}

const std::atomic<std::uint64_t>& GenerationRegistry::counter(ResourceClass c) const {
    return m_counters[c == ResourceClass::Playback ? 0 : 1];
}

OperationToken GenerationRegistry::begin(ResourceClass c) {
    return OperationToken::forGeneration(counter(c).fetch_add(1, std::memory_order_seq_cst) + 1);
}

bool GenerationRegistry::isCurrent(ResourceClass c, const OperationToken& token) const {
    if (!token.isGated()) return true;
    return counter(c).load(std::memory_order_seq_cst) == token.generation();
}

std::uint64_t GenerationRegistry::forceStop(ResourceClass c) {
    return counter(c).fetch_add(1, std::memory_order_seq_cst);
}

std::uint64_t GenerationRegistry::current(ResourceClass c) const {
    return counter(c).load(std::memory_order_seq_cst);
}

} // namespace parley::voice_chat::service
