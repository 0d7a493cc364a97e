#include "parley/voice_chat/service/AudioCache.h"

namespace parley::voice_chat::service {

MemoryAudioCache::MemoryAudioCache(const ConfigManager& configManager) {
    if (auto v = configManager.get("cache.max_entries"); v.has_value()) {
        if (v->is_number_unsigned()) {
            m_maxEntries = v->get<size_t>();
        } else if (v->is_number_integer()) {
            const auto val = v->get<int64_t>();
            m_maxEntries = val > 0 ? static_cast<size_t>(val) : 0;
        }
    }
}

MemoryAudioCache::MemoryAudioCache(size_t maxEntries)
    : m_maxEntries(maxEntries)
{}

std::string MemoryAudioCache::makeKey(const std::string& voice, const std::string& text) {
    return voice + "\n" + text;
}

std::optional<std::vector<std::uint8_t>> MemoryAudioCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        m_statistics.totalMisses++;
        return std::nullopt;
    }
    m_lru.splice(m_lru.begin(), m_lru, it->second.lruPos);
    m_statistics.totalHits++;
    return it->second.bytes;
}

void MemoryAudioCache::put(const std::string& key, std::vector<std::uint8_t> bytes) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_maxEntries == 0) return;

    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
        m_statistics.totalSize -= it->second.bytes.size();
        m_statistics.totalSize += bytes.size();
        it->second.bytes = std::move(bytes);
        m_lru.splice(m_lru.begin(), m_lru, it->second.lruPos);
        return;
    }

    m_lru.push_front(key);
    m_statistics.totalSize += bytes.size();
    m_entries.emplace(key, Entry{std::move(bytes), m_lru.begin()});
    evictIfNeeded();
    m_statistics.totalEntries = m_entries.size();
}

void MemoryAudioCache::evictIfNeeded() {
    while (m_entries.size() > m_maxEntries && !m_lru.empty()) {
        const auto& victim = m_lru.back();
        auto it = m_entries.find(victim);
        if (it != m_entries.end()) {
            m_statistics.totalSize -= it->second.bytes.size();
            m_entries.erase(it);
        }
        m_lru.pop_back();
        m_statistics.evictedEntries++;
    }
}

void MemoryAudioCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_lru.clear();
    m_statistics.totalEntries = 0;
    m_statistics.totalSize = 0;
}

MemoryAudioCache::CacheStatistics MemoryAudioCache::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stats = m_statistics;
    stats.totalEntries = m_entries.size();
    return stats;
}

} // namespace parley::voice_chat::service
