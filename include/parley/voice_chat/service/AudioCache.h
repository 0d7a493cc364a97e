#pragma once

#include "parley/voice_chat/service/ConfigManager.h"

#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace parley::voice_chat::service {

/**
 * @brief key -> 编码音频字节的缓存协作方
 */
class AudioCache {
public:
    virtual ~AudioCache() = default;
    virtual std::optional<std::vector<std::uint8_t>> get(const std::string& key) = 0;
    virtual void put(const std::string& key, std::vector<std::uint8_t> bytes) = 0;
};

/**
 * @brief 内存 LRU 实现
 *
 * 容量读取 cache.max_entries；0 表示不缓存。
 */
class MemoryAudioCache : public AudioCache {
public:
    struct CacheStatistics {
        uint64_t totalHits{0};
        uint64_t totalMisses{0};
        size_t totalEntries{0};
        size_t totalSize{0};        // 字节
        uint64_t evictedEntries{0};

        double getHitRate() const {
            uint64_t total = totalHits + totalMisses;
            if (total == 0) return 0.0;
            return static_cast<double>(totalHits) / static_cast<double>(total);
        }
    };

    explicit MemoryAudioCache(const ConfigManager& configManager);
    explicit MemoryAudioCache(size_t maxEntries);

    MemoryAudioCache(const MemoryAudioCache&) = delete;
    MemoryAudioCache& operator=(const MemoryAudioCache&) = delete;

    std::optional<std::vector<std::uint8_t>> get(const std::string& key) override;
    void put(const std::string& key, std::vector<std::uint8_t> bytes) override;

    void clear();
    CacheStatistics getStatistics() const;
    size_t maxEntries() const { return m_maxEntries; }

    // 默认缓存键：voice + '\n' + text
    static std::string makeKey(const std::string& voice, const std::string& text);

private:
    using LruList = std::list<std::string>;
    struct Entry {
        std::vector<std::uint8_t> bytes;
        LruList::iterator lruPos;
    };

    void evictIfNeeded();

    size_t m_maxEntries{256};
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
    LruList m_lru; // front = 最近使用
    CacheStatistics m_statistics;
};

} // namespace parley::voice_chat::service
