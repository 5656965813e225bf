#include "MemoryCacheManager.hpp"
#include <mutex>

MemoryCacheManager::MemoryCacheManager(size_t max_size) : max_size(max_size), current_size(0) {}

size_t MemoryCacheManager::entrySize(const std::string & key, const Response & response) {
    size_t size = key.size() + response.getBody().size() + response.getUrl().size();
    for (const auto & header : response.getHeaders()) {
        size += header.first.size() + header.second.size();
    }
    return size;
}

std::optional<CachedEntry> MemoryCacheManager::get(const std::string & key) {
    std::shared_lock<std::shared_mutex> lock(cache_mutex);

    auto it = cache_map.find(key);
    if (it == cache_map.end()) {
        return std::nullopt;
    }
    // hand out a copy, a later put never changes what the caller holds
    return CachedEntry(it->second.response, it->second.policy);
}

void MemoryCacheManager::put(const std::string & key, const Response & response, const CachePolicy & policy) {
    size_t entry_size = entrySize(key, response);

    // if the entry is too large, do not cache
    if (max_size > 0 && entry_size > max_size) {
        throw StorageError("Response too large to cache: " + key + " (" +
                           std::to_string(entry_size) + " bytes)");
    }

    std::unique_lock<std::shared_mutex> lock(cache_mutex);

    // if the entry already exists, remove the old entry
    auto it = cache_map.find(key);
    if (it != cache_map.end()) {
        eraseEntry(it);
    }

    // ensure there is enough space
    while (max_size > 0 && current_size + entry_size > max_size && !expiry_map.empty()) {
        evictOldestEntry();
    }

    auto expiry = expiry_map.emplace(policy.expiresAt(), key);
    cache_map.emplace(key, Slot{response, policy, entry_size, expiry});
    current_size += entry_size;

    logger.debug("Added to cache: " + key + " (" + std::to_string(entry_size) + " bytes)");
    logger.debug("now cache has " + std::to_string(cache_map.size()) + " entries");
}

void MemoryCacheManager::remove(const std::string & key) {
    std::unique_lock<std::shared_mutex> lock(cache_mutex);

    auto it = cache_map.find(key);
    if (it != cache_map.end()) {
        eraseEntry(it);
        logger.debug("Removed from cache: " + key);
    }
}

void MemoryCacheManager::clear() {
    std::unique_lock<std::shared_mutex> lock(cache_mutex);
    cache_map.clear();
    expiry_map.clear();
    current_size = 0;
    logger.debug("cache cleared");
}

size_t MemoryCacheManager::getCurrentSize() const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex);
    return current_size;
}

size_t MemoryCacheManager::getEntryCount() const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex);
    return cache_map.size();
}

void MemoryCacheManager::eraseEntry(std::unordered_map<std::string, Slot>::iterator it) {
    current_size -= it->second.size;
    expiry_map.erase(it->second.expiry);
    cache_map.erase(it);
}

void MemoryCacheManager::evictOldestEntry() {
    if (expiry_map.empty()) {
        return;
    }
    // the entry that expires first is the least useful one
    std::string oldest_key = expiry_map.begin()->second;
    auto it = cache_map.find(oldest_key);
    if (it != cache_map.end()) {
        logger.info("NOTE evicted " + oldest_key + " from cache");
        eraseEntry(it);
    } else {
        expiry_map.erase(expiry_map.begin());
    }
}
