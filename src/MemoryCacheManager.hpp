#ifndef MEMORYCACHEMANAGER_HPP
#define MEMORYCACHEMANAGER_HPP

#include <ctime>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "CacheManager.hpp"
#include "Logger.hpp"

// In-process cache manager. Entries live until removed, or until room is needed
// under a byte capacity, in which case the entry that expires first goes.
class MemoryCacheManager : public CacheManager {
private:
    typedef std::multimap<time_t, std::string> ExpiryMap;

    struct Slot {
        Response response;
        CachePolicy policy;
        size_t size;
        ExpiryMap::iterator expiry;
    };

    std::unordered_map<std::string, Slot> cache_map;
    ExpiryMap expiry_map;
    mutable std::shared_mutex cache_mutex;
    size_t max_size;
    size_t current_size;
    static inline Logger & logger = Logger::getInstance();

    // callers hold cache_mutex exclusively
    void evictOldestEntry();
    void eraseEntry(std::unordered_map<std::string, Slot>::iterator it);

    static size_t entrySize(const std::string & key, const Response & response);

public:
    // max_size in bytes, 0 for no limit
    explicit MemoryCacheManager(size_t max_size = 0);

    std::optional<CachedEntry> get(const std::string & key) override;
    void put(const std::string & key, const Response & response, const CachePolicy & policy) override;
    void remove(const std::string & key) override;
    void clear() override;

    size_t getCurrentSize() const;
    size_t getEntryCount() const;
};

#endif
