#ifndef INDEXEDCACHEMANAGER_HPP
#define INDEXEDCACHEMANAGER_HPP

#include <ctime>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "CacheManager.hpp"
#include "Journal.hpp"
#include "Logger.hpp"

enum class StorageType {
    // memory only, gone on restart
    RAM_COPIES,
    // memory plus an on-disk journal replayed on startup
    DISC_COPIES
};

struct IndexedStoreOptions {
    // directory holding the journal
    std::string path = ".";
    // journal file is <path>/<name>.journal
    std::string name = "http-cache";
    StorageType storageType = StorageType::RAM_COPIES;
    // fsync after every journal append
    bool syncWrites = false;
};

// Cache manager with secondary indices over the stored entries:
//  - tag index: response URL -> keys
//  - instant indices: birth and expiry instants, answering age and
//    time_to_live range queries and the stale view at query time
//  - response instants, for entries received after the query instant whose
//    age is frozen at their Age header and so escape the windows above
//  - optional full-text index over response bodies
//
// The primary map and every index change together under one exclusive lock,
// so no reader sees an index entry without its record or the reverse.
class IndexedCacheManager : public CacheManager {
public:
    // throws StorageError when a DISC_COPIES journal cannot be opened
    explicit IndexedCacheManager(const IndexedStoreOptions & options = IndexedStoreOptions(),
                                 bool fullText = false);

    std::optional<CachedEntry> get(const std::string & key) override;
    void put(const std::string & key, const Response & response, const CachePolicy & policy) override;
    void remove(const std::string & key) override;
    void clear() override;

    std::optional<StoredEntry> lookup(const std::string & key) const;

    // entries whose response URL is url
    std::vector<StoredEntry> lookupByTag(const std::string & url) const;

    // Entries whose "age" or "time_to_live" (seconds, at now) lies in
    // [low, high]. Throws std::invalid_argument for any other field.
    std::vector<StoredEntry> range(const std::string & field,
                                   int64_t low,
                                   int64_t high,
                                   time_t now = time(nullptr)) const;

    // entries that are not fresh at now
    std::vector<StoredEntry> staleView(time_t now = time(nullptr)) const;

    // entries whose body contains every word of text; empty without full text
    std::vector<StoredEntry> search(const std::string & text) const;

    // rewrite the journal with only the live entries
    void compact();

    size_t size() const;

private:
    typedef std::multimap<time_t, std::string> InstantIndex;
    typedef std::unordered_map<std::string, std::set<std::string>> KeySetIndex;

    struct Record {
        StoredEntry entry;
        InstantIndex::iterator born;
        InstantIndex::iterator expiry;
        InstantIndex::iterator received;
        std::set<std::string> words;
    };

    std::unordered_map<std::string, Record> primary;
    KeySetIndex tags;
    InstantIndex bornIndex;
    InstantIndex expiryIndex;
    InstantIndex receivedIndex;
    KeySetIndex wordIndex;
    mutable std::shared_mutex mutex;

    bool fullText;
    std::unique_ptr<Journal> journal;
    static inline Logger & logger = Logger::getInstance();

    // callers hold mutex exclusively
    void insertLocked(const StoredEntry & entry);
    void eraseLocked(const std::string & key);
    void clearLocked();

    std::vector<StoredEntry> entriesFor(const std::set<std::string> & keys) const;

    static std::set<std::string> tokenize(const std::string & text);
    static void unindex(KeySetIndex & index, const std::string & term, const std::string & key);
};

#endif
