#include "IndexedCacheManager.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <limits>
#include <mutex>
#include <stdexcept>

namespace {

// keeps now +/- bound inside time_t for absurd bounds
const int64_t BOUND_LIMIT = std::numeric_limits<int64_t>::max() / 4;

time_t offset(time_t now, int64_t delta) {
    delta = std::max(-BOUND_LIMIT, std::min(BOUND_LIMIT, delta));
    return static_cast<time_t>(static_cast<int64_t>(now) + delta);
}

}

IndexedCacheManager::IndexedCacheManager(const IndexedStoreOptions & options, bool fullText)
    : fullText(fullText) {
    if (options.storageType != StorageType::DISC_COPIES) {
        return;
    }

    std::string file;
    try {
        std::filesystem::create_directories(options.path);
        file = (std::filesystem::path(options.path) / (options.name + ".journal")).string();
    } catch (const std::filesystem::filesystem_error & e) {
        throw StorageError("Failed to prepare " + options.path + ": " + e.what());
    }
    journal = std::make_unique<Journal>(file, options.syncWrites);

    Journal::Replay handler;
    handler.onPut = [this](const StoredEntry & entry) { insertLocked(entry); };
    handler.onRemove = [this](const std::string & key) { eraseLocked(key); };
    handler.onClear = [this]() { clearLocked(); };
    size_t records = journal->replay(handler);
    logger.info("loaded " + std::to_string(primary.size()) + " entries from " + file +
                " (" + std::to_string(records) + " records)");

    // mostly superseded records, start from a clean log
    if (records > 2 * primary.size() + 16) {
        compact();
    }
}

std::optional<CachedEntry> IndexedCacheManager::get(const std::string & key) {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = primary.find(key);
    if (it == primary.end()) {
        return std::nullopt;
    }
    return CachedEntry(it->second.entry.response, it->second.entry.policy);
}

std::optional<StoredEntry> IndexedCacheManager::lookup(const std::string & key) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = primary.find(key);
    if (it == primary.end()) {
        return std::nullopt;
    }
    return it->second.entry;
}

void IndexedCacheManager::put(const std::string & key, const Response & response, const CachePolicy & policy) {
    StoredEntry entry{key, response, policy};
    std::unique_lock<std::shared_mutex> lock(mutex);
    // journal first: a failed write leaves memory untouched
    if (journal) {
        journal->appendPut(entry);
    }
    insertLocked(entry);
    logger.debug("Added to cache: " + key);
}

void IndexedCacheManager::remove(const std::string & key) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    if (primary.find(key) == primary.end()) {
        return;
    }
    if (journal) {
        journal->appendRemove(key);
    }
    eraseLocked(key);
    logger.debug("Removed from cache: " + key);
}

void IndexedCacheManager::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex);
    if (journal) {
        journal->appendClear();
    }
    clearLocked();
    logger.debug("cache cleared");
}

void IndexedCacheManager::compact() {
    std::unique_lock<std::shared_mutex> lock(mutex);
    if (!journal) {
        return;
    }
    std::vector<StoredEntry> entries;
    entries.reserve(primary.size());
    for (const auto & record : primary) {
        entries.push_back(record.second.entry);
    }
    journal->rewrite(entries);
}

size_t IndexedCacheManager::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return primary.size();
}

void IndexedCacheManager::insertLocked(const StoredEntry & entry) {
    eraseLocked(entry.key);

    Record record;
    record.entry = entry;
    record.born = bornIndex.emplace(entry.policy.bornAt(), entry.key);
    record.expiry = expiryIndex.emplace(entry.policy.expiresAt(), entry.key);
    record.received = receivedIndex.emplace(entry.policy.getResponseTime(), entry.key);
    tags[entry.response.getUrl()].insert(entry.key);
    if (fullText) {
        record.words = tokenize(entry.response.getBody());
        for (const std::string & word : record.words) {
            wordIndex[word].insert(entry.key);
        }
    }
    primary.emplace(entry.key, std::move(record));
}

void IndexedCacheManager::eraseLocked(const std::string & key) {
    auto it = primary.find(key);
    if (it == primary.end()) {
        return;
    }
    const Record & record = it->second;
    bornIndex.erase(record.born);
    expiryIndex.erase(record.expiry);
    receivedIndex.erase(record.received);
    unindex(tags, record.entry.response.getUrl(), key);
    for (const std::string & word : record.words) {
        unindex(wordIndex, word, key);
    }
    primary.erase(it);
}

void IndexedCacheManager::clearLocked() {
    primary.clear();
    tags.clear();
    bornIndex.clear();
    expiryIndex.clear();
    receivedIndex.clear();
    wordIndex.clear();
}

void IndexedCacheManager::unindex(KeySetIndex & index, const std::string & term, const std::string & key) {
    auto it = index.find(term);
    if (it == index.end()) {
        return;
    }
    it->second.erase(key);
    if (it->second.empty()) {
        index.erase(it);
    }
}

std::vector<StoredEntry> IndexedCacheManager::entriesFor(const std::set<std::string> & keys) const {
    std::vector<StoredEntry> entries;
    entries.reserve(keys.size());
    for (const std::string & key : keys) {
        auto it = primary.find(key);
        if (it != primary.end()) {
            entries.push_back(it->second.entry);
        }
    }
    return entries;
}

std::vector<StoredEntry> IndexedCacheManager::lookupByTag(const std::string & url) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = tags.find(url);
    if (it == tags.end()) {
        return {};
    }
    return entriesFor(it->second);
}

std::vector<StoredEntry> IndexedCacheManager::range(const std::string & field,
                                                    int64_t low,
                                                    int64_t high,
                                                    time_t now) const {
    bool byAge = field == "age";
    if (!byAge && field != "time_to_live") {
        throw std::invalid_argument("unknown range field: " + field);
    }
    std::vector<StoredEntry> entries;
    if (low > high) {
        return entries;
    }

    std::shared_lock<std::shared_mutex> lock(mutex);

    // age = now - born and time_to_live = expiry - now, so both ranges map to
    // a window of instants; the value is recomputed before accepting a record
    const InstantIndex & index = byAge ? bornIndex : expiryIndex;
    time_t first = byAge ? offset(now, -high) : offset(now, low);
    time_t last = byAge ? offset(now, -low) : offset(now, high);

    auto accept = [&](const StoredEntry & entry) {
        int64_t value = byAge ? entry.policy.age(now) : entry.policy.timeToLive(now);
        if (value >= low && value <= high) {
            entries.push_back(entry);
        }
    };
    for (auto it = index.lower_bound(first); it != index.end() && it->first <= last; ++it) {
        const StoredEntry & entry = primary.at(it->second).entry;
        if (entry.policy.getResponseTime() <= now) {
            accept(entry);
        }
    }
    // received after now: the windows do not describe these
    for (auto it = receivedIndex.upper_bound(now); it != receivedIndex.end(); ++it) {
        accept(primary.at(it->second).entry);
    }
    return entries;
}

std::vector<StoredEntry> IndexedCacheManager::staleView(time_t now) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    std::vector<StoredEntry> entries;
    // an entry is stale once its expiry instant has passed
    for (auto it = expiryIndex.begin(); it != expiryIndex.end() && it->first <= now; ++it) {
        const StoredEntry & entry = primary.at(it->second).entry;
        if (entry.policy.getResponseTime() <= now && entry.policy.evaluate(now) != CachePolicy::FRESH) {
            entries.push_back(entry);
        }
    }
    for (auto it = receivedIndex.upper_bound(now); it != receivedIndex.end(); ++it) {
        const StoredEntry & entry = primary.at(it->second).entry;
        if (entry.policy.evaluate(now) != CachePolicy::FRESH) {
            entries.push_back(entry);
        }
    }
    return entries;
}

std::vector<StoredEntry> IndexedCacheManager::search(const std::string & text) const {
    std::set<std::string> words = tokenize(text);
    if (!fullText || words.empty()) {
        return {};
    }

    std::shared_lock<std::shared_mutex> lock(mutex);
    std::set<std::string> matches;
    bool firstWord = true;
    for (const std::string & word : words) {
        auto it = wordIndex.find(word);
        if (it == wordIndex.end()) {
            return {};
        }
        if (firstWord) {
            matches = it->second;
            firstWord = false;
        } else {
            std::set<std::string> both;
            std::set_intersection(matches.begin(), matches.end(),
                                  it->second.begin(), it->second.end(),
                                  std::inserter(both, both.begin()));
            matches.swap(both);
        }
    }
    return entriesFor(matches);
}

std::set<std::string> IndexedCacheManager::tokenize(const std::string & text) {
    std::set<std::string> words;
    std::string word;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            word += static_cast<char>(std::tolower(c));
        } else if (!word.empty()) {
            words.insert(word);
            word.clear();
        }
    }
    if (!word.empty()) {
        words.insert(word);
    }
    return words;
}
