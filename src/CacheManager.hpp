#ifndef CACHEMANAGER_HPP
#define CACHEMANAGER_HPP

#include <optional>
#include <stdexcept>
#include <string>

#include "CachePolicy.hpp"
#include "Response.hpp"

// Backend I/O failed.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string & message) : std::runtime_error(message) {}
};

// A stored record could not be decoded.
class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string & message) : std::runtime_error(message) {}
};

struct StoredEntry {
    std::string key;
    Response response;
    CachePolicy policy;
};

// Storage contract shared by every backend. Managers store whatever they are
// given; deciding whether an entry is still fresh is up to the caller.
class CacheManager {
public:
    virtual ~CacheManager() = default;

    // nothing when absent
    virtual std::optional<CachedEntry> get(const std::string & key) = 0;

    // replaces any entry under key; throws StorageError
    virtual void put(const std::string & key, const Response & response, const CachePolicy & policy) = 0;

    // removing an absent key succeeds; throws StorageError
    virtual void remove(const std::string & key) = 0;

    virtual void clear() = 0;
};

#endif
