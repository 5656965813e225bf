#ifndef JOURNAL_HPP
#define JOURNAL_HPP

#include <functional>
#include <string>
#include <vector>

#include "CacheManager.hpp"
#include "Logger.hpp"

// Append-only log of cache mutations, replayed on startup.
//
// Each record is a header line "<op> <key length> <payload length>" followed
// by the key, the payload and a newline. Payloads are Boost.Serialization text
// archives of a StoredEntry. A record that cannot be decoded only loses its own
// key; a truncated tail ends the replay.
class Journal {
public:
    struct Replay {
        std::function<void(const StoredEntry &)> onPut;
        std::function<void(const std::string &)> onRemove;
        std::function<void()> onClear;
    };

    // throws StorageError when the file cannot be opened
    Journal(const std::string & path, bool syncWrites);
    ~Journal();

    Journal(const Journal &) = delete;
    Journal & operator=(const Journal &) = delete;

    // number of records read, corrupt ones included
    size_t replay(const Replay & handler);

    // all of these throw StorageError and leave no partial record behind
    void appendPut(const StoredEntry & entry);
    void appendRemove(const std::string & key);
    void appendClear();

    // replace the whole log with one put per live entry
    void rewrite(const std::vector<StoredEntry> & entries);

    static std::string encode(const StoredEntry & entry);
    // throws SerializationError
    static StoredEntry decode(const std::string & payload);

private:
    std::string path;
    bool syncWrites;
    int fd;
    static inline Logger & logger = Logger::getInstance();

    void open();
    void append(char op, const std::string & key, const std::string & payload);
    static std::string record(char op, const std::string & key, const std::string & payload);
    static void writeAll(int fd, const std::string & data, const std::string & path);
};

#endif
