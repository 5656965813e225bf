#include "Journal.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>
#include <boost/archive/text_iarchive.hpp>
#include <boost/archive/text_oarchive.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/string.hpp>

namespace boost {
namespace serialization {

template<class Archive>
void serialize(Archive & ar, StoredEntry & entry, const unsigned int) {
    ar & entry.key;
    ar & entry.response;
    ar & entry.policy;
}

}
}

Journal::Journal(const std::string & path, bool syncWrites) : path(path), syncWrites(syncWrites), fd(-1) {
    open();
}

Journal::~Journal() {
    if (fd >= 0) {
        close(fd);
    }
}

void Journal::open() {
    fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw StorageError("Failed to open journal " + path + ": " + std::string(strerror(errno)));
    }
}

std::string Journal::encode(const StoredEntry & entry) {
    std::ostringstream oss;
    {
        boost::archive::text_oarchive archive(oss);
        archive << entry;
    }
    return oss.str();
}

StoredEntry Journal::decode(const std::string & payload) {
    StoredEntry entry;
    try {
        std::istringstream iss(payload);
        boost::archive::text_iarchive archive(iss);
        archive >> entry;
    } catch (const std::exception & e) {
        throw SerializationError(std::string("cannot decode cache record: ") + e.what());
    }
    return entry;
}

std::string Journal::record(char op, const std::string & key, const std::string & payload) {
    std::string data;
    data += op;
    data += " " + std::to_string(key.size()) + " " + std::to_string(payload.size()) + "\n";
    data += key;
    data += payload;
    data += "\n";
    return data;
}

void Journal::writeAll(int fd, const std::string & data, const std::string & path) {
    size_t total_written = 0;
    while (total_written < data.size()) {
        ssize_t written = write(fd, data.data() + total_written, data.size() - total_written);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw StorageError("Failed to write journal " + path + ": " + std::string(strerror(errno)));
        }
        total_written += written;
    }
}

void Journal::append(char op, const std::string & key, const std::string & payload) {
    off_t start = lseek(fd, 0, SEEK_END);
    if (start < 0) {
        throw StorageError("Failed to seek journal " + path + ": " + std::string(strerror(errno)));
    }
    try {
        writeAll(fd, record(op, key, payload), path);
        if (syncWrites && fsync(fd) < 0) {
            throw StorageError("Failed to sync journal " + path + ": " + std::string(strerror(errno)));
        }
    } catch (const StorageError &) {
        // cut off the partial record so later appends stay readable
        if (ftruncate(fd, start) < 0) {
            logger.error("Failed to truncate journal " + path + ": " + std::string(strerror(errno)));
        }
        throw;
    }
}

void Journal::appendPut(const StoredEntry & entry) {
    append('P', entry.key, encode(entry));
}

void Journal::appendRemove(const std::string & key) {
    append('R', key, "");
}

void Journal::appendClear() {
    append('C', "", "");
}

size_t Journal::replay(const Replay & handler) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in.is_open()) {
        return 0;
    }
    std::streamoff file_size = in.tellg();
    in.seekg(0);

    size_t count = 0;
    // end of the last well-framed record
    std::streamoff valid_end = 0;
    std::string header;
    while (std::getline(in, header)) {
        std::istringstream hs(header);
        char op = 0;
        size_t key_size = 0;
        size_t payload_size = 0;
        if (!(hs >> op >> key_size >> payload_size) || (op != 'P' && op != 'R' && op != 'C')) {
            logger.warning("journal " + path + ": unreadable record header after " +
                           std::to_string(count) + " records, ignoring the rest");
            break;
        }

        std::streamoff remaining = file_size - static_cast<std::streamoff>(in.tellg());
        if (static_cast<std::streamoff>(key_size + payload_size + 1) > remaining) {
            logger.warning("journal " + path + ": truncated record after " +
                           std::to_string(count) + " records");
            break;
        }

        std::string key(key_size, '\0');
        std::string payload(payload_size, '\0');
        in.read(&key[0], key_size);
        in.read(&payload[0], payload_size);
        if (!in || in.get() != '\n') {
            logger.warning("journal " + path + ": malformed record after " +
                           std::to_string(count) + " records");
            break;
        }
        count++;
        valid_end = in.tellg();

        switch (op) {
            case 'P': {
                try {
                    StoredEntry entry = decode(payload);
                    if (entry.key != key) {
                        throw SerializationError("record key does not match its header");
                    }
                    handler.onPut(entry);
                } catch (const SerializationError & e) {
                    // the latest write for this key is lost, so is the key
                    logger.warning("journal " + path + ": dropping " + key + ": " + e.what());
                    handler.onRemove(key);
                }
                break;
            }
            case 'R':
                handler.onRemove(key);
                break;
            case 'C':
                handler.onClear();
                break;
        }
    }

    // drop an unreadable tail, or records appended after it could never be replayed
    if (valid_end < file_size) {
        logger.warning("journal " + path + ": discarding " + std::to_string(file_size - valid_end) +
                       " trailing bytes");
        if (ftruncate(fd, valid_end) < 0) {
            throw StorageError("Failed to truncate journal " + path + ": " + std::string(strerror(errno)));
        }
    }
    return count;
}

void Journal::rewrite(const std::vector<StoredEntry> & entries) {
    std::string tmp_path = path + ".tmp";
    int tmp_fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (tmp_fd < 0) {
        throw StorageError("Failed to open " + tmp_path + ": " + std::string(strerror(errno)));
    }
    try {
        for (const StoredEntry & entry : entries) {
            writeAll(tmp_fd, record('P', entry.key, encode(entry)), tmp_path);
        }
        if (fsync(tmp_fd) < 0) {
            throw StorageError("Failed to sync " + tmp_path + ": " + std::string(strerror(errno)));
        }
    } catch (const StorageError &) {
        close(tmp_fd);
        unlink(tmp_path.c_str());
        throw;
    }
    close(tmp_fd);

    if (rename(tmp_path.c_str(), path.c_str()) < 0) {
        int err = errno;
        unlink(tmp_path.c_str());
        throw StorageError("Failed to replace journal " + path + ": " + std::string(strerror(err)));
    }
    close(fd);
    fd = -1;
    open();
    logger.debug("journal " + path + " compacted to " + std::to_string(entries.size()) + " records");
}
