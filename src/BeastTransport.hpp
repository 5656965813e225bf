#ifndef BEASTTRANSPORT_HPP
#define BEASTTRANSPORT_HPP

#include <chrono>
#include <cstdint>

#include "Logger.hpp"
#include "Transport.hpp"

// Plain HTTP/1.1 over a fresh TCP connection per request. Every step after
// name resolution shares one deadline; running out of time is a NetworkError.
class BeastTransport : public Transport {
public:
    explicit BeastTransport(std::chrono::seconds timeout = std::chrono::seconds(10),
                            uint64_t bodyLimit = 64 * 1024 * 1024);

    Response fetch(const Request & request) override;

private:
    std::chrono::seconds timeout;
    uint64_t bodyLimit;
    static inline Logger & logger = Logger::getInstance();
};

#endif
