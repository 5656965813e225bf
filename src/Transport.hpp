#ifndef TRANSPORT_HPP
#define TRANSPORT_HPP

#include <stdexcept>
#include <string>

#include "Request.hpp"
#include "Response.hpp"

// The origin could not be reached, or did not answer in time.
class NetworkError : public std::runtime_error {
public:
    explicit NetworkError(const std::string & message) : std::runtime_error(message) {}
};

// One hop of the client pipeline: sends a request and returns what came back.
class Transport {
public:
    virtual ~Transport() = default;

    // throws NetworkError
    virtual Response fetch(const Request & request) = 0;
};

#endif
