#ifndef CACHECONTROL_HPP
#define CACHECONTROL_HPP

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

// A freshness-relevant header could not be understood.
class PolicyError : public std::runtime_error {
public:
    explicit PolicyError(const std::string & message) : std::runtime_error(message) {}
};

class CacheControl {
public:
    // directive name (lower-cased) -> value, empty for valueless directives
    typedef std::map<std::string, std::string> Directives;

    // Throws PolicyError when a delta-seconds directive carries something other
    // than digits, or is repeated with conflicting values.
    static Directives parse(const std::string & header);

    static std::string format(const Directives & directives);

    // value of a delta-seconds directive, or fallback when absent
    static int64_t seconds(const Directives & directives, const std::string & name, int64_t fallback);

private:
    static bool isDeltaSeconds(const std::string & name);
};

#endif
