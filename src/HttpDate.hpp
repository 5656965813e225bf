#ifndef HTTPDATE_HPP
#define HTTPDATE_HPP

#include <ctime>
#include <optional>
#include <string>

// IMF-fixdate handling for Date, Expires, Last-Modified and If-Modified-Since.
namespace HttpDate {

    // accepts IMF-fixdate, RFC 850 and asctime forms, always as GMT
    std::optional<time_t> parse(const std::string & value);

    // "Sun, 06 Nov 1994 08:49:37 GMT"
    std::string format(time_t time);

}

#endif
