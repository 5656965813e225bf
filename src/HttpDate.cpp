#include "HttpDate.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <time.h>

namespace HttpDate {

std::optional<time_t> parse(const std::string & value) {
    static const char * const formats[] = {
        "%a, %d %b %Y %H:%M:%S GMT",    // IMF-fixdate
        "%A, %d-%b-%y %H:%M:%S GMT",    // RFC 850
        "%a %b %d %H:%M:%S %Y"          // asctime
    };

    size_t begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    std::string trimmed = value.substr(begin);

    for (const char * format : formats) {
        struct tm tm = {};
        const char * end = strptime(trimmed.c_str(), format, &tm);
        if (end == nullptr) {
            continue;
        }
        while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end))) {
            end++;
        }
        if (*end != '\0') {
            continue;
        }
        return timegm(&tm);
    }
    return std::nullopt;
}

std::string format(time_t time) {
    std::tm tm;
    std::ostringstream oss;
    gmtime_r(&time, &tm);
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

}
