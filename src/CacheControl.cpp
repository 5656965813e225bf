#include "CacheControl.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace {

// RFC 9111 section 1.2.2: larger values are treated as 2^31
const int64_t DELTA_SECONDS_MAX = 2147483648LL;

std::string trim(const std::string & s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

// split on commas that are not inside a quoted-string
std::vector<std::string> splitDirectives(const std::string & header) {
    std::vector<std::string> parts;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < header.size(); i++) {
        char c = header[i];
        if (c == '"') {
            quoted = !quoted;
        } else if (c == '\\' && quoted && i + 1 < header.size()) {
            current += c;
            c = header[++i];
        } else if (c == ',' && !quoted) {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    parts.push_back(current);
    return parts;
}

}

bool CacheControl::isDeltaSeconds(const std::string & name) {
    return name == "max-age" || name == "s-maxage" || name == "min-fresh" ||
           name == "stale-while-revalidate" || name == "stale-if-error";
}

CacheControl::Directives CacheControl::parse(const std::string & header) {
    Directives directives;
    for (const std::string & part : splitDirectives(header)) {
        std::string directive = trim(part);
        if (directive.empty()) {
            continue;
        }

        std::string name;
        std::string value;
        size_t eq = directive.find('=');
        if (eq == std::string::npos) {
            name = toLower(directive);
        } else {
            name = toLower(trim(directive.substr(0, eq)));
            value = trim(directive.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
        }
        if (name.empty()) {
            throw PolicyError("empty cache-control directive in \"" + header + "\"");
        }

        if (isDeltaSeconds(name)) {
            if (value.empty() ||
                !std::all_of(value.begin(), value.end(),
                             [](unsigned char c) { return std::isdigit(c); })) {
                throw PolicyError("invalid " + name + " value \"" + value + "\"");
            }
            // strip leading zeroes so that duplicates compare by number
            size_t first = value.find_first_not_of('0');
            value = first == std::string::npos ? "0" : value.substr(first);
        }

        auto it = directives.find(name);
        if (it != directives.end() && isDeltaSeconds(name) && it->second != value) {
            throw PolicyError("conflicting " + name + " directives in \"" + header + "\"");
        }
        directives[name] = value;
    }
    return directives;
}

std::string CacheControl::format(const Directives & directives) {
    std::string result;
    for (const auto & directive : directives) {
        if (!result.empty()) {
            result += ", ";
        }
        result += directive.first;
        if (!directive.second.empty()) {
            result += "=" + directive.second;
        }
    }
    return result;
}

int64_t CacheControl::seconds(const Directives & directives, const std::string & name, int64_t fallback) {
    auto it = directives.find(name);
    if (it == directives.end() || it->second.empty()) {
        return fallback;
    }
    if (it->second.size() > 10) {
        return DELTA_SECONDS_MAX;
    }
    return std::min<int64_t>(std::stoll(it->second), DELTA_SECONDS_MAX);
}
