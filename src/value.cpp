#include "argot/value.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

namespace {

static char lowerAscii(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

static bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (lowerAscii(a[i]) != lowerAscii(b[i])) return false;
    }
    return true;
}

// strto* skip leading whitespace on their own; the first character has to be part of the number.
static bool startsNumber(std::string_view s) {
    if (s.empty()) return false;
    const char c = s.front();
    return c == '+' || c == '-' || c == '.' || std::isalnum(static_cast<unsigned char>(c));
}

static bool looksHex(std::string_view s) {
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) s.remove_prefix(1);
    return s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

template <typename T, typename Fn>
static bool parseWith(std::string_view s, T& out, Fn fn) {
    const std::string tmp(s);
    char* end = nullptr;
    const T v = fn(tmp.c_str(), &end);
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = v;
    return true;
}

} // namespace

namespace argot {

bool parseBool(std::string_view s) {
    return !(s == "0" || equalsIgnoreCase(s, "false"));
}

bool parseSigned(std::string_view s, std::int64_t min, std::int64_t max, std::int64_t& out) {
    if (!startsNumber(s) || s.front() == '.') return false;
    const std::string tmp(s);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 10);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v < min || v > max) return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

bool parseUnsigned(std::string_view s, std::uint64_t max, std::uint64_t& out) {
    // strtoull would wrap "-1" around to the maximum.
    if (!startsNumber(s) || s.front() == '-' || s.front() == '.') return false;
    const std::string tmp(s);
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(tmp.c_str(), &end, 10);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v > max) return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

// Overflow saturates to infinity instead of failing.
bool parseFloat(std::string_view s, float& out) {
    if (!startsNumber(s) || looksHex(s)) return false;
    return parseWith<float>(s, out, [](const char* p, char** e) { return std::strtof(p, e); });
}

bool parseFloat(std::string_view s, double& out) {
    if (!startsNumber(s) || looksHex(s)) return false;
    return parseWith<double>(s, out, [](const char* p, char** e) { return std::strtod(p, e); });
}

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        const auto pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

} // namespace argot
