#include "clikit/semver.hpp"

#include <cctype>
#include <string>

namespace clikit {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

} // namespace

std::optional<Version> parse_version(const std::string& str) {
    std::string s = trim(str);
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) {
        s = s.substr(1);
    }
    if (s.empty()) return std::nullopt;

    try {
        return semver::version::parse(s);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

} // namespace clikit
