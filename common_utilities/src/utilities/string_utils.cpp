#include "common_utils/utilities/string_utils.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace rastercube::common_utils {

std::string StringUtils::trimLeft(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    return std::string(start, s.end());
}

std::string StringUtils::trimRight(const std::string& s) {
    auto end = s.end();
    while (end != s.begin() && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(s.begin(), end);
}

std::string StringUtils::trim(const std::string& s) {
    return trimLeft(trimRight(s));
}

std::string StringUtils::toLower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::toUpper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::vector<std::string> StringUtils::split(const std::string& s,
                                            const std::string& delimiter,
                                            bool trimTokens) {
    std::vector<std::string> tokens;
    if (s.empty()) {
        return tokens;
    }

    auto pushToken = [&](std::string token) {
        if (trimTokens) {
            token = trim(token);
        }
        if (!token.empty()) {
            tokens.push_back(std::move(token));
        }
    };

    if (delimiter.empty()) {
        pushToken(s);
        return tokens;
    }

    size_t pos = 0;
    size_t lastPos = 0;
    while ((pos = s.find(delimiter, lastPos)) != std::string::npos) {
        pushToken(s.substr(lastPos, pos - lastPos));
        lastPos = pos + delimiter.length();
    }
    if (lastPos < s.length()) {
        pushToken(s.substr(lastPos));
    }

    return tokens;
}

std::string StringUtils::join(const std::vector<std::string>& v,
                              const std::string& delimiter) {
    if (v.empty()) {
        return "";
    }

    std::ostringstream result;
    for (size_t i = 0; i + 1 < v.size(); ++i) {
        result << v[i] << delimiter;
    }
    result << v.back();
    return result.str();
}

bool StringUtils::startsWith(const std::string& s,
                             const std::string& prefix,
                             bool caseSensitive) {
    if (s.size() < prefix.size()) {
        return false;
    }
    if (caseSensitive) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }
    return toLower(s.substr(0, prefix.size())) == toLower(prefix);
}

bool StringUtils::endsWith(const std::string& s,
                           const std::string& suffix,
                           bool caseSensitive) {
    if (s.size() < suffix.size()) {
        return false;
    }
    if (caseSensitive) {
        return s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
    return toLower(s.substr(s.size() - suffix.size())) == toLower(suffix);
}

} // namespace rastercube::common_utils
