#include "common_utils/time/time_parser.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/string_utils.h"

#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace rastercube::common_utils::time {

const std::vector<std::string>& TimeParser::defaultFallbackFormats() {
    static const std::vector<std::string> formats = {"%Y-%m-%d", "%Y"};
    return formats;
}

TimeParser::TimeParser() : fallbackFormats_(defaultFallbackFormats()) {}

TimeParser::TimeParser(std::vector<std::string> fallbackFormats)
    : fallbackFormats_(std::move(fallbackFormats)) {
    if (fallbackFormats_.empty()) {
        fallbackFormats_ = defaultFallbackFormats();
    }
}

std::optional<CalendarTime> TimeParser::tryParse(const std::string& raw, const std::string& format) {
    const std::string input = StringUtils::trim(raw);
    if (input.empty() || format.empty()) {
        return std::nullopt;
    }

    std::tm tm_value{};
    tm_value.tm_mday = 1;

    std::istringstream ss(input);
    ss.imbue(std::locale::classic());
    ss >> std::get_time(&tm_value, format.c_str());
    if (ss.fail()) {
        return std::nullopt;
    }
    // 格式必须覆盖全部输入
    if (ss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    try {
        return CalendarTime::fromCivil(tm_value.tm_year + 1900, tm_value.tm_mon + 1, tm_value.tm_mday,
                                       tm_value.tm_hour, tm_value.tm_min, tm_value.tm_sec);
    } catch (const ValidationException&) {
        return std::nullopt;
    }
}

CalendarTime TimeParser::parse(const std::optional<std::string>& raw,
                               const std::optional<std::string>& explicitFormat) const {
    if (!raw || StringUtils::trim(*raw).empty()) {
        return CalendarTime::notATime();
    }

    if (explicitFormat && !explicitFormat->empty()) {
        auto parsed = tryParse(*raw, *explicitFormat);
        if (!parsed) {
            throw TimeParseException("Time '" + *raw + "' does not match explicit format '" +
                                     *explicitFormat + "'");
        }
        return *parsed;
    }

    return parseWithFallback(raw);
}

CalendarTime TimeParser::parseWithFallback(const std::optional<std::string>& raw) const {
    if (!raw) {
        return CalendarTime::notATime();
    }
    for (const auto& format : fallbackFormats_) {
        auto parsed = tryParse(*raw, format);
        if (parsed) {
            return *parsed;
        }
    }
    return CalendarTime::notATime();
}

} // namespace rastercube::common_utils::time
