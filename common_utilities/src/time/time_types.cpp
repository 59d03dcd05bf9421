#include "common_utils/time/time_types.h"
#include "common_utils/utilities/exceptions.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace rastercube::common_utils::time {

std::int64_t daysFromCivil(std::int64_t year, unsigned month, unsigned day) {
    // 以 3 月为年首的纪元 (400 年周期) 换算
    year -= month <= 2 ? 1 : 0;
    const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

CalendarTime CalendarTime::fromMicroseconds(std::int64_t microsSinceEpoch) {
    return CalendarTime(TimePoint(Duration(microsSinceEpoch)));
}

CalendarTime CalendarTime::fromCivil(int year, int month, int day,
                                     int hour, int minute, int second) {
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
        std::ostringstream oss;
        oss << "Invalid calendar time " << year << "-" << month << "-" << day
            << " " << hour << ":" << minute << ":" << second;
        throw ValidationException(oss.str());
    }

    const std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const std::int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second;
    return fromMicroseconds(seconds * 1000000);
}

std::string CalendarTime::toISOString() const {
    if (!isValid()) {
        return "NaT";
    }

    std::int64_t micros = toMicroseconds();
    std::int64_t seconds = micros / 1000000;
    std::int64_t fraction = micros % 1000000;
    if (fraction < 0) {
        fraction += 1000000;
        seconds -= 1;
    }

    std::time_t time_t_val = static_cast<std::time_t>(seconds);
    std::tm utc_tm{};
    gmtime_r(&time_t_val, &utc_tm);

    std::ostringstream oss;
    oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S");
    if (fraction > 0) {
        oss << "." << std::setfill('0') << std::setw(6) << fraction;
    }
    oss << "Z";
    return oss.str();
}

} // namespace rastercube::common_utils::time
