/**
 * @file time_types.h
 * @brief 通用时间类型定义
 *
 * CalendarTime 以 UTC 微秒精度表示时间点。默认构造得到哨兵值 (NaT, "no time")，
 * 它小于任何真实时间点，因此按时间排序时总是排在最前。
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace rastercube::common_utils::time {

/**
 * @brief 日历时间 (UTC, 微秒精度)
 */
struct CalendarTime {
    using Duration = std::chrono::microseconds;
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, Duration>;

    TimePoint timePoint = TimePoint::min();

    CalendarTime() = default;
    explicit CalendarTime(const TimePoint& tp) : timePoint(tp) {}

    /**
     * @brief 哨兵值，表示没有时间
     */
    static CalendarTime notATime() { return CalendarTime(); }

    static CalendarTime fromMicroseconds(std::int64_t microsSinceEpoch);

    /**
     * @brief 由公历日期构造 UTC 时间点
     * @throws ValidationException 日期或时间字段越界
     */
    static CalendarTime fromCivil(int year, int month, int day,
                                  int hour = 0, int minute = 0, int second = 0);

    /// 非哨兵值时返回 true
    bool isValid() const { return timePoint != TimePoint::min(); }

    std::int64_t toMicroseconds() const { return timePoint.time_since_epoch().count(); }

    /**
     * @brief ISO 8601 字符串，如 `2020-01-01T00:00:00Z`；哨兵值返回 "NaT"
     */
    std::string toISOString() const;

    bool operator<(const CalendarTime& other) const { return timePoint < other.timePoint; }
    bool operator==(const CalendarTime& other) const { return timePoint == other.timePoint; }
    bool operator!=(const CalendarTime& other) const { return !(*this == other); }
    bool operator<=(const CalendarTime& other) const { return !(other < *this); }
    bool operator>(const CalendarTime& other) const { return other < *this; }
    bool operator>=(const CalendarTime& other) const { return !(*this < other); }
};

/**
 * @brief 公历日期到 1970-01-01 起的天数
 */
std::int64_t daysFromCivil(std::int64_t year, unsigned month, unsigned day);

bool isLeapYear(int year);

int daysInMonth(int year, int month);

} // namespace rastercube::common_utils::time
