/**
 * @file time_parser.h
 * @brief 波段时间字符串解析
 *
 * 两种模式：
 * - 显式格式：只用给定格式解析，失败抛出 TimeParseException
 * - 备选格式列表：依次尝试，全部失败或输入为空时返回哨兵值，从不抛异常
 */

#pragma once

#include "common_utils/time/time_types.h"

#include <optional>
#include <string>
#include <vector>

namespace rastercube::common_utils::time {

class TimeParser {
public:
    /**
     * @brief 默认备选格式 {"%Y-%m-%d", "%Y"}
     */
    static const std::vector<std::string>& defaultFallbackFormats();

    TimeParser();
    explicit TimeParser(std::vector<std::string> fallbackFormats);

    /**
     * @brief 解析波段时间
     * @param raw 原始时间字符串，缺失或为空时返回哨兵值
     * @param explicitFormat 非空时使用显式格式模式
     * @throws TimeParseException 显式格式不匹配
     */
    CalendarTime parse(const std::optional<std::string>& raw,
                       const std::optional<std::string>& explicitFormat = std::nullopt) const;

    CalendarTime parseWithFallback(const std::optional<std::string>& raw) const;

    /**
     * @brief 用单个 strftime 风格格式解析，必须消费全部（去空白后的）输入
     *
     * 未出现的字段取 1 月 1 日 00:00:00 UTC。
     */
    static std::optional<CalendarTime> tryParse(const std::string& raw, const std::string& format);

    const std::vector<std::string>& fallbackFormats() const { return fallbackFormats_; }

private:
    std::vector<std::string> fallbackFormats_;
};

} // namespace rastercube::common_utils::time
