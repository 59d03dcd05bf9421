/**
 * @file string_utils.h
 * @brief 字符串处理工具函数
 */

#pragma once

#include <string>
#include <vector>

namespace rastercube::common_utils {

/**
 * @brief 字符串工具类
 */
class StringUtils {
public:
    static std::string trimLeft(const std::string& s);

    static std::string trimRight(const std::string& s);

    /**
     * @brief 去除字符串两侧空白字符
     */
    static std::string trim(const std::string& s);

    static std::string toLower(const std::string& s);

    static std::string toUpper(const std::string& s);

    /**
     * @brief 分割字符串
     * @param s 输入字符串
     * @param delimiter 分隔符
     * @param trimTokens 是否去除每个片段两侧空白
     * @return 非空片段列表
     */
    static std::vector<std::string> split(const std::string& s,
                                          const std::string& delimiter,
                                          bool trimTokens = false);

    static std::string join(const std::vector<std::string>& v,
                            const std::string& delimiter);

    static bool startsWith(const std::string& s,
                           const std::string& prefix,
                           bool caseSensitive = true);

    static bool endsWith(const std::string& s,
                         const std::string& suffix,
                         bool caseSensitive = true);
};

} // namespace rastercube::common_utils
