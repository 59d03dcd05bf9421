/**
 * @file app_config_loader.h
 * @brief 应用配置加载器
 *
 * 配置值按以下优先级覆盖（高到低）：
 * 命令行参数 > 环境变量 > 配置文件 (YAML) > 默认值
 *
 * 所有键统一规范化为小写，连字符替换为下划线，嵌套 YAML 节点展开为
 * 点分键，例如 `retry.max_attempts`。
 */

#pragma once

#include <string>
#include <map>
#include <optional>
#include <filesystem>
#include <vector>

namespace YAML {
    class Node;
}

namespace rastercube {
namespace common_utils {

/**
 * @enum ConfigSource
 * @brief 配置来源类型
 */
enum class ConfigSource {
    FILE_YAML,      // YAML文件
    ENVIRONMENT,    // 环境变量
    COMMAND_LINE,   // 命令行参数
    DEFAULT_VALUES  // 默认值
};

/**
 * @struct ConfigValue
 * @brief 配置值容器
 */
struct ConfigValue {
    std::string value;
    ConfigSource source = ConfigSource::DEFAULT_VALUES;
    std::string description;

    bool asBool() const;

    /// @throws ConfigurationException 值不是整数
    int asInt() const;

    /// @throws ConfigurationException 值不是数字
    double asDouble() const;

    std::string asString() const;

    /// 逗号或分号分隔的列表，片段两侧空白被去除
    std::vector<std::string> asStringList() const;
};

/**
 * @class AppConfigLoader
 * @brief 轻量级配置加载器
 *
 * - YAML 配置文件加载 (yaml-cpp)
 * - 环境变量读取 (前缀 + 大写键名，点号替换为下划线)
 * - 命令行参数解析 (`--key=value` 或 `--key value`)
 * - 默认值及描述管理
 */
class AppConfigLoader {
public:
    explicit AppConfigLoader(const std::string& appName = "rastercube");
    ~AppConfigLoader() = default;

    AppConfigLoader(const AppConfigLoader&) = delete;
    AppConfigLoader& operator=(const AppConfigLoader&) = delete;

    /**
     * @brief 从 YAML 文件加载配置
     * @return 文件不存在时返回 false
     * @throws ConfigurationException 文件存在但无法解析
     */
    bool loadFromFile(const std::filesystem::path& configPath);

    /**
     * @brief 从 YAML 文本加载配置
     * @throws ConfigurationException 解析失败
     */
    void loadFromString(const std::string& yamlContent);

    /**
     * @brief 从环境变量加载配置
     *
     * 对每个已登记默认值的键 `a.b_c` 查找环境变量 `<prefix>A_B_C`。
     * @param prefix 环境变量前缀
     * @return 加载的环境变量数量
     */
    int loadFromEnvironment(const std::string& prefix = "RASTERCUBE_");

    /**
     * @brief 从命令行参数加载配置
     * @return 解析出的键值对数量；非 `--` 开头的参数被忽略
     */
    int loadFromCommandLine(int argc, char* argv[]);

    int loadFromArguments(const std::vector<std::string>& args);

    void setDefault(const std::string& key, const std::string& value,
                    const std::string& description = "");

    /**
     * @brief 获取配置值，用户配置优先于默认值
     */
    std::optional<ConfigValue> get(const std::string& key) const;

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    int getInt(const std::string& key, int defaultValue = 0) const;

    bool getBool(const std::string& key, bool defaultValue = false) const;

    double getDouble(const std::string& key, double defaultValue = 0.0) const;

    std::vector<std::string> getStringList(const std::string& key,
                                           const std::vector<std::string>& defaultValue = {}) const;

    bool has(const std::string& key) const;

    std::map<std::string, ConfigValue> getAll() const;

    /**
     * @brief 以 INFO 级别输出当前配置
     */
    void printConfig(bool includeDefaults = false) const;

    /**
     * @brief 返回缺失的必需配置键
     */
    std::vector<std::string> validateRequired(const std::vector<std::string>& requiredKeys) const;

private:
    std::string m_appName;
    std::map<std::string, ConfigValue> m_config;
    std::map<std::string, ConfigValue> m_defaults;

    void parseYamlObject(const std::string& yamlContent, ConfigSource source);
    void parseYamlNode(const YAML::Node& node, const std::string& prefix, ConfigSource source);
    void store(const std::string& key, const std::string& value,
               ConfigSource source, const std::string& description);
    std::string normalizeKey(const std::string& key) const;
};

} // namespace common_utils
} // namespace rastercube
