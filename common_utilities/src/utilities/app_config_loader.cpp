/**
 * @file app_config_loader.cpp
 * @brief 应用配置加载器实现
 */

#include "common_utils/utilities/app_config_loader.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace rastercube {
namespace common_utils {

// ConfigValue 类型转换

bool ConfigValue::asBool() const {
    std::string lowerValue = StringUtils::toLower(StringUtils::trim(value));
    return lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on";
}

int ConfigValue::asInt() const {
    std::string trimmed = StringUtils::trim(value);
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(trimmed, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationException("Configuration value '" + value + "' is not an integer");
    }
    if (consumed != trimmed.size()) {
        throw ConfigurationException("Configuration value '" + value + "' is not an integer");
    }
    return result;
}

double ConfigValue::asDouble() const {
    std::string trimmed = StringUtils::trim(value);
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(trimmed, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationException("Configuration value '" + value + "' is not a number");
    }
    if (consumed != trimmed.size()) {
        throw ConfigurationException("Configuration value '" + value + "' is not a number");
    }
    return result;
}

std::string ConfigValue::asString() const {
    return value;
}

std::vector<std::string> ConfigValue::asStringList() const {
    // 支持逗号分隔和分号分隔
    std::string delimiter = value.find(',') != std::string::npos ? "," : ";";
    return StringUtils::split(value, delimiter, true);
}

// AppConfigLoader

AppConfigLoader::AppConfigLoader(const std::string& appName) : m_appName(appName) {
    setDefault("log_level", "info", "Default logging level");
    setDefault("config_file", "", "Configuration file path");
}

bool AppConfigLoader::loadFromFile(const std::filesystem::path& configPath) {
    if (!std::filesystem::exists(configPath)) {
        LOG_WARN("Config file does not exist: {}", configPath.string());
        return false;
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        THROW_RASTERCUBE_EXCEPTION(ConfigurationException,
                                   "Failed to open config file: " + configPath.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    parseYamlObject(buffer.str(), ConfigSource::FILE_YAML);
    LOG_INFO("Loaded YAML configuration from: {}", configPath.string());
    return true;
}

void AppConfigLoader::loadFromString(const std::string& yamlContent) {
    parseYamlObject(yamlContent, ConfigSource::FILE_YAML);
}

int AppConfigLoader::loadFromEnvironment(const std::string& prefix) {
    int count = 0;

    for (const auto& [key, defaultValue] : m_defaults) {
        std::string envVar = key;
        std::replace(envVar.begin(), envVar.end(), '.', '_');
        envVar = prefix + StringUtils::toUpper(envVar);

        const char* envValue = std::getenv(envVar.c_str());
        if (envValue != nullptr) {
            store(key, envValue, ConfigSource::ENVIRONMENT, "Environment variable: " + envVar);
            count++;
            LOG_DEBUG("Loaded env var: {} = {}", envVar, envValue);
        }
    }

    if (count > 0) {
        LOG_INFO("Loaded {} configuration values from environment variables", count);
    }

    return count;
}

int AppConfigLoader::loadFromCommandLine(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) { // 跳过程序名
        args.emplace_back(argv[i]);
    }
    return loadFromArguments(args);
}

int AppConfigLoader::loadFromArguments(const std::vector<std::string>& args) {
    int count = 0;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (!StringUtils::startsWith(arg, "--") || arg.size() == 2) {
            continue;
        }

        // --key=value
        size_t equalPos = arg.find('=');
        if (equalPos != std::string::npos) {
            store(arg.substr(2, equalPos - 2), arg.substr(equalPos + 1),
                  ConfigSource::COMMAND_LINE, "Command line argument");
            count++;
        }
        // --key value
        else if (i + 1 < args.size() && !StringUtils::startsWith(args[i + 1], "-")) {
            store(arg.substr(2), args[i + 1], ConfigSource::COMMAND_LINE, "Command line argument");
            count++;
            i++;
        }
        // 单独的 --flag 视为 true
        else {
            store(arg.substr(2), "true", ConfigSource::COMMAND_LINE, "Command line flag");
            count++;
        }
    }

    if (count > 0) {
        LOG_INFO("Loaded {} configuration values from command line", count);
    }

    return count;
}

void AppConfigLoader::setDefault(const std::string& key, const std::string& value,
                                 const std::string& description) {
    ConfigValue defaultValue;
    defaultValue.value = value;
    defaultValue.source = ConfigSource::DEFAULT_VALUES;
    defaultValue.description = description;

    m_defaults[normalizeKey(key)] = defaultValue;
}

std::optional<ConfigValue> AppConfigLoader::get(const std::string& key) const {
    std::string normalizedKey = normalizeKey(key);

    auto it = m_config.find(normalizedKey);
    if (it != m_config.end()) {
        return it->second;
    }

    auto defaultIt = m_defaults.find(normalizedKey);
    if (defaultIt != m_defaults.end()) {
        return defaultIt->second;
    }

    return std::nullopt;
}

std::string AppConfigLoader::getString(const std::string& key, const std::string& defaultValue) const {
    auto configValue = get(key);
    return configValue ? configValue->asString() : defaultValue;
}

int AppConfigLoader::getInt(const std::string& key, int defaultValue) const {
    auto configValue = get(key);
    return configValue ? configValue->asInt() : defaultValue;
}

bool AppConfigLoader::getBool(const std::string& key, bool defaultValue) const {
    auto configValue = get(key);
    return configValue ? configValue->asBool() : defaultValue;
}

double AppConfigLoader::getDouble(const std::string& key, double defaultValue) const {
    auto configValue = get(key);
    return configValue ? configValue->asDouble() : defaultValue;
}

std::vector<std::string> AppConfigLoader::getStringList(const std::string& key,
                                                        const std::vector<std::string>& defaultValue) const {
    auto configValue = get(key);
    return configValue ? configValue->asStringList() : defaultValue;
}

bool AppConfigLoader::has(const std::string& key) const {
    return get(key).has_value();
}

std::map<std::string, ConfigValue> AppConfigLoader::getAll() const {
    std::map<std::string, ConfigValue> result = m_defaults;
    for (const auto& [key, value] : m_config) {
        result[key] = value;
    }
    return result;
}

void AppConfigLoader::printConfig(bool includeDefaults) const {
    LOG_INFO("=== {} configuration ===", m_appName);

    for (const auto& [key, value] : getAll()) {
        if (!includeDefaults && value.source == ConfigSource::DEFAULT_VALUES) {
            continue;
        }

        const char* sourceStr = "DEFAULT";
        switch (value.source) {
            case ConfigSource::FILE_YAML: sourceStr = "FILE"; break;
            case ConfigSource::ENVIRONMENT: sourceStr = "ENV"; break;
            case ConfigSource::COMMAND_LINE: sourceStr = "CMD"; break;
            case ConfigSource::DEFAULT_VALUES: sourceStr = "DEFAULT"; break;
        }

        LOG_INFO("  {} = {} [{}]", key, value.value, sourceStr);
    }
}

std::vector<std::string> AppConfigLoader::validateRequired(const std::vector<std::string>& requiredKeys) const {
    std::vector<std::string> missing;
    for (const std::string& key : requiredKeys) {
        if (!has(key)) {
            missing.push_back(key);
        }
    }
    return missing;
}

// 私有方法

void AppConfigLoader::parseYamlObject(const std::string& yamlContent, ConfigSource source) {
    try {
        YAML::Node root = YAML::Load(yamlContent);
        parseYamlNode(root, "", source);
        LOG_DEBUG("Successfully parsed YAML configuration");
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parsing error: {}", e.what());
        THROW_RASTERCUBE_EXCEPTION(ConfigurationException,
                                   "Failed to parse YAML configuration: " + std::string(e.what()));
    }
}

void AppConfigLoader::parseYamlNode(const YAML::Node& node, const std::string& prefix, ConfigSource source) {
    if (node.IsMap()) {
        for (const auto& item : node) {
            std::string key = item.first.as<std::string>();
            std::string fullKey = prefix.empty() ? key : prefix + "." + key;

            if (item.second.IsScalar()) {
                store(fullKey, item.second.as<std::string>(), source, "Loaded from YAML");
                LOG_DEBUG("Loaded config: {} = {}", fullKey, item.second.as<std::string>());
            } else {
                parseYamlNode(item.second, fullKey, source);
            }
        }
    } else if (node.IsSequence() && !prefix.empty()) {
        // 序列转换为逗号分隔的字符串
        std::vector<std::string> items;
        for (size_t i = 0; i < node.size(); ++i) {
            items.push_back(node[i].as<std::string>());
        }
        store(prefix, StringUtils::join(items, ","), source, "Loaded from YAML (array)");
    }
}

void AppConfigLoader::store(const std::string& key, const std::string& value,
                            ConfigSource source, const std::string& description) {
    ConfigValue configValue;
    configValue.value = value;
    configValue.source = source;
    configValue.description = description;
    m_config[normalizeKey(key)] = configValue;
}

std::string AppConfigLoader::normalizeKey(const std::string& key) const {
    std::string normalized = StringUtils::toLower(StringUtils::trim(key));
    std::replace(normalized.begin(), normalized.end(), '-', '_');
    return normalized;
}

} // namespace common_utils
} // namespace rastercube
