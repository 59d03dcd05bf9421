/**
 * @file logging_utils.h
 * @brief 日志管理系统接口 (spdlog)
 */

#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rastercube::common_utils {

/**
 * @brief 日志配置结构体
 */
struct LoggingConfig {
    bool async = false;                      ///< 是否使用异步日志
    bool enable_console = true;              ///< 是否启用控制台日志
    bool enable_file = false;                ///< 是否启用文件日志
    std::string console_level = "info";      ///< 控制台日志级别
    std::string file_level = "trace";        ///< 文件日志级别
    std::string log_filename = "rastercube.log";
    size_t max_file_size = 1048576 * 5;      ///< 日志文件最大大小 (5MB)
    size_t max_files = 3;                    ///< 最大日志文件数
};

/**
 * @brief 日志管理器
 *
 * Provides a process-wide access point for the LOG_* macros and lazily
 * creates one spdlog logger per module name. The global instance can be
 * configured once at startup (configureGlobal).
 *
 * @code
 * LOG_INFO("assembly started");
 * RASTERCUBE_LOG_WARN("Assembly", "variable '{}' dropped", name);
 * @endcode
 */
class LoggingManager {
public:
    explicit LoggingManager(const LoggingConfig& config = LoggingConfig{});
    ~LoggingManager();

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    /**
     * @brief 初始化日志系统（重复调用无效）
     */
    void initialize(const LoggingConfig& config = LoggingConfig());

    /**
     * @brief 获取默认日志器
     */
    std::shared_ptr<spdlog::logger> getLogger();

    /**
     * @brief 获取指定模块的日志器，不存在时按当前配置创建
     */
    std::shared_ptr<spdlog::logger> getModuleLogger(const std::string& module_name);

    void flushAll();

    void shutdown();

    static LoggingManager& getGlobalInstance();

    static void configureGlobal(const LoggingConfig& config);

    /**
     * @brief 字符串日志级别转换，无法识别时返回 info
     */
    static spdlog::level::level_enum stringToLevel(const std::string& level);

private:
    void earlyInitialize();

    std::shared_ptr<spdlog::logger> createLogger(const std::string& name, const LoggingConfig& config);

    bool initialized_ = false;
    LoggingConfig config_;
    std::shared_ptr<spdlog::logger> default_logger_ = nullptr;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> module_loggers_;
    mutable std::mutex mutex_;

    static std::shared_ptr<LoggingManager> global_instance_;
    static std::mutex global_mutex_;
};

// === 全局日志宏 ===

#define LOG_TRACE(...) \
    do { \
        auto& manager = rastercube::common_utils::LoggingManager::getGlobalInstance(); \
        if (auto logger = manager.getLogger()) { \
            logger->trace(__VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(...) \
    do { \
        auto& manager = rastercube::common_utils::LoggingManager::getGlobalInstance(); \
        if (auto logger = manager.getLogger()) { \
            logger->debug(__VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...) \
    do { \
        auto& manager = rastercube::common_utils::LoggingManager::getGlobalInstance(); \
        if (auto logger = manager.getLogger()) { \
            logger->info(__VA_ARGS__); \
        } \
    } while(0)

#define LOG_WARN(...) \
    do { \
        auto& manager = rastercube::common_utils::LoggingManager::getGlobalInstance(); \
        if (auto logger = manager.getLogger()) { \
            logger->warn(__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(...) \
    do { \
        auto& manager = rastercube::common_utils::LoggingManager::getGlobalInstance(); \
        if (auto logger = manager.getLogger()) { \
            logger->error(__VA_ARGS__); \
        } \
    } while(0)

// 模块专用日志宏
#define LOG_MODULE_TRACE(module, ...) \
    do { \
        auto& manager = rastercube::common_utils::LoggingManager::getGlobalInstance(); \
        if (auto logger = manager.getModuleLogger(module)) { \
            logger->trace(__VA_ARGS__); \
        } \
    } while(0)

#define LOG_MODULE_DEBUG(module, ...) \
    do { \
        auto& manager = rastercube::common_utils::LoggingManager::getGlobalInstance(); \
        if (auto logger = manager.getModuleLogger(module)) { \
            logger->debug(__VA_ARGS__); \
        } \
    } while(0)

#define LOG_MODULE_INFO(module, ...) \
    do { \
        auto& manager = rastercube::common_utils::LoggingManager::getGlobalInstance(); \
        if (auto logger = manager.getModuleLogger(module)) { \
            logger->info(__VA_ARGS__); \
        } \
    } while(0)

#define LOG_MODULE_WARN(module, ...) \
    do { \
        auto& manager = rastercube::common_utils::LoggingManager::getGlobalInstance(); \
        if (auto logger = manager.getModuleLogger(module)) { \
            logger->warn(__VA_ARGS__); \
        } \
    } while(0)

#define LOG_MODULE_ERROR(module, ...) \
    do { \
        auto& manager = rastercube::common_utils::LoggingManager::getGlobalInstance(); \
        if (auto logger = manager.getModuleLogger(module)) { \
            logger->error(__VA_ARGS__); \
        } \
    } while(0)

// 项目统一日志接口
#define RASTERCUBE_LOG_TRACE(module, ...) LOG_MODULE_TRACE(module, __VA_ARGS__)
#define RASTERCUBE_LOG_DEBUG(module, ...) LOG_MODULE_DEBUG(module, __VA_ARGS__)
#define RASTERCUBE_LOG_INFO(module, ...) LOG_MODULE_INFO(module, __VA_ARGS__)
#define RASTERCUBE_LOG_WARN(module, ...) LOG_MODULE_WARN(module, __VA_ARGS__)
#define RASTERCUBE_LOG_ERROR(module, ...) LOG_MODULE_ERROR(module, __VA_ARGS__)

inline std::shared_ptr<spdlog::logger> getLogger() {
    return LoggingManager::getGlobalInstance().getLogger();
}

inline std::shared_ptr<spdlog::logger> getModuleLogger(const std::string& module_name) {
    return LoggingManager::getGlobalInstance().getModuleLogger(module_name);
}

} // namespace rastercube::common_utils
