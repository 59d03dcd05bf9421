#include "common_utils/utilities/logging_utils.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/async.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace rastercube::common_utils {

std::shared_ptr<LoggingManager> LoggingManager::global_instance_;
std::mutex LoggingManager::global_mutex_;

LoggingManager::LoggingManager(const LoggingConfig& config) : config_(config) {
    // 实际初始化在 earlyInitialize 或 initialize 中完成
}

LoggingManager::~LoggingManager() {
    shutdown();
}

void LoggingManager::earlyInitialize() {
    if (default_logger_) {
        return;
    }

    try {
        default_logger_ = spdlog::get("rastercube");
        if (!default_logger_) {
            default_logger_ = spdlog::stdout_color_mt("rastercube");
        }
        default_logger_->set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex&) {
        default_logger_ = spdlog::default_logger();
    }
}

LoggingManager& LoggingManager::getGlobalInstance() {
    std::lock_guard<std::mutex> lock(global_mutex_);
    if (!global_instance_) {
        global_instance_ = std::make_shared<LoggingManager>();
        global_instance_->earlyInitialize();
    }
    return *global_instance_;
}

void LoggingManager::configureGlobal(const LoggingConfig& config) {
    getGlobalInstance().initialize(config);
}

void LoggingManager::initialize(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return;
    }

    config_ = config;

    if (config.async) {
        // spdlog 全局线程池只初始化一次
        if (!spdlog::thread_pool()) {
            spdlog::init_thread_pool(8192, 1);
        }
    }

    try {
        default_logger_ = createLogger("app", config);
        spdlog::set_default_logger(default_logger_);
    } catch (const std::exception& e) {
        std::cerr << "Failed to create default logger: " << e.what() << std::endl;
        default_logger_ = spdlog::stderr_color_mt("fallback_logger");
        default_logger_->set_level(spdlog::level::warn);
        spdlog::set_default_logger(default_logger_);
        default_logger_->error("Default logger creation failed, using fallback stderr logger.");
    }

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> LoggingManager::getLogger() {
    return default_logger_;
}

std::shared_ptr<spdlog::logger> LoggingManager::getModuleLogger(const std::string& module_name) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!default_logger_) {
        auto null_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
        return std::make_shared<spdlog::logger>("null_" + module_name, null_sink);
    }

    auto it = module_loggers_.find(module_name);
    if (it != module_loggers_.end()) {
        return it->second;
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = createLogger(module_name, config_);
        module_loggers_[module_name] = logger;
    } catch (const std::exception& e) {
        default_logger_->error("Failed to create module logger '{}': {}. Returning default logger.",
                               module_name, e.what());
        logger = default_logger_;
    }
    return logger;
}

void LoggingManager::flushAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (default_logger_) {
        default_logger_->flush();
    }
    for (auto const& [name, logger] : module_loggers_) {
        if (logger) {
            logger->flush();
        }
    }
}

void LoggingManager::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto const& [name, logger] : module_loggers_) {
        if (logger) {
            logger->flush();
            spdlog::drop(name);
        }
    }
    module_loggers_.clear();
    if (default_logger_) {
        default_logger_->flush();
    }
    initialized_ = false;
}

spdlog::level::level_enum LoggingManager::stringToLevel(const std::string& level) {
    std::string lower_level = level;
    std::transform(lower_level.begin(), lower_level.end(), lower_level.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    if (lower_level == "trace") return spdlog::level::trace;
    if (lower_level == "debug") return spdlog::level::debug;
    if (lower_level == "info") return spdlog::level::info;
    if (lower_level == "warn" || lower_level == "warning") return spdlog::level::warn;
    if (lower_level == "error") return spdlog::level::err;
    if (lower_level == "critical") return spdlog::level::critical;
    if (lower_level == "off") return spdlog::level::off;

    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> LoggingManager::createLogger(const std::string& name, const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(stringToLevel(config.console_level));
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.enable_file) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_filename,
                config.max_file_size,
                config.max_files
            );
            file_sink->set_level(stringToLevel(config.file_level));
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Failed to create rotating file sink for '" << name << "' at '"
                      << config.log_filename << "': " << ex.what() << std::endl;
            if (sinks.empty()) {
                throw std::runtime_error("Cannot create any log sinks for logger: " + name);
            }
        }
    }

    // 没有任何 sink 时至少保留 stderr 警告输出
    if (sinks.empty()) {
        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        stderr_sink->set_level(spdlog::level::warn);
        stderr_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        sinks.push_back(stderr_sink);
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        logger = std::make_shared<spdlog::async_logger>(
            name,
            sinks.begin(),
            sinks.end(),
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::block
        );
    } else {
        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    }

    // sink 负责过滤级别
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::err);

    spdlog::drop(name);
    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Failed to register logger '" << name << "': " << ex.what()
                  << ". Logger is still functional." << std::endl;
    }

    return logger;
}

} // namespace rastercube::common_utils
