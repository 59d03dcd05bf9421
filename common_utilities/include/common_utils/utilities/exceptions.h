/**
 * @file exceptions.h
 * @brief 项目统一异常体系 - 基础异常定义
 *
 * 异常层次结构：
 * - RasterCubeBaseException (根异常)
 *   ├─ ConfigurationException
 *   ├─ IOException
 *   ├─ ResourceNotFoundException
 *   ├─ ValidationException
 *   │    └─ TimeParseException
 *   ├─ OperationCancelledException
 *   └─ ServiceException (core_services 异常的基类)
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace rastercube {
namespace common_utils {

/**
 * @brief 项目根异常类 - 所有自定义异常的基类
 */
class RasterCubeBaseException : public std::runtime_error {
public:
    explicit RasterCubeBaseException(const std::string& message)
        : std::runtime_error(message) {}

    RasterCubeBaseException(const std::string& message, int code)
        : std::runtime_error(message), code_(code) {}

    int getCode() const noexcept { return code_; }

protected:
    int code_ = 0;
};

/**
 * @brief 配置异常 - 配置文件或参数错误
 */
class ConfigurationException : public RasterCubeBaseException {
public:
    explicit ConfigurationException(const std::string& message)
        : RasterCubeBaseException(message) {}

    ConfigurationException(const std::string& message, int code)
        : RasterCubeBaseException(message, code) {}
};

/**
 * @brief I/O 异常 - 文件、网络等 I/O 操作错误
 */
class IOException : public RasterCubeBaseException {
public:
    explicit IOException(const std::string& message)
        : RasterCubeBaseException(message) {}

    IOException(const std::string& message, int code)
        : RasterCubeBaseException(message, code) {}
};

/**
 * @brief 资源未找到异常
 */
class ResourceNotFoundException : public RasterCubeBaseException {
public:
    explicit ResourceNotFoundException(const std::string& message)
        : RasterCubeBaseException(message) {}

    ResourceNotFoundException(const std::string& message, int code)
        : RasterCubeBaseException(message, code) {}
};

/**
 * @brief 验证异常 - 参数验证、数据验证失败
 */
class ValidationException : public RasterCubeBaseException {
public:
    explicit ValidationException(const std::string& message)
        : RasterCubeBaseException(message) {}

    ValidationException(const std::string& message, int code)
        : RasterCubeBaseException(message, code) {}
};

/**
 * @brief 时间解析异常 - 显式给定的时间格式与时间字符串不匹配
 */
class TimeParseException : public ValidationException {
public:
    explicit TimeParseException(const std::string& message)
        : ValidationException(message) {}
};

/**
 * @brief 操作取消异常 - 调用方请求取消后在检查点抛出
 */
class OperationCancelledException : public RasterCubeBaseException {
public:
    explicit OperationCancelledException(const std::string& message)
        : RasterCubeBaseException(message) {}
};

/**
 * @brief 服务异常基类 - core_services 模块异常的基类
 */
class ServiceException : public RasterCubeBaseException {
public:
    explicit ServiceException(const std::string& message)
        : RasterCubeBaseException(message) {}

    ServiceException(const std::string& message, int code)
        : RasterCubeBaseException(message, code) {}
};

/**
 * @brief 拼接带文件、行号、函数名的异常消息
 */
inline std::string makeErrorMessage(const std::string& message, const char* file, int line, const char* function) {
    std::ostringstream oss;
    oss << message << " (at " << file << ":" << line << ", in " << function << ")";
    return oss.str();
}

#define MAKE_ERROR_MSG(msg) \
    ::rastercube::common_utils::makeErrorMessage((msg), __FILE__, __LINE__, __FUNCTION__)

#define THROW_RASTERCUBE_EXCEPTION(ExceptionType, msg) \
    throw ExceptionType(MAKE_ERROR_MSG(msg))

#define THROW_RASTERCUBE_EXCEPTION_CODE(ExceptionType, msg, code) \
    throw ExceptionType(MAKE_ERROR_MSG(msg), code)

} // namespace common_utils
} // namespace rastercube
