/**
 * @file exceptions.h
 * @brief Core Services 业务异常定义
 *
 * 所有异常都从 common_utils::ServiceException 继承：
 * - DataAccessException: 数据源打开、读取、列举对象等
 * - AssemblyException: 变量合并、数据集组合等装配阶段
 */

#pragma once

#include "common_utils/utilities/exceptions.h"

namespace rastercube {
namespace core_services {

using common_utils::ServiceException;

/**
 * @brief 数据访问异常 - 数据访问层错误
 */
class DataAccessException : public ServiceException {
public:
    explicit DataAccessException(const std::string& message)
        : ServiceException(message) {}

    DataAccessException(const std::string& message, int code)
        : ServiceException(message, code) {}
};

/**
 * @brief 瞬时 I/O 异常 - 网络或文件打开失败，可重试
 */
class TransientIOException : public DataAccessException {
public:
    explicit TransientIOException(const std::string& message)
        : DataAccessException(message) {}

    static TransientIOException forSource(const std::string& location, const std::string& reason) {
        return TransientIOException("Failed to open raster source '" + location + "': " + reason);
    }
};

/**
 * @brief 波段号超出数据源的波段范围，不可重试
 */
class BandOutOfRangeException : public DataAccessException {
public:
    BandOutOfRangeException(const std::string& location, int bandNumber, int bandCount)
        : DataAccessException("Band " + std::to_string(bandNumber) + " is outside 1.." +
                              std::to_string(bandCount) + " in '" + location + "'"),
          bandNumber_(bandNumber), bandCount_(bandCount) {}

    int bandNumber() const { return bandNumber_; }
    int bandCount() const { return bandCount_; }

private:
    int bandNumber_;
    int bandCount_;
};

/**
 * @brief 对象存储文件的网格与首个文件不一致
 */
class GeometryMismatchException : public DataAccessException {
public:
    explicit GeometryMismatchException(const std::string& message)
        : DataAccessException(message) {}
};

/**
 * @brief 装配异常基类
 */
class AssemblyException : public ServiceException {
public:
    explicit AssemblyException(const std::string& message)
        : ServiceException(message) {}

    AssemblyException(const std::string& message, int code)
        : ServiceException(message, code) {}
};

/**
 * @brief 沿时间轴拼接时空间轴不一致
 */
class DimensionMismatchException : public AssemblyException {
public:
    explicit DimensionMismatchException(const std::string& message)
        : AssemblyException(message) {}
};

/**
 * @brief 同一变量同时存在有时间和无时间的平面，且策略为拒绝
 */
class AmbiguousTimeAxisException : public AssemblyException {
public:
    explicit AmbiguousTimeAxisException(const std::string& message)
        : AssemblyException(message) {}
};

/**
 * @brief 变量间结构冲突，回退分组后仍无法组合
 */
class CombineIncompatibleException : public AssemblyException {
public:
    explicit CombineIncompatibleException(const std::string& message)
        : AssemblyException(message) {}
};

/**
 * @brief 没有任何变量可用于装配
 */
class NoAssemblableDataException : public AssemblyException {
public:
    explicit NoAssemblableDataException(const std::string& message)
        : AssemblyException(message) {}
};

} // namespace core_services
} // namespace rastercube
