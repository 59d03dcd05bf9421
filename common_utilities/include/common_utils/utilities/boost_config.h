/**
 * @file boost_config.h
 * @brief 项目统一 Boost 库配置头文件
 * 
 * 所有使用 boost::future / boost::thread / boost::asio 的模块都必须
 * 在包含任何 boost 头文件之前先包含本文件，保证宏定义在各编译单元一致。
 * 
 * 使用方法：
 * ```cpp
 * #include "common_utils/utilities/boost_config.h"  // 项目中唯一的 Boost 配置
 * #include <boost/thread/future.hpp>               // boost::future 支持
 * ```
 */

#pragma once

#ifndef RASTERCUBE_BOOST_CONFIG_UNIFIED_H
#define RASTERCUBE_BOOST_CONFIG_UNIFIED_H

// ============================================================================
// 平台特定配置
// ============================================================================

#ifdef _WIN32
    #ifndef _WIN32_WINNT
    #define _WIN32_WINNT 0x0A00
    #endif

    #ifndef NOMINMAX
    #define NOMINMAX
    #endif

    #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
    #endif
#endif

// ============================================================================
// Boost.Thread Future 支持宏定义
// ============================================================================

#ifndef BOOST_THREAD_PROVIDES_FUTURE
#define BOOST_THREAD_PROVIDES_FUTURE 1
#endif

#ifndef BOOST_THREAD_PROVIDES_FUTURE_CONTINUATION
#define BOOST_THREAD_PROVIDES_FUTURE_CONTINUATION 1
#endif

#ifndef BOOST_THREAD_PROVIDES_FUTURE_WHEN_ALL_WHEN_ANY
#define BOOST_THREAD_PROVIDES_FUTURE_WHEN_ALL_WHEN_ANY 1
#endif

#ifndef BOOST_THREAD_USES_MOVE
#define BOOST_THREAD_USES_MOVE 1
#endif

#ifndef BOOST_THREAD_VERSION
#define BOOST_THREAD_VERSION 5
#endif

// ============================================================================
// boost::asio 配置 - 条件性启用
// ============================================================================

#if defined(RASTERCUBE_ENABLE_BOOST_ASIO) || defined(BOOST_ASIO_HPP)
#ifdef _WIN32
    #ifndef BOOST_ASIO_NO_WIN32_LEAN_AND_MEAN
    #define BOOST_ASIO_NO_WIN32_LEAN_AND_MEAN
    #endif
#endif
#endif // RASTERCUBE_ENABLE_BOOST_ASIO

#define RASTERCUBE_BOOST_CONFIG_VERSION "1.0.0"

#endif // RASTERCUBE_BOOST_CONFIG_UNIFIED_H
