#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    STYLEVERIFY_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     STYLEVERIFY_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     STYLEVERIFY_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    STYLEVERIFY_LOG_ERROR("[ERR][core] " __VA_ARGS__)
#define CORE_CRITICAL(...) STYLEVERIFY_LOG_CRITICAL("[CRT][core] " __VA_ARGS__)

// 校验引擎 (verify)
#define VERIFY_DEBUG(...)    STYLEVERIFY_LOG_DEBUG("[DBG][vrfy] " __VA_ARGS__)
#define VERIFY_INFO(...)     STYLEVERIFY_LOG_INFO("[INF][vrfy] " __VA_ARGS__)
#define VERIFY_WARN(...)     STYLEVERIFY_LOG_WARN("[WRN][vrfy] " __VA_ARGS__)
#define VERIFY_ERROR(...)    STYLEVERIFY_LOG_ERROR("[ERR][vrfy] " __VA_ARGS__)
#define VERIFY_CRITICAL(...) STYLEVERIFY_LOG_CRITICAL("[CRT][vrfy] " __VA_ARGS__)

// 存储模块 (repository)
#define REPO_DEBUG(...)    STYLEVERIFY_LOG_DEBUG("[DBG][repo] " __VA_ARGS__)
#define REPO_INFO(...)     STYLEVERIFY_LOG_INFO("[INF][repo] " __VA_ARGS__)
#define REPO_WARN(...)     STYLEVERIFY_LOG_WARN("[WRN][repo] " __VA_ARGS__)
#define REPO_ERROR(...)    STYLEVERIFY_LOG_ERROR("[ERR][repo] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)    STYLEVERIFY_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)     STYLEVERIFY_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)     STYLEVERIFY_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)    STYLEVERIFY_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)    STYLEVERIFY_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)     STYLEVERIFY_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)    STYLEVERIFY_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...)    STYLEVERIFY_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)     STYLEVERIFY_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...)    STYLEVERIFY_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 服务层 (service)
#define SERVICE_DEBUG(...)    STYLEVERIFY_LOG_DEBUG("[DBG][svc ] " __VA_ARGS__)
#define SERVICE_INFO(...)     STYLEVERIFY_LOG_INFO("[INF][svc ] " __VA_ARGS__)
#define SERVICE_WARN(...)     STYLEVERIFY_LOG_WARN("[WRN][svc ] " __VA_ARGS__)
#define SERVICE_ERROR(...)    STYLEVERIFY_LOG_ERROR("[ERR][svc ] " __VA_ARGS__)
#define SERVICE_CRITICAL(...) STYLEVERIFY_LOG_CRITICAL("[CRT][svc ] " __VA_ARGS__)

// 命令行 (cli)
#define CLI_INFO(...)     STYLEVERIFY_LOG_INFO("[INF][cli ] " __VA_ARGS__)
#define CLI_ERROR(...)    STYLEVERIFY_LOG_ERROR("[ERR][cli ] " __VA_ARGS__)

// 条件日志宏
#if ENABLE_PAIR_DEBUG_LOGS
    #define STYLEVERIFY_LOG_PAIR_DEBUG(...) VERIFY_DEBUG(__VA_ARGS__)
#else
    #define STYLEVERIFY_LOG_PAIR_DEBUG(...) do {} while(0)
#endif

#if ENABLE_SAX_DEBUG_LOGS
    #define STYLEVERIFY_LOG_SAX_DEBUG(...) READER_DEBUG(__VA_ARGS__)
#else
    #define STYLEVERIFY_LOG_SAX_DEBUG(...) do {} while(0)
#endif
