#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的日志，设置为 1 启用（也可由构建选项覆盖）

#ifndef ENABLE_PAIR_DEBUG_LOGS
#define ENABLE_PAIR_DEBUG_LOGS 0     // 逐对比较的调试日志（量大）
#endif

#ifndef ENABLE_SAX_DEBUG_LOGS
#define ENABLE_SAX_DEBUG_LOGS 0      // docx解析的元素级调试日志
#endif
