#pragma once

#include "solana_tss_export.h"

typedef enum {
    SOLANA_TSS_LOG_LEVEL_FATAL = 50000,
    SOLANA_TSS_LOG_LEVEL_ERROR = 40000,
    SOLANA_TSS_LOG_LEVEL_WARN  = 30000,
    SOLANA_TSS_LOG_LEVEL_INFO  = 20000,
    SOLANA_TSS_LOG_LEVEL_DEBUG = 10000,
    SOLANA_TSS_LOG_LEVEL_TRACE = 5000,
} SOLANA_TSS_LOG_LEVEL;

typedef void (*solana_tss_log_callback)(int level, const char* file, int line, const char* func, const char* message, void* userp);

#ifdef __cplusplus
extern "C" {
#endif //__cplusplus

// replaces the default stderr sink, passing NULL restores it
SOLANA_TSS_EXPORT void solana_tss_log_init(solana_tss_log_callback cb, void* userp);
// messages below level are dropped before formatting
SOLANA_TSS_EXPORT void solana_tss_log_set_level(int level);

SOLANA_TSS_EXPORT void solana_tss_log_msg(int level, const char* file, int line, const char* func, const char* message, ...)
    __attribute__ ((format (printf, 5, 6)));

#ifdef __cplusplus
}
#endif //__cplusplus

#define LOG(level, message, ...) solana_tss_log_msg((level), __FILE__, __LINE__, __func__, (message), ##__VA_ARGS__)
#define LOG_TRACE(message, ...)  LOG(SOLANA_TSS_LOG_LEVEL_TRACE, message, ##__VA_ARGS__)
#define LOG_DEBUG(message, ...)  LOG(SOLANA_TSS_LOG_LEVEL_DEBUG, message, ##__VA_ARGS__)
#define LOG_INFO(message, ...)   LOG(SOLANA_TSS_LOG_LEVEL_INFO,  message, ##__VA_ARGS__)
#define LOG_WARN(message, ...)   LOG(SOLANA_TSS_LOG_LEVEL_WARN,  message, ##__VA_ARGS__)
#define LOG_ERROR(message, ...)  LOG(SOLANA_TSS_LOG_LEVEL_ERROR, message, ##__VA_ARGS__)
#define LOG_FATAL(message, ...)  LOG(SOLANA_TSS_LOG_LEVEL_FATAL, message, ##__VA_ARGS__)
