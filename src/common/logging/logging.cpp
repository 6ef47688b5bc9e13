#include "logging/logging_t.h"

#include <stdarg.h>
#include <stdio.h>

#include <atomic>
#include <mutex>

namespace
{

struct log_sink
{
    std::mutex lock;
    solana_tss_log_callback cb = nullptr;
    void* userp = nullptr;
};

log_sink& sink()
{
    static log_sink instance;
    return instance;
}

std::atomic<int> min_level(SOLANA_TSS_LOG_LEVEL_INFO);

const char* level_name(int level)
{
    if (level >= SOLANA_TSS_LOG_LEVEL_FATAL) return "FATAL";
    if (level >= SOLANA_TSS_LOG_LEVEL_ERROR) return "ERROR";
    if (level >= SOLANA_TSS_LOG_LEVEL_WARN) return "WARN";
    if (level >= SOLANA_TSS_LOG_LEVEL_INFO) return "INFO";
    if (level >= SOLANA_TSS_LOG_LEVEL_DEBUG) return "DEBUG";
    return "TRACE";
}

}

void solana_tss_log_init(solana_tss_log_callback cb, void* userp)
{
    log_sink& s = sink();
    std::lock_guard<std::mutex> lg(s.lock);
    s.cb = cb;
    s.userp = userp;
}

void solana_tss_log_set_level(int level)
{
    min_level = level;
}

void solana_tss_log_msg(int level, const char* file, int line, const char* func, const char* message, ...)
{
    if (level < min_level)
        return;

    char buffer[1024];
    va_list args;
    va_start(args, message);
    vsnprintf(buffer, sizeof(buffer), message, args);
    va_end(args);

    log_sink& s = sink();
    std::lock_guard<std::mutex> lg(s.lock);
    if (s.cb)
        s.cb(level, file, line, func, buffer, s.userp);
    else
        fprintf(stderr, "[%s] %s:%d %s: %s\n", level_name(level), file, line, func, buffer);
}
