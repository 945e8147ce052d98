#include "halftone_log.hpp"

#include <stdarg.h>
#include <stdio.h>

#include <atomic>

static std::atomic<int> log_level{LABEL_HALFTONE_DEFAULT_LOG_LEVEL};

static void vlog(const char* tag, const char* fmt, va_list args) {
  fprintf(stderr, "[label_halftone] %s: ", tag);
  vfprintf(stderr, fmt, args);
  fprintf(stderr, "\n");
}

void set_log_level(int level) {
  if(level < LOG_LEVEL_ERROR) {
    level = LOG_LEVEL_ERROR;
  } else if(level > LOG_LEVEL_DEBUG) {
    level = LOG_LEVEL_DEBUG;
  }
  log_level.store(level, std::memory_order_relaxed);
}

int get_log_level() {
  return log_level.load(std::memory_order_relaxed);
}

void log_error(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog("error", fmt, args);
  va_end(args);
}

void log_info(const char* fmt, ...) {
  if(get_log_level() < LOG_LEVEL_INFO) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  vlog("info", fmt, args);
  va_end(args);
}

void log_debug(const char* fmt, ...) {
  if(get_log_level() < LOG_LEVEL_DEBUG) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  vlog("debug", fmt, args);
  va_end(args);
}
