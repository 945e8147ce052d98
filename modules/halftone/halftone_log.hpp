#ifndef LABEL_HALFTONE_HALFTONE_LOG_HPP
#define LABEL_HALFTONE_HALFTONE_LOG_HPP

enum {
  LOG_LEVEL_ERROR,
  LOG_LEVEL_INFO,
  LOG_LEVEL_DEBUG,
};

#ifndef LABEL_HALFTONE_DEFAULT_LOG_LEVEL
#define LABEL_HALFTONE_DEFAULT_LOG_LEVEL LOG_LEVEL_INFO
#endif

void set_log_level(int level);
int get_log_level();

// printf-style, written to stderr
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

#endif
