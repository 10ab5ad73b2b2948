/// @file Log.h
/// @brief Minimal printf-style logging for examples
/// @note NOT part of the library - examples only
#pragma once

#include <cstdio>

#ifndef ENVSENSE_LOG_LEVEL
#define ENVSENSE_LOG_LEVEL 3  // 0=error, 1=warn, 2=info, 3=debug
#endif

#define ENVSENSE_LOG_AT(level, tag, fmt, ...)                          \
  do {                                                                 \
    if ((level) <= ENVSENSE_LOG_LEVEL) {                               \
      std::fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__);      \
    }                                                                  \
  } while (0)

#define LOGE(fmt, ...) ENVSENSE_LOG_AT(0, "E", fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) ENVSENSE_LOG_AT(1, "W", fmt, ##__VA_ARGS__)
#define LOGI(fmt, ...) ENVSENSE_LOG_AT(2, "I", fmt, ##__VA_ARGS__)
#define LOGD(fmt, ...) ENVSENSE_LOG_AT(3, "D", fmt, ##__VA_ARGS__)
