/*
 * This file is part of HexiLink.
 * (C) 2025 HexiLink contributors
 */
#ifndef HEXILINK_LOG_H
#define HEXILINK_LOG_H

#include <stddef.h>
#include <stdint.h>

#include <etl/delegate.h>

#include "config/hexilink_config.h"

namespace hexilink {
namespace log {

enum class Level : uint8_t {
  LEVEL_ERROR = 1,
  LEVEL_WARN = 2,
  LEVEL_INFO = 3,
  LEVEL_DEBUG = 4
};

// Receives one formatted line. The tag and message are only valid for the
// duration of the call.
using Sink = etl::delegate<void(Level, const char*, const char*)>;

// Replaces the output sink. Calls are serialized, so a sink does not need its
// own locking.
void setSink(Sink sink);

// Restores the default sink (stderr).
void resetSink();

void write(Level level, const char* tag, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

// Emits "label: xx xx xx" at debug level.
void hexdump(const char* tag, const char* label, const uint8_t* data, size_t length);

const char* levelName(Level level);

}  // namespace log
}  // namespace hexilink

#define HEXILINK_LOG_AT(level_value, level, tag, ...)                  \
  do {                                                                 \
    if (HEXILINK_LOG_LEVEL >= (level_value)) {                         \
      ::hexilink::log::write(::hexilink::log::Level::level, (tag), __VA_ARGS__); \
    }                                                                  \
  } while (0)

#define HEXILINK_LOGE(tag, ...) HEXILINK_LOG_AT(1, LEVEL_ERROR, tag, __VA_ARGS__)
#define HEXILINK_LOGW(tag, ...) HEXILINK_LOG_AT(2, LEVEL_WARN, tag, __VA_ARGS__)
#define HEXILINK_LOGI(tag, ...) HEXILINK_LOG_AT(3, LEVEL_INFO, tag, __VA_ARGS__)
#define HEXILINK_LOGD(tag, ...) HEXILINK_LOG_AT(4, LEVEL_DEBUG, tag, __VA_ARGS__)

#endif  // HEXILINK_LOG_H
