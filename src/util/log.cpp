/*
 * This file is part of HexiLink.
 * (C) 2025 HexiLink contributors
 */
#include "log.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <mutex>

namespace hexilink {
namespace log {

namespace {

std::mutex g_log_mutex;
Sink g_sink;

void write_all(int fd, const char* data, size_t len) {
  while (len > 0) {
    const ssize_t written = ::write(fd, data, len);
    if (written <= 0) {
      return;
    }
    data += static_cast<size_t>(written);
    len -= static_cast<size_t>(written);
  }
}

void stderr_sink(Level level, const char* tag, const char* message) {
  char line[HEXILINK_LOG_LINE_SIZE + 32];
  int n = snprintf(line, sizeof(line), "[%s] %s: %s\n", levelName(level), tag, message);
  if (n <= 0) {
    return;
  }
  size_t len = static_cast<size_t>(n);
  if (len >= sizeof(line)) {
    len = sizeof(line) - 1;
    line[len - 1] = '\n';
  }
  write_all(STDERR_FILENO, line, len);
}

}  // namespace

void setSink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_sink = sink;
}

void resetSink() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_sink = Sink();
}

void write(Level level, const char* tag, const char* format, ...) {
  char message[HEXILINK_LOG_LINE_SIZE];
  va_list args;
  va_start(args, format);
  int n = vsnprintf(message, sizeof(message), format, args);
  va_end(args);
  if (n < 0) {
    return;
  }

  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_sink.is_valid()) {
    g_sink(level, tag ? tag : "", message);
  } else {
    stderr_sink(level, tag ? tag : "", message);
  }
}

void hexdump(const char* tag, const char* label, const uint8_t* data, size_t length) {
  if (HEXILINK_LOG_LEVEL < 4) {
    return;
  }
  // 3 chars per byte; the longest GHI frame is 28 bytes.
  char text[3 * 32 + 1];
  size_t pos = 0;
  for (size_t i = 0; i < length && pos + 4 <= sizeof(text); ++i) {
    pos += static_cast<size_t>(snprintf(text + pos, sizeof(text) - pos, "%02x ", data[i]));
  }
  text[pos] = '\0';
  write(Level::LEVEL_DEBUG, tag, "%s: %s", label, text);
}

const char* levelName(Level level) {
  switch (level) {
    case Level::LEVEL_ERROR: return "E";
    case Level::LEVEL_WARN: return "W";
    case Level::LEVEL_INFO: return "I";
    case Level::LEVEL_DEBUG: return "D";
  }
  return "?";
}

}  // namespace log
}  // namespace hexilink
