/**
 * @file Logger.cpp
 * @brief Implementation of the context-tagged logger
 */

#include "Logger.h"

namespace blockfuse {

Logger::Logger(Level level) : Logger(level, std::cout, std::cerr) {}

Logger::Logger(Level level, std::ostream &out, std::ostream &err)
    : m_sink(std::make_shared<Sink>()), m_level(level) {
  m_sink->out = &out;
  m_sink->err = &err;
}

Logger Logger::WithContext(const std::string &context) const {
  Logger child(*this);
  if (!context.empty()) {
    child.m_context = m_context.empty() ? "[" + context + "]"
                                        : m_context + " [" + context + "]";
  }
  return child;
}

void Logger::Debug(const std::string &message) const {
  Write(Level::Debug, message);
}

void Logger::Info(const std::string &message) const {
  Write(Level::Info, message);
}

void Logger::Warning(const std::string &message) const {
  Write(Level::Warning, message);
}

void Logger::Error(const std::string &message) const {
  Write(Level::Error, message);
}

std::string Logger::LevelToString(Level level) {
  switch (level) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warning:
    return "WARNING";
  case Level::Error:
    return "ERROR";
  default:
    return "SILENT";
  }
}

Logger Logger::Silent() { return Logger(Level::Silent); }

void Logger::Write(Level level, const std::string &message) const {
  if (!IsEnabled(level) || level == Level::Silent) {
    return;
  }

  std::ostream &stream = level >= Level::Warning ? *m_sink->err : *m_sink->out;

  std::lock_guard<std::mutex> lock(m_sink->mutex);
  stream << LevelToString(level) << ": ";
  if (!m_context.empty()) {
    stream << m_context << " ";
  }
  stream << message << std::endl;
}

} // namespace blockfuse
