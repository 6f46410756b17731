/**
 * @file Logger.h
 * @brief Explicit, context-tagged progress and diagnostic reporting
 *
 * Loggers are passed through call parameters rather than looked up globally.
 * Copies share one output sink so lines written from concurrent block tasks
 * never interleave.
 */

#ifndef BLOCKFUSE_LOGGER_H
#define BLOCKFUSE_LOGGER_H

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace blockfuse {

class Logger {
public:
  enum class Level { Debug = 0, Info = 1, Warning = 2, Error = 3, Silent = 4 };

private:
  struct Sink {
    std::ostream *out;
    std::ostream *err;
    std::mutex mutex;
  };

  std::shared_ptr<Sink> m_sink;
  Level m_level;
  std::string m_context;

public:
  // Info and debug to std::cout, warnings and errors to std::cerr
  explicit Logger(Level level = Level::Info);
  Logger(Level level, std::ostream &out, std::ostream &err);

  /**
   * @brief Derive a logger that tags every line with an additional context
   *
   * Contexts nest, e.g. "[register] [0,1,2] message".
   */
  Logger WithContext(const std::string &context) const;

  void Debug(const std::string &message) const;
  void Info(const std::string &message) const;
  void Warning(const std::string &message) const;
  void Error(const std::string &message) const;

  bool IsEnabled(Level level) const { return level >= m_level; }
  Level GetLevel() const { return m_level; }
  void SetLevel(Level level) { m_level = level; }
  const std::string &GetContext() const { return m_context; }

  static std::string LevelToString(Level level);

  // Logger that drops everything
  static Logger Silent();

private:
  void Write(Level level, const std::string &message) const;
};

} // namespace blockfuse

#endif // BLOCKFUSE_LOGGER_H
