#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace anchorfit::common {

enum class LogLevel { TRACE = 0, DEBUG, INFO, WARN, ERROR };

inline const char* lvlstr(LogLevel l) {
  switch (l) {
    case LogLevel::TRACE: return "TRACE";
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    default: return "ERROR";
  }
}

/**
 * @brief Logging sink handed to every component that reports progress
 *
 * Components never write to a global logger; the caller owns the sink.
 */
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual bool enabled(LogLevel level) const = 0;
  virtual void log(LogLevel level, const char* file, int line, const std::string& message) = 0;
};

class StderrLogger : public ILogger {
public:
  explicit StderrLogger(LogLevel level = LogLevel::INFO) : level_(level) {}

  void setLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
  LogLevel level() const { return level_.load(std::memory_order_relaxed); }

  bool enabled(LogLevel level) const override { return level >= this->level(); }

  void log(LogLevel level, const char* file, int line, const std::string& message) override {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    struct tm tm_buf;
#if defined(_WIN32) || defined(_WIN64)
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    std::lock_guard<std::mutex> lk(mu_);
    std::cerr << "[" << lvlstr(level) << "] " << std::put_time(&tm_buf, "%F %T") << " " << file
              << ":" << line << " | " << message << "\n";
  }

private:
  std::atomic<LogLevel> level_;
  std::mutex mu_;
};

/// Discards everything; handy default for library callers that do not care.
class NullLogger : public ILogger {
public:
  bool enabled(LogLevel) const override { return false; }
  void log(LogLevel, const char*, int, const std::string&) override {}
};

template <typename... A>
inline void write(ILogger& logger, LogLevel l, const char* file, int line, const A&... a) {
  if (!logger.enabled(l)) return;
  std::ostringstream os;
  (void)std::initializer_list<int>{(os << a, 0)...};
  logger.log(l, file, line, os.str());
}

LogLevel parseLogLevel(const std::string& level_name, bool* ok = nullptr);

}  // namespace anchorfit::common

#define AF_LOGT(lg, ...) ::anchorfit::common::write((lg), ::anchorfit::common::LogLevel::TRACE, __FILE__, __LINE__, __VA_ARGS__)
#define AF_LOGD(lg, ...) ::anchorfit::common::write((lg), ::anchorfit::common::LogLevel::DEBUG, __FILE__, __LINE__, __VA_ARGS__)
#define AF_LOGI(lg, ...) ::anchorfit::common::write((lg), ::anchorfit::common::LogLevel::INFO, __FILE__, __LINE__, __VA_ARGS__)
#define AF_LOGW(lg, ...) ::anchorfit::common::write((lg), ::anchorfit::common::LogLevel::WARN, __FILE__, __LINE__, __VA_ARGS__)
#define AF_LOGE(lg, ...) ::anchorfit::common::write((lg), ::anchorfit::common::LogLevel::ERROR, __FILE__, __LINE__, __VA_ARGS__)
