#pragma once
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

enum class LogLevel { Info, Warning, Error };

// Asynchronous logger that writes timestamped lines to stderr and
// qrstudio.log in the working directory.
class Logger {
public:
  // Access singleton instance, creating log file on first use.
  static Logger &Instance();

  // Queue a message to be logged.
  void Log(const std::string &msg, LogLevel level = LogLevel::Info);
  void Warn(const std::string &msg) { Log(msg, LogLevel::Warning); }
  void Error(const std::string &msg) { Log(msg, LogLevel::Error); }

  // Blocks until every queued line has been written.
  void Flush();

  static const char *LevelName(LogLevel level);

private:
  Logger();
  ~Logger();
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void Worker();

  std::ofstream file_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable drained_;
  std::queue<std::string> queue_;
  bool writing_ = false;
  bool done_ = false;
  std::thread worker_;
};
