#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <string>

namespace bookgraph {

enum class LogLevel { DEBUG, INFO, WARN, ERROR, OFF };

class Logger {
 public:
  static Logger& get_instance() {
    static Logger instance;
    return instance;
  }

  void set_level(LogLevel level) {
    switch (level) {
      case LogLevel::DEBUG:
        spdlog::set_level(spdlog::level::debug);
        break;
      case LogLevel::INFO:
        spdlog::set_level(spdlog::level::info);
        break;
      case LogLevel::WARN:
        spdlog::set_level(spdlog::level::warn);
        break;
      case LogLevel::ERROR:
        spdlog::set_level(spdlog::level::err);
        break;
      case LogLevel::OFF:
        spdlog::set_level(spdlog::level::off);
        break;
    }
  }

  LogLevel get_level() const {
    switch (spdlog::get_level()) {
      case spdlog::level::trace:
      case spdlog::level::debug:
        return LogLevel::DEBUG;
      case spdlog::level::info:
        return LogLevel::INFO;
      case spdlog::level::warn:
        return LogLevel::WARN;
      case spdlog::level::err:
      case spdlog::level::critical:
        return LogLevel::ERROR;
      case spdlog::level::off:
        return LogLevel::OFF;
      default:
        return LogLevel::INFO;
    }
  }

  // Replaces the default console logger; returns false if the file cannot be
  // opened, in which case console logging stays active
  bool set_log_to_file(const std::string& filename) {
    try {
      auto file_sink =
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true);
      auto file_logger =
          std::make_shared<spdlog::logger>("file_logger", file_sink);
      file_logger->set_level(spdlog::get_level());
      spdlog::set_default_logger(file_logger);
      spdlog::set_pattern(kPattern);
      return true;
    } catch (const spdlog::spdlog_ex& ex) {
      spdlog::error("Log initialization failed: {}", ex.what());
      return false;
    }
  }

  // Used by the log_* helpers below
  template <typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::debug(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::info(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::warn(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::error(fmt, std::forward<Args>(args)...);
  }

 private:
  static constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v";

  Logger() { spdlog::set_pattern(kPattern); }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
};

template <typename... Args>
inline void log_debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  Logger::get_instance().debug(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  Logger::get_instance().info(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  Logger::get_instance().warn(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  Logger::get_instance().error(fmt, std::forward<Args>(args)...);
}

// Contextual logger that prefixes every message with an operation name
class ContextLogger {
 public:
  explicit ContextLogger(std::string prefix) : prefix_(std::move(prefix)) {}

  template <typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log_debug("{}: {}", prefix_,
              spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log_info("{}: {}", prefix_,
             spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log_warn("{}: {}", prefix_,
             spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log_error("{}: {}", prefix_,
              spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...));
  }

 private:
  std::string prefix_;
};

}  // namespace bookgraph

#endif  // LOGGER_HPP
