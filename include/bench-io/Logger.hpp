#pragma once
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace benchio {

/// Process-wide logging. Every line carries a component and a context
/// (usually the device id): "[component] [context] message".
class BenchLogger {
public:
  static BenchLogger &instance();

  /// Create the console and file sinks. An empty log_file disables the file
  /// sink. Calling init() again only updates the level.
  void init(const std::string &log_file = "bench_io.log",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      // Console goes to stderr: stdout belongs to the measurement sink
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      std::vector<spdlog::sink_ptr> sinks{console_sink};
      if (!log_file.empty()) {
        auto file_sink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
      }

      logger_ = std::make_shared<spdlog::logger>("bench-io", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);

      if (!spdlog::get("bench-io")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
  }

  /// Raise or lower the console sink threshold (default info)
  void set_console_level(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_ && !logger_->sinks().empty()) {
      logger_->sinks().front()->set_level(level);
    }
  }

  /// Flush and drop the logger; a later init() recreates the sinks
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
      logger_->flush();
    }
    spdlog::drop("bench-io");
    logger_.reset();
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &context,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &context,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &context,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &context,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &context,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  BenchLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &context, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_ || !logger_->should_log(level))
      return;

    std::string prefix = fmt::format("[{}] [{}] ", component, context);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

/// Parse "trace|debug|info|warn|error|off"; unknown names fall back to info
spdlog::level::level_enum parse_log_level(const std::string &level);

// Convenience macros
#define LOG_TRACE(component, ctx, ...)                                         \
  benchio::BenchLogger::instance().trace(component, ctx, __VA_ARGS__)
#define LOG_DEBUG(component, ctx, ...)                                         \
  benchio::BenchLogger::instance().debug(component, ctx, __VA_ARGS__)
#define LOG_INFO(component, ctx, ...)                                          \
  benchio::BenchLogger::instance().info(component, ctx, __VA_ARGS__)
#define LOG_WARN(component, ctx, ...)                                          \
  benchio::BenchLogger::instance().warn(component, ctx, __VA_ARGS__)
#define LOG_ERROR(component, ctx, ...)                                         \
  benchio::BenchLogger::instance().error(component, ctx, __VA_ARGS__)

} // namespace benchio
