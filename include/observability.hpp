#ifndef JSONBCPP_OBSERVABILITY_HPP
#define JSONBCPP_OBSERVABILITY_HPP

#include <atomic>
#include <chrono>
#include <string_view>

#include "exception.hpp"

namespace jsonbcpp {

enum class LogLevel { Debug, Info, Warn, Error };

class ILogger {
public:
  virtual ~ILogger() = default;
  virtual bool log(LogLevel level, std::string_view message,
                   std::string_view operation,
                   std::chrono::microseconds duration, size_t buffer_offset,
                   std::string_view key = "") = 0;
};

class IMetrics {
public:
  virtual ~IMetrics() = default;
  virtual bool record_latency(std::string_view operation, double seconds) = 0;
  virtual bool increment_operation_count(std::string_view operation,
                                         std::string_view status) = 0;
  virtual bool record_bytes_decoded(size_t bytes) = 0;

  // Errors
  virtual bool record_error(ErrorKind kind) = 0;
};

#ifndef JSONBCPP_DISABLE_OBSERVABILITY
// Global atomic pointers for the current logger and metrics implementations.
// The jsonb-cpp library does NOT take ownership of the objects pointed to by
// g_logger or g_metrics. Their lifetime must be managed by the caller.
extern std::atomic<ILogger *> g_logger;
extern std::atomic<IMetrics *> g_metrics;

// Sets the global logger. Passing nullptr restores the null logger.
// The caller is responsible for ensuring the 'logger' object remains valid
// for the entire duration it is set and used by the library.
void set_logger(ILogger *logger);

// Sets the global metrics collector. Passing nullptr restores the null
// collector. Same lifetime rules as set_logger.
void set_metrics(IMetrics *metrics);

// Global atomic log level threshold. Messages with a level lower than this
// threshold will not be processed by the global logger. Defaults to
// LogLevel::Info.
extern std::atomic<LogLevel> g_log_level_threshold;

void set_log_level_threshold(LogLevel level);
#else
// No-op implementations when observability is disabled
inline void set_logger(ILogger *) {}
inline void set_metrics(IMetrics *) {}
inline void set_log_level_threshold(LogLevel) {}
#endif

inline bool log_if_enabled(LogLevel level, std::string_view message,
                           std::string_view operation,
                           std::chrono::microseconds duration,
                           size_t buffer_offset, std::string_view key = "") {
#ifndef JSONBCPP_DISABLE_OBSERVABILITY
  if (level >= g_log_level_threshold.load(std::memory_order_acquire)) {
    ILogger *logger = g_logger.load(std::memory_order_acquire);
    if (logger) {
      return logger->log(level, message, operation, duration, buffer_offset,
                         key);
    }
  }
#endif
  return true;
}

// Runs fn(IMetrics&) against the installed collector.
template <typename Fn> inline void metrics_if_enabled(Fn &&fn) {
#ifndef JSONBCPP_DISABLE_OBSERVABILITY
  IMetrics *metrics = g_metrics.load(std::memory_order_acquire);
  if (metrics) {
    fn(*metrics);
  }
#else
  (void)fn;
#endif
}

} // namespace jsonbcpp

#endif // JSONBCPP_OBSERVABILITY_HPP
