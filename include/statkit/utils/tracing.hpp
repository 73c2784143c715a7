#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <sstream>

namespace statkit {
namespace utils {

/**
 * @brief Configurable tracing and logging utilities
 *
 * Provides:
 * - Configurable log levels (trace, debug, info, warn, error)
 * - Structured logging with timestamps and file/line info
 * - Performance timing measurements
 * - Environment variable control
 * - Thread-safe output
 *
 * Control via environment variable: STATKIT_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 *
 * Example usage:
 *   STATKIT_DEBUG("Fitting " << rows << " rows");
 *   STATKIT_TIMING_START();
 *   // ... do work ...
 *   STATKIT_TIMING_END("Some operation");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Initialize tracing system
	 *
	 * Reads STATKIT_LOG_LEVEL environment variable. Only the first call has
	 * an effect.
	 */
	static void Initialize();

	/**
	 * @brief Set global log level (overrides the environment)
	 */
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	/**
	 * @brief Check if a message at given level should be logged
	 */
	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param name One of trace, debug, info, warn, error, none
	 * @param fallback Returned for unrecognized names
	 */
	static LogLevel ParseLevel(const std::string &name, LogLevel fallback);

	/**
	 * @brief Level used when nothing is configured
	 *
	 * WARN for release (NDEBUG) builds, INFO otherwise.
	 */
	static LogLevel DefaultLevel();

	/**
	 * @brief Log a message with location information
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	/**
	 * @brief Log a message without location
	 */
	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	static std::string GetTimestamp();

	/**
	 * @brief Start a timed operation
	 *
	 * @return Opaque handle for timing
	 */
	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log duration at DEBUG level
	 *
	 * @param handle Handle from TimingStart()
	 * @param operation_name Human-readable operation name
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static std::atomic<LogLevel> current_level_;
	static std::atomic<bool> initialized_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define STATKIT_LOG_AT(level, msg)                                                                                     \
	do {                                                                                                               \
		if (statkit::utils::Tracer::ShouldLog(level)) {                                                                \
			std::ostringstream statkit_oss_;                                                                           \
			statkit_oss_ << msg;                                                                                       \
			statkit::utils::Tracer::Log(level, __FILE__, __LINE__, statkit_oss_.str());                                \
		}                                                                                                              \
	} while (0)

/**
 * @brief Macro for trace-level logging with stream syntax
 *
 * Usage: STATKIT_TRACE(message << stream << contents)
 */
#define STATKIT_TRACE(msg) STATKIT_LOG_AT(statkit::utils::LogLevel::TRACE, msg)

#define STATKIT_DEBUG(msg) STATKIT_LOG_AT(statkit::utils::LogLevel::DBG, msg)

#define STATKIT_INFO(msg) STATKIT_LOG_AT(statkit::utils::LogLevel::INFO, msg)

#define STATKIT_WARN(msg) STATKIT_LOG_AT(statkit::utils::LogLevel::WARN, msg)

/**
 * @brief Macro for error-level logging with stream syntax
 *
 * Only suppressed when the level is NONE.
 */
#define STATKIT_ERROR(msg)                                                                                             \
	do {                                                                                                               \
		std::ostringstream statkit_oss_;                                                                               \
		statkit_oss_ << msg;                                                                                           \
		statkit::utils::Tracer::Log(statkit::utils::LogLevel::ERR, __FILE__, __LINE__, statkit_oss_.str());            \
	} while (0)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   STATKIT_TIMING_START();
 *   // ... do work ...
 *   STATKIT_TIMING_END("Operation name");
 */
#define STATKIT_TIMING_START() uint64_t statkit_timing_handle_ = statkit::utils::Tracer::TimingStart()

#define STATKIT_TIMING_END(operation_name) statkit::utils::Tracer::TimingEnd(statkit_timing_handle_, operation_name)

} // namespace utils
} // namespace statkit
