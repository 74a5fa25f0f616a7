#pragma once

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace libsamplestat {
namespace utils {

/**
 * @brief Leveled diagnostic logging for the analysis engine
 *
 * Provides:
 * - Log levels (trace, debug, info, warn, error, none)
 * - Timestamped output to stderr with file/line info
 * - Timing measurements
 * - Thread-safe output
 *
 * Control via environment variable: SAMPLESTAT_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 *
 * Example usage:
 *   SAMPLESTAT_DEBUG("Chi-square merged to " << bins << " bins");
 *   SAMPLESTAT_TIMING_START();
 *   // ... do work ...
 *   SAMPLESTAT_TIMING_END("Sample analysis");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Initialize tracing system
	 *
	 * Reads SAMPLESTAT_LOG_LEVEL environment variable. Runs once per process;
	 * safe to call from any thread.
	 */
	static void Initialize();

	/**
	 * @brief Set global log level
	 *
	 * @param level Minimum level to output
	 */
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	/**
	 * @brief Check if a message at given level should be logged
	 */
	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Parse a level name ("trace", "debug", ...), case-insensitive
	 *
	 * @param name Level name
	 * @param fallback Level returned for unrecognized names
	 */
	static LogLevel ParseLevel(const std::string &name, LogLevel fallback);

	/**
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file name
	 * @param line Source line number
	 * @param message Message content
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
	 * @brief End a timed operation and log duration at debug level
	 *
	 * @param handle Handle from TimingStart()
	 * @param operation_name Human-readable operation name
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static LogLevel DefaultLevel();

	static std::atomic<LogLevel> current_level_;

	Tracer() = delete;
	~Tracer() = delete;
};

} // namespace utils
} // namespace libsamplestat

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define SAMPLESTAT_LOG_AT(level, msg)                                                                                  \
	do {                                                                                                               \
		if (libsamplestat::utils::Tracer::ShouldLog(level)) {                                                          \
			std::ostringstream samplestat_oss_;                                                                        \
			samplestat_oss_ << msg;                                                                                    \
			libsamplestat::utils::Tracer::Log(level, __FILE__, __LINE__, samplestat_oss_.str());                       \
		}                                                                                                              \
	} while (0)

/**
 * @brief Stream-style logging macros
 *
 * Usage: SAMPLESTAT_WARN("Shapiro-Wilk unavailable: " << reason)
 */
#define SAMPLESTAT_TRACE(msg) SAMPLESTAT_LOG_AT(libsamplestat::utils::LogLevel::TRACE, msg)
#define SAMPLESTAT_DEBUG(msg) SAMPLESTAT_LOG_AT(libsamplestat::utils::LogLevel::DBG, msg)
#define SAMPLESTAT_INFO(msg)  SAMPLESTAT_LOG_AT(libsamplestat::utils::LogLevel::INFO, msg)
#define SAMPLESTAT_WARN(msg)  SAMPLESTAT_LOG_AT(libsamplestat::utils::LogLevel::WARN, msg)
#define SAMPLESTAT_ERROR(msg) SAMPLESTAT_LOG_AT(libsamplestat::utils::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   SAMPLESTAT_TIMING_START();
 *   // ... do work ...
 *   SAMPLESTAT_TIMING_END("Operation name");
 */
#define SAMPLESTAT_TIMING_START() uint64_t samplestat_timing_handle_ = libsamplestat::utils::Tracer::TimingStart()

#define SAMPLESTAT_TIMING_END(operation_name)                                                                          \
	libsamplestat::utils::Tracer::TimingEnd(samplestat_timing_handle_, operation_name)
