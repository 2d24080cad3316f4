#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>

namespace libnarmax {
namespace utils {

/**
 * @brief Process-wide logger for identification runs
 *
 * Lines go to stderr as "[time] [narmax/LEVEL] file:line - message". The
 * threshold comes from NARMAX_LOG_LEVEL (trace, debug, info, warn, error,
 * none) on first use, or from SetLogLevel(). Durations measured with the
 * timing macros are logged at DEBUG. Safe to use from concurrent fits: the
 * threshold is atomic and the environment is read exactly once.
 *
 * Example usage:
 *   NARMAX_DEBUG("Selected " << name << " with ERR " << err);
 *   NARMAX_TIMING_START();
 *   // ... do work ...
 *   NARMAX_TIMING_END("FROLS selection");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/// Read NARMAX_LOG_LEVEL once; later calls do nothing
	static void Initialize();

	/// Override the threshold (takes precedence over the environment)
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	/**
	 * @brief Parse a level name as accepted by NARMAX_LOG_LEVEL (case-insensitive)
	 *
	 * @return false (level untouched) for an unrecognized name
	 */
	static bool ParseLevel(const std::string &name, LogLevel &level);

	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Write one line tagged with the basename of file and the line number
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	static std::string GetTimestamp();

	/// Steady-clock tick count used as a timing handle
	static uint64_t TimingStart();

	/**
	 * @brief Log "<operation_name> completed in X ms" at DEBUG
	 *
	 * @return Elapsed milliseconds since TimingStart() returned handle
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static std::atomic<LogLevel> current_level_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define NARMAX_LOG_AT(level, msg)                                                                                      \
	do {                                                                                                               \
		if (libnarmax::utils::Tracer::ShouldLog(level)) {                                                              \
			std::ostringstream oss;                                                                                    \
			oss << msg;                                                                                                \
			libnarmax::utils::Tracer::Log(level, __FILE__, __LINE__, oss.str());                                       \
		}                                                                                                              \
	} while (0)

/**
 * @brief Stream-style logging macros
 *
 * Usage: NARMAX_DEBUG("round " << r << " selected " << name)
 */
#define NARMAX_TRACE(msg) NARMAX_LOG_AT(libnarmax::utils::LogLevel::TRACE, msg)
#define NARMAX_DEBUG(msg) NARMAX_LOG_AT(libnarmax::utils::LogLevel::DBG, msg)
#define NARMAX_INFO(msg)  NARMAX_LOG_AT(libnarmax::utils::LogLevel::INFO, msg)
#define NARMAX_WARN(msg)  NARMAX_LOG_AT(libnarmax::utils::LogLevel::WARN, msg)
#define NARMAX_ERROR(msg) NARMAX_LOG_AT(libnarmax::utils::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   NARMAX_TIMING_START();
 *   // ... do work ...
 *   NARMAX_TIMING_END("Operation name");
 */
#define NARMAX_TIMING_START() uint64_t __narmax_timing_handle = libnarmax::utils::Tracer::TimingStart()

#define NARMAX_TIMING_END(operation_name) libnarmax::utils::Tracer::TimingEnd(__narmax_timing_handle, operation_name)

} // namespace utils
} // namespace libnarmax
