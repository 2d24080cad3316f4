#include "libnarmax/utils/tracing.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

namespace libnarmax {
namespace utils {

namespace {

// Release builds only report warnings and errors unless NARMAX_LOG_LEVEL says otherwise
constexpr LogLevel DefaultLevel() {
#ifdef NDEBUG
	return LogLevel::WARN;
#else
	return LogLevel::INFO;
#endif
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
std::mutex g_tracer_mutex;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
std::once_flag g_env_once;

struct LevelName {
	LogLevel level;
	const char *name;
	const char *label;
};

// Accepted NARMAX_LOG_LEVEL values and the labels printed in log lines
const LevelName kLevelNames[] = {
    {LogLevel::TRACE, "trace", "TRACE"}, {LogLevel::DBG, "debug", "DEBUG"}, {LogLevel::INFO, "info", "INFO"},
    {LogLevel::WARN, "warn", "WARN"},    {LogLevel::ERR, "error", "ERROR"}, {LogLevel::NONE, "none", "NONE"},
};

} // namespace

std::atomic<LogLevel> Tracer::current_level_ {DefaultLevel()};

void Tracer::Initialize() {
	std::call_once(g_env_once, [] {
		const char *env_level = std::getenv("NARMAX_LOG_LEVEL");
		LogLevel parsed = DefaultLevel();
		if (env_level != nullptr && ParseLevel(env_level, parsed)) {
			current_level_.store(parsed, std::memory_order_relaxed);
		}
	});
}

bool Tracer::ParseLevel(const std::string &name, LogLevel &level) {
	std::string lower = name;
	for (auto &c : lower) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	for (const auto &entry : kLevelNames) {
		if (lower == entry.name) {
			level = entry.level;
			return true;
		}
	}
	return false;
}

void Tracer::SetLogLevel(LogLevel level) {
	// Consume the environment first so it cannot override this call later
	Initialize();
	current_level_.store(level, std::memory_order_relaxed);
}

LogLevel Tracer::GetLogLevel() {
	Initialize();
	return current_level_.load(std::memory_order_relaxed);
}

bool Tracer::ShouldLog(LogLevel level) {
	Initialize();
	return level >= current_level_.load(std::memory_order_relaxed);
}

std::string Tracer::GetLevelName(LogLevel level) {
	for (const auto &entry : kLevelNames) {
		if (entry.level == level) {
			return entry.label;
		}
	}
	return "UNKNOWN";
}

std::string Tracer::GetTimestamp() {
	using std::chrono::system_clock;
	const system_clock::time_point now = system_clock::now();
	const std::time_t seconds = system_clock::to_time_t(now);
	const long millis = static_cast<long>(
	    std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

	std::tm local {};
	localtime_r(&seconds, &local);

	char buffer[32];
	const size_t len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
	std::snprintf(buffer + len, sizeof(buffer) - len, ".%03ld", millis);
	return buffer;
}

void Tracer::Log(LogLevel level, const std::string &file, int line, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	const size_t last_slash = file.find_last_of("/\\");
	const std::string where = (last_slash == std::string::npos) ? file : file.substr(last_slash + 1);
	LogDirect(level, where + ":" + std::to_string(line) + " - " + message);
}

void Tracer::LogDirect(LogLevel level, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	const std::string line = "[" + GetTimestamp() + "] [narmax/" + GetLevelName(level) + "] " + message + "\n";

	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::cerr << line;
}

uint64_t Tracer::TimingStart() {
	return static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &operation_name) {
	const auto now = static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
	const std::chrono::steady_clock::duration elapsed(static_cast<std::chrono::steady_clock::rep>(now - handle));
	const double duration_ms = std::chrono::duration<double, std::milli>(elapsed).count();

	if (ShouldLog(LogLevel::DBG)) {
		std::ostringstream oss;
		oss << operation_name << " completed in " << std::fixed << std::setprecision(2) << duration_ms << " ms";
		LogDirect(LogLevel::DBG, oss.str());
	}

	return duration_ms;
}

} // namespace utils
} // namespace libnarmax
