#include "statkit/utils/tracing.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace statkit {
namespace utils {

// Release builds: default to WARN (suppress INFO messages)
// Debug builds: default to INFO (show all non-debug messages)
#ifdef NDEBUG
std::atomic<LogLevel> Tracer::current_level_ {LogLevel::WARN};
#else
std::atomic<LogLevel> Tracer::current_level_ {LogLevel::INFO};
#endif
std::atomic<bool> Tracer::initialized_ {false};

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::mutex g_tracer_mutex;

LogLevel Tracer::DefaultLevel() {
#ifdef NDEBUG
	return LogLevel::WARN;
#else
	return LogLevel::INFO;
#endif
}

LogLevel Tracer::ParseLevel(const std::string &name, LogLevel fallback) {
	std::string level_str = name;
	for (auto &c : level_str) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (level_str == "trace") {
		return LogLevel::TRACE;
	} else if (level_str == "debug") {
		return LogLevel::DBG;
	} else if (level_str == "info") {
		return LogLevel::INFO;
	} else if (level_str == "warn") {
		return LogLevel::WARN;
	} else if (level_str == "error") {
		return LogLevel::ERR;
	} else if (level_str == "none") {
		return LogLevel::NONE;
	}
	return fallback;
}

void Tracer::Initialize() {
	if (initialized_.exchange(true)) {
		return;
	}

	const char *env_level = std::getenv("STATKIT_LOG_LEVEL");
	if (env_level == nullptr) {
		current_level_ = DefaultLevel();
		return;
	}

	current_level_ = ParseLevel(env_level, DefaultLevel());
}

void Tracer::SetLogLevel(LogLevel level) {
	initialized_ = true;
	current_level_ = level;
}

LogLevel Tracer::GetLogLevel() {
	if (!initialized_) {
		Initialize();
	}
	return current_level_.load();
}

bool Tracer::ShouldLog(LogLevel level) {
	if (!initialized_) {
		Initialize();
	}
	return level != LogLevel::NONE && level >= current_level_.load();
}

std::string Tracer::GetLevelName(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "TRACE";
	case LogLevel::DBG:
		return "DEBUG";
	case LogLevel::INFO:
		return "INFO";
	case LogLevel::WARN:
		return "WARN";
	case LogLevel::ERR:
		return "ERROR";
	case LogLevel::NONE:
		return "NONE";
	default:
		return "UNKNOWN";
	}
}

std::string Tracer::GetTimestamp() {
	auto now = std::chrono::system_clock::now();
	auto time = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

	std::tm local_tm {};
	{
		std::lock_guard<std::mutex> lock(g_tracer_mutex);
		local_tm = *std::localtime(&time);
	}

	std::ostringstream oss;
	oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();

	return oss.str();
}

void Tracer::Log(LogLevel level, const std::string &file, int line, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	std::string timestamp = GetTimestamp();
	std::string level_name = GetLevelName(level);

	// Extract filename from full path
	size_t last_slash = file.find_last_of("/\\");
	std::string filename = (last_slash == std::string::npos) ? file : file.substr(last_slash + 1);

	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::cerr << "[" << timestamp << "] [statkit/" << level_name << "] " << filename << ":" << line << " - "
	          << message << '\n';
}

void Tracer::LogDirect(LogLevel level, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	std::string timestamp = GetTimestamp();
	std::string level_name = GetLevelName(level);

	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::cerr << "[" << timestamp << "] [statkit/" << level_name << "] " << message << '\n';
}

uint64_t Tracer::TimingStart() {
	return static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &operation_name) {
	auto end_time = std::chrono::steady_clock::now().time_since_epoch();
	uint64_t end_ticks = static_cast<uint64_t>(end_time.count());
	uint64_t duration_ticks = end_ticks - handle;
	double duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::duration(
	                                                                   static_cast<std::chrono::steady_clock::rep>(duration_ticks)))
	                         .count();

	std::ostringstream oss;
	oss << std::fixed << std::setprecision(2);
	oss << operation_name << " completed in " << duration_ms << " ms";

	LogDirect(LogLevel::DBG, oss.str());

	return duration_ms;
}

} // namespace utils
} // namespace statkit
