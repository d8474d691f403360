#include "logging.h"
#include <mutex>
#include <utility>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace codejail {
namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> current_logger;

auto MakeDefaultLogger() -> std::shared_ptr<spdlog::logger> {
	auto existing = spdlog::get("codejail");
	if (existing) {
		return existing;
	}
	return spdlog::stderr_color_mt("codejail");
}

} // anonymous namespace

auto GetLogger() -> std::shared_ptr<spdlog::logger> {
	std::lock_guard<std::mutex> lock{logger_mutex};
	if (!current_logger) {
		current_logger = MakeDefaultLogger();
	}
	return current_logger;
}

void SetLogger(std::shared_ptr<spdlog::logger> logger) {
	std::lock_guard<std::mutex> lock{logger_mutex};
	current_logger = std::move(logger);
}

} // namespace codejail
