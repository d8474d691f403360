#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace codejail {

// Process-wide logger named "codejail". Created on first use with a colored stderr sink.
auto GetLogger() -> std::shared_ptr<spdlog::logger>;

// Replaces the default logger. Passing nullptr restores the stderr logger.
void SetLogger(std::shared_ptr<spdlog::logger> logger);

} // namespace codejail
