#pragma once
#include "isolate/generic/error.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace codejail {

/**
 * Everything the host observes about one run. `error` and `error_kind` are set together; when they
 * are set `final_answer` is absent. Both may be absent if the script finished without answering.
 */
struct SandboxResult {
	std::optional<std::string> final_answer;
	std::optional<std::string> error;
	std::optional<ErrorKind> error_kind;
	std::vector<std::string> stdout_lines;
	std::vector<std::string> stderr_lines;
	std::chrono::milliseconds wall_time{0};

	auto Succeeded() const -> bool { return !error; }
};

} // namespace codejail
