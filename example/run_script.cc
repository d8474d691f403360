// Example host: runs a script file in the sandbox with a few demo capabilities

#include <codejail.h>
#include "lib/timer.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

auto ReadFile(const std::string& path) -> std::string {
	std::ifstream stream{path};
	if (!stream) {
		throw std::runtime_error{"Could not open " + path};
	}
	std::stringstream buffer;
	buffer << stream.rdbuf();
	return buffer.str();
}

auto EndsWith(const std::string& string, const std::string& suffix) -> bool {
	return string.size() >= suffix.size() && string.compare(string.size() - suffix.size(), suffix.size(), suffix) == 0;
}

auto DemoCapabilities() -> codejail::CapabilityMap {
	codejail::CapabilityMap capabilities;

	// `echo(value)` returns its argument
	capabilities.emplace("echo", codejail::CapabilityHandle::FromFunction("echo", [](const codejail::ValueList& args) {
		return args.empty() ? codejail::Value{} : args[0];
	}));

	// `add(...numbers)` sums its arguments
	capabilities.emplace("add", codejail::CapabilityHandle::FromFunction("add", [](const codejail::ValueList& args) {
		double sum = 0;
		for (const auto& arg : args) {
			if (!arg.IsNumber()) {
				throw codejail::ToolInvocationError{"add() only accepts numbers"};
			}
			sum += arg.GetNumber();
		}
		return codejail::Value{sum};
	}));

	// `sleep(ms)` resolves after `ms` milliseconds. It is asynchronous on the host too, so no thread is
	// held while it waits.
	capabilities.emplace("sleep", codejail::CapabilityHandle{"sleep", [](codejail::ValueList args, codejail::CapabilityPromise promise) {
		if (args.empty() || !args[0].IsNumber() || args[0].GetNumber() < 0) {
			promise.Reject("sleep() expects a non-negative number of milliseconds");
			return;
		}
		auto ms = static_cast<uint32_t>(args[0].GetNumber());
		codejail::timer_t::wait_detached(ms, [promise, ms]() {
			promise.Resolve(codejail::Value{static_cast<double>(ms)});
		});
	}});

	return capabilities;
}

} // anonymous namespace

auto main(int argc, char** argv) -> int {
	if (argc < 2) {
		std::cerr << "usage: " << argv[0] << " <script.js|response.md> [timeout_ms]" << std::endl;
		return EXIT_FAILURE;
	}
	std::string code;
	try {
		code = ReadFile(argv[1]);
	} catch (const std::exception& error) {
		std::cerr << error.what() << std::endl;
		return EXIT_FAILURE;
	}
	if (EndsWith(argv[1], ".md")) {
		auto block = codejail::ExtractScriptBlock(code);
		if (!block) {
			std::cerr << "No ```js block found in " << argv[1] << std::endl;
			return EXIT_FAILURE;
		}
		code = *block;
	}
	uint32_t timeout_ms = argc > 2 ? static_cast<uint32_t>(std::strtoul(argv[2], nullptr, 10)) : 0;

	codejail::SandboxService service;
	auto result = service.Run(code, DemoCapabilities(), timeout_ms);
	for (const auto& line : result.stdout_lines) {
		std::cout << line << std::endl;
	}
	for (const auto& line : result.stderr_lines) {
		std::cerr << line << std::endl;
	}
	if (result.final_answer) {
		std::cout << "final answer: " << *result.final_answer << std::endl;
	}
	if (result.error) {
		std::cerr << codejail::ErrorKindName(*result.error_kind) << ": " << *result.error << std::endl;
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}
