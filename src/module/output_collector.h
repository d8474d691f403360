#pragma once
#include <v8.h>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codejail {

/**
 * Console-like surface and single-write final answer slot for one run. Only the isolate thread
 * writes to a collector while the run is active.
 */
class OutputCollector {
	public:
		enum class Stream { Stdout, Stderr };

		static constexpr const char* kTruncatedMarker = "[output truncated]";
		static constexpr const char* kDuplicateFinalAnswer = "finalAnswer called more than once; ignoring subsequent calls";

		OutputCollector(size_t max_lines, size_t max_bytes, std::shared_ptr<spdlog::logger> logger);

		void Append(Stream stream, std::string line);
		// The first call wins. Later calls only log a warning.
		void SetFinalAnswer(std::string text);

		auto GetFinalAnswer() const -> const std::optional<std::string>& { return final_answer; }
		auto GetStdout() const -> const std::vector<std::string>& { return stdout_stream.lines; }
		auto GetStderr() const -> const std::vector<std::string>& { return stderr_stream.lines; }

		// Adds `log`, `error` and `finalAnswer` to the natives object passed to the bootstrap
		void InstallNatives(v8::Local<v8::Context> context, v8::Local<v8::Object> natives);

		// `String(value)`, except that it never throws for values with a throwing `toString`
		static auto Coerce(v8::Local<v8::Value> value) -> std::string;
		// Strings as-is, objects as JSON, everything else as `String(value)`
		static auto CoerceFinalAnswer(v8::Local<v8::Value> value) -> std::string;

	private:
		struct OutputStream {
			std::vector<std::string> lines;
			size_t bytes = 0;
			bool truncated = false;
		};

		template <Stream Which>
		static void Print(const v8::FunctionCallbackInfo<v8::Value>& info);
		static void FinalAnswer(const v8::FunctionCallbackInfo<v8::Value>& info);

		size_t max_lines;
		size_t max_bytes;
		std::shared_ptr<spdlog::logger> logger;
		OutputStream stdout_stream;
		OutputStream stderr_stream;
		std::optional<std::string> final_answer;
};

} // namespace codejail
