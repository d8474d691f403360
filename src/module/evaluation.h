#pragma once
#include <v8.h>
#include <cstdint>
#include <string>

namespace codejail {

/**
 * Non-v8 holder for script origin information which can be converted to a ScriptOrigin once an
 * isolate is entered.
 */
class ScriptOriginHolder {
	public:
		explicit ScriptOriginHolder(std::string filename = "<sandbox>", int32_t line_offset = 0, int32_t column_offset = 0) :
			filename{std::move(filename)}, line_offset{line_offset}, column_offset{column_offset} {}
		explicit operator v8::ScriptOrigin() const;

		auto GetFilename() const -> const std::string& { return filename; }

	private:
		std::string filename;
		int32_t line_offset;
		int32_t column_offset;
};

/**
 * User code runs inside an async arrow function so that top-level `await` is legal. The opening line
 * of the wrapper holds no user code so user line numbers are recovered with a -1 line offset.
 */
auto WrapAsync(const std::string& code) -> std::string;
constexpr int32_t kWrapAsyncLineOffset = -1;

/**
 * Compiles `code` in the entered context. Syntax errors are thrown as `CompileError` with the engine's
 * message and a `[file:line:column]` decorator, and no JS exception is left pending.
 */
auto CompileScript(const std::string& code, const ScriptOriginHolder& origin) -> v8::Local<v8::Script>;

} // namespace codejail
