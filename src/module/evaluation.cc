#include "evaluation.h"
#include "external_copy/external_copy.h"
#include "isolate/generic/error.h"
#include "isolate/util.h"

using namespace v8;
namespace codejail {

/**
 * ScriptOriginHolder implementation
 */
ScriptOriginHolder::operator ScriptOrigin() const {
	return ScriptOrigin{
		Isolate::GetCurrent(),
		v8_string(filename),
		line_offset,
		column_offset,
	};
}

auto WrapAsync(const std::string& code) -> std::string {
	// The closing line is separate so a trailing `//` comment in user code can't swallow it
	return "(async () => {\n" + code + "\n})()";
}

auto CompileScript(const std::string& code, const ScriptOriginHolder& origin) -> Local<Script> {
	Isolate* isolate = Isolate::GetCurrent();
	Local<Context> context = isolate->GetCurrentContext();
	TryCatch try_catch{isolate};
	ScriptOrigin script_origin{origin};
	ScriptCompiler::Source source{v8_string(code), script_origin};
	Local<Script> script;
	if (ScriptCompiler::Compile(context, &source).ToLocal(&script)) {
		return script;
	}
	if (!try_catch.HasCaught() || try_catch.HasTerminated()) {
		throw FatalRuntimeError("Compilation was interrupted");
	}

	// Annotate the engine's message with the location of the error
	std::string message = ExternalCopy::CopyThrownValue(try_catch.Exception());
	Local<Message> info = try_catch.Message();
	if (!info.IsEmpty()) {
		int line = info->GetLineNumber(context).FromMaybe(0);
		int column = info->GetStartColumn(context).FromMaybe(0);
		message += " [" + origin.GetFilename() + ":" + std::to_string(line) + ":" + std::to_string(column + 1) + "]";
	}
	try_catch.Reset();
	throw CompileError{message};
}

} // namespace codejail
