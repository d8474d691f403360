#include "output_collector.h"
#include "isolate/generic/error.h"
#include "isolate/util.h"
#include <utility>

using namespace v8;
namespace codejail {
namespace {

// Clears a caught exception unless the isolate is being terminated, which must keep unwinding
void ResetUnlessTerminating(TryCatch& try_catch) {
	if (try_catch.HasTerminated()) {
		try_catch.ReThrow();
		throw RuntimeError();
	}
	try_catch.Reset();
}

} // anonymous namespace

OutputCollector::OutputCollector(size_t max_lines, size_t max_bytes, std::shared_ptr<spdlog::logger> logger) :
	max_lines{max_lines}, max_bytes{max_bytes}, logger{std::move(logger)} {}

void OutputCollector::Append(Stream stream, std::string line) {
	auto& output = stream == Stream::Stdout ? stdout_stream : stderr_stream;
	if (output.truncated) {
		return;
	}
	if (output.lines.size() >= max_lines || output.bytes + line.size() > max_bytes) {
		output.truncated = true;
		output.lines.emplace_back(kTruncatedMarker);
		logger->debug("{} truncated after {} line(s)", stream == Stream::Stdout ? "stdout" : "stderr", output.lines.size() - 1);
		return;
	}
	output.bytes += line.size();
	output.lines.push_back(std::move(line));
}

void OutputCollector::SetFinalAnswer(std::string text) {
	if (final_answer) {
		logger->warn(kDuplicateFinalAnswer);
		return;
	}
	final_answer = std::move(text);
}

void OutputCollector::InstallNatives(Local<Context> context, Local<Object> natives) {
	Isolate* isolate = context->GetIsolate();
	Local<External> data = External::New(isolate, this);
	auto make = [&](FunctionCallback callback) {
		return Unmaybe(Function::New(context, callback, data, 0, ConstructorBehavior::kThrow));
	};
	Unmaybe(natives->Set(context, v8_symbol("log"), make(Print<Stream::Stdout>)));
	Unmaybe(natives->Set(context, v8_symbol("error"), make(Print<Stream::Stderr>)));
	Unmaybe(natives->Set(context, v8_symbol("finalAnswer"), make(FinalAnswer)));
}

auto OutputCollector::Coerce(Local<v8::Value> value) -> std::string {
	Isolate* isolate = Isolate::GetCurrent();
	Local<Context> context = isolate->GetCurrentContext();
	if (value->IsSymbol()) {
		Local<v8::Value> description = value.As<Symbol>()->Description(isolate);
		return "Symbol(" + (description->IsUndefined() ? std::string{} : std_string(isolate, description)) + ")";
	}
	TryCatch try_catch{isolate};
	Local<String> string;
	if (value->ToString(context).ToLocal(&string)) {
		return std_string(isolate, string);
	}
	ResetUnlessTerminating(try_catch);
	if (value->IsObject() && value.As<Object>()->ObjectProtoToString(context).ToLocal(&string)) {
		return std_string(isolate, string);
	}
	ResetUnlessTerminating(try_catch);
	return "[object Object]";
}

auto OutputCollector::CoerceFinalAnswer(Local<v8::Value> value) -> std::string {
	Isolate* isolate = Isolate::GetCurrent();
	if (value->IsString()) {
		return std_string(isolate, value);
	} else if (value->IsObject() && !value->IsFunction()) {
		Local<Context> context = isolate->GetCurrentContext();
		TryCatch try_catch{isolate};
		Local<String> json;
		if (JSON::Stringify(context, value).ToLocal(&json)) {
			// v8 renders an undefined result (from `toJSON`) as "undefined"
			std::string text = std_string(isolate, json);
			if (text != "undefined") {
				return text;
			}
		} else {
			ResetUnlessTerminating(try_catch);
		}
	}
	return Coerce(value);
}

template <OutputCollector::Stream Which>
void OutputCollector::Print(const FunctionCallbackInfo<v8::Value>& info) {
	detail::RunBarrier([&]() {
		auto* that = static_cast<OutputCollector*>(info.Data().As<External>()->Value());
		std::string line;
		for (int ii = 0; ii < info.Length(); ++ii) {
			if (ii != 0) {
				line += ' ';
			}
			line += Coerce(info[ii]);
		}
		that->Append(Which, std::move(line));
	});
}

void OutputCollector::FinalAnswer(const FunctionCallbackInfo<v8::Value>& info) {
	detail::RunBarrier([&]() {
		auto* that = static_cast<OutputCollector*>(info.Data().As<External>()->Value());
		that->SetFinalAnswer(CoerceFinalAnswer(info[0]));
	});
}

} // namespace codejail
