#include "bridge_compiler.h"
#include "external_copy/external_copy.h"
#include "isolate/generic/error.h"
#include "isolate/scheduler.h"
#include "isolate/util.h"
#include <algorithm>
#include <array>
#include <utility>

using namespace v8;
namespace codejail {
namespace {

constexpr std::array<const char*, 48> kReservedWords{{
	"arguments", "await", "break", "case", "catch", "class", "const", "continue", "debugger",
	"default", "delete", "do", "else", "enum", "eval", "export", "extends", "false", "finally", "for",
	"function", "if", "implements", "import", "in", "instanceof", "interface", "let", "new", "null",
	"package", "private", "protected", "public", "return", "static", "super", "switch", "this",
	"throw", "true", "try", "typeof", "var", "void", "while", "with", "yield",
}};

// Globals installed by the bootstrap itself
constexpr std::array<const char*, 4> kSandboxBindings{{ "console", "finalAnswer", "global", "globalThis" }};

auto IsIdentifierStart(char ch) -> bool {
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_' || ch == '$';
}

auto IsIdentifierPart(char ch) -> bool {
	return IsIdentifierStart(ch) || (ch >= '0' && ch <= '9');
}

/**
 * Delivers a capability outcome on the isolate thread
 */
class SettleTask final : public Runnable {
	public:
		SettleTask(BridgeCompiler& bridge, uint32_t id, CapabilityOutcome outcome) :
			bridge{bridge}, id{id}, outcome{std::move(outcome)} {}

		void Run() final {
			bridge.Settle(id, std::move(outcome));
		}

	private:
		BridgeCompiler& bridge;
		uint32_t id;
		CapabilityOutcome outcome;
};

} // anonymous namespace

BridgeCompiler::BridgeCompiler(CapabilityMap capabilities, std::shared_ptr<spdlog::logger> logger) :
	capabilities{std::move(capabilities)}, logger{std::move(logger)} {}

void BridgeCompiler::ValidateName(const std::string& name) {
	if (name.empty()) {
		throw BridgeInstallError{"Capability name must not be empty"};
	}
	if (!IsIdentifierStart(name[0]) || !std::all_of(name.begin() + 1, name.end(), IsIdentifierPart)) {
		throw BridgeInstallError{"Capability name '" + name + "' is not a valid identifier"};
	}
	auto matches = [&](const char* word) { return name == word; };
	if (std::any_of(kReservedWords.begin(), kReservedWords.end(), matches)) {
		throw BridgeInstallError{"Capability name '" + name + "' is a reserved word"};
	}
	if (std::any_of(kSandboxBindings.begin(), kSandboxBindings.end(), matches)) {
		throw BridgeInstallError{"Capability name '" + name + "' collides with a sandbox binding"};
	}
}

void BridgeCompiler::Validate(Local<Context> context) const {
	Local<Object> global = context->Global();
	for (const auto& entry : capabilities) {
		ValidateName(entry.first);
		if (entry.second.GetName() != entry.first) {
			throw BridgeInstallError{
				"Capability '" + entry.second.GetName() + "' is registered under the name '" + entry.first + "'"};
		}
		if (Unmaybe(global->Has(context, v8_string(entry.first)))) {
			throw BridgeInstallError{"Capability name '" + entry.first + "' would shadow an existing global"};
		}
	}
}

auto BridgeCompiler::GenerateBootstrap() const -> std::string {
	std::string source =
		"(function (natives) {\n"
		"\t'use strict';\n"
		"\tconst define = (name, value) => Object.defineProperty(globalThis, name, {\n"
		"\t\tvalue, writable: false, enumerable: false, configurable: false,\n"
		"\t});\n"
		"\tconst { invoke, log, error, finalAnswer } = natives;\n"
		"\tdefine('console', Object.freeze({ log, info: log, debug: log, error, warn: error }));\n"
		"\tdefine('finalAnswer', finalAnswer);\n"
		"\tObject.defineProperty(globalThis, 'global', {\n"
		"\t\tvalue: globalThis, writable: true, enumerable: false, configurable: true,\n"
		"\t});\n";
	for (const auto& entry : capabilities) {
		// Names are validated identifiers so they can be pasted in as-is
		const auto& name = entry.first;
		source += "\tdefine('" + name + "', async function " + name + "(...args) {\n";
		source += "\t\treturn invoke('" + name + "', args);\n";
		source += "\t});\n";
	}
	source += "})";
	return source;
}

void BridgeCompiler::InstallNatives(Local<Context> context, Local<Object> natives, const std::shared_ptr<Scheduler>& scheduler) {
	Isolate* isolate = context->GetIsolate();
	this->scheduler = scheduler;
	Local<Function> invoke = Unmaybe(Function::New(context, Dispatch, External::New(isolate, this), 2));
	Unmaybe(natives->Set(context, v8_symbol("invoke"), invoke));
}

void BridgeCompiler::Dispatch(const FunctionCallbackInfo<v8::Value>& info) {
	detail::RunBarrier([&]() {
		auto* that = static_cast<BridgeCompiler*>(info.Data().As<External>()->Value());
		if (info.Length() < 2 || !info[0]->IsString()) {
			throw RuntimeTypeError("Invalid capability call");
		}
		info.GetReturnValue().Set(that->Invoke(std_string(info.GetIsolate(), info[0]), info[1]));
	});
}

auto BridgeCompiler::Invoke(const std::string& name, Local<v8::Value> arguments) -> Local<Promise> {
	Isolate* isolate = Isolate::GetCurrent();
	Local<Context> context = isolate->GetCurrentContext();
	auto handle = capabilities.find(name);
	if (released || handle == capabilities.end()) {
		throw RuntimeGenericError("Capability '" + name + "' has been released");
	}
	if (!arguments->IsArray()) {
		throw RuntimeTypeError("Invalid capability call");
	}
	ValueList copied = ExternalCopy::Copy(arguments).GetArray();

	Local<Promise::Resolver> resolver = Unmaybe(Promise::Resolver::New(context));
	uint32_t id = next_id++;
	resolvers.emplace(id, Global<Promise::Resolver>{isolate, resolver});

	auto state = std::make_shared<CapabilityPromise::State>();
	state->name = name;
	state->scheduler = scheduler;
	state->logger = logger;
	state->make_task = [this, id](CapabilityOutcome outcome) -> std::unique_ptr<Runnable> {
		return std::make_unique<SettleTask>(*this, id, std::move(outcome));
	};
	logger->debug("capability '{}' called with {} argument(s)", name, copied.size());
	handle->second.Invoke(std::move(copied), CapabilityPromise{std::move(state)});
	return resolver->GetPromise();
}

void BridgeCompiler::Settle(uint32_t id, CapabilityOutcome outcome) {
	auto it = resolvers.find(id);
	if (it == resolvers.end()) {
		return;
	}
	Isolate* isolate = Isolate::GetCurrent();
	Local<Context> context = isolate->GetCurrentContext();
	Local<Promise::Resolver> resolver = Deref(it->second);
	resolvers.erase(it);
	if (outcome.error) {
		Local<Object> error = Exception::Error(v8_string(*outcome.error)).As<Object>();
		Unmaybe(error->Set(context, v8_symbol("name"), v8_symbol("ToolInvocationError")));
		Unmaybe(resolver->Reject(context, error));
	} else {
		Unmaybe(resolver->Resolve(context, ExternalCopy::CopyInto(outcome.value)));
	}
}

void BridgeCompiler::Release() {
	if (!released) {
		logger->debug("releasing {} capability binding(s), {} call(s) in flight", capabilities.size(), resolvers.size());
	}
	released = true;
	resolvers.clear();
	capabilities.clear();
}

} // namespace codejail
