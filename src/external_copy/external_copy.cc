#include "external_copy.h"
#include "isolate/environment.h"
#include "isolate/generic/error.h"
#include "isolate/util.h"
#include <cmath>

using namespace v8;

namespace codejail {
namespace {

auto UncloneableName(Local<v8::Value> value) -> const char* {
	if (value->IsFunction()) {
		return "Function";
	} else if (value->IsSymbol() || value->IsSymbolObject()) {
		return "Symbol";
	} else if (value->IsBigInt() || value->IsBigIntObject()) {
		return "BigInt";
	} else if (value->IsProxy()) {
		return "Proxy";
	} else if (value->IsPromise()) {
		return "Promise";
	} else if (value->IsArrayBuffer() || value->IsSharedArrayBuffer() || value->IsArrayBufferView()) {
		return "ArrayBuffer";
	} else if (value->IsWeakMap() || value->IsWeakSet()) {
		return "WeakMap";
	}
	return nullptr;
}

// Clears a caught exception unless the isolate is being terminated, which must keep unwinding
void ResetUnlessTerminating(TryCatch& try_catch) {
	if (try_catch.HasTerminated()) {
		try_catch.ReThrow();
		throw RuntimeError();
	}
	try_catch.Reset();
}

} // anonymous namespace

auto ExternalCopy::Copy(Local<v8::Value> value) -> Value {
	CopyState state{{}, IsolateEnvironment::GetCurrent()->GetMemoryLimit()};
	return CopyWithStack(value, state);
}

void ExternalCopy::Charge(CopyState& state, size_t bytes) {
	// Sparse arrays and repeated references are cheap in the isolate but not on the host, so the
	// host side copy is held to the isolate's own memory limit
	if (bytes > state.remaining_bytes) {
		throw RuntimeRangeError("Value is too large to be copied out of the isolate");
	}
	state.remaining_bytes -= bytes;
}

auto ExternalCopy::CopyWithStack(Local<v8::Value> value, CopyState& state) -> Value {
	auto& stack = state.stack;
	Isolate* isolate = Isolate::GetCurrent();
	if (value->IsNullOrUndefined()) {
		return {};
	} else if (value->IsBoolean()) {
		return value->IsTrue();
	} else if (value->IsNumber()) {
		double number = value.As<Number>()->Value();
		if (!std::isfinite(number)) {
			return {};
		}
		return number;
	} else if (value->IsString()) {
		Charge(state, static_cast<size_t>(value.As<String>()->Utf8Length(isolate)));
		return std_string(isolate, value);
	}

	const char* uncloneable = UncloneableName(value);
	if (uncloneable != nullptr) {
		throw RuntimeTypeError(std::string{uncloneable} + " could not be cloned");
	} else if (!value->IsObject()) {
		throw RuntimeTypeError("Value could not be cloned");
	} else if (value->IsDate()) {
		double time = value.As<Date>()->ValueOf();
		if (!std::isfinite(time)) {
			return {};
		}
		return std_string(isolate, value.As<Date>()->ToISOString());
	} else if (value->IsStringObject()) {
		return std_string(isolate, value.As<StringObject>()->ValueOf());
	} else if (value->IsNumberObject()) {
		return CopyWithStack(Number::New(isolate, value.As<NumberObject>()->ValueOf()), state);
	} else if (value->IsBooleanObject()) {
		return value.As<BooleanObject>()->ValueOf();
	}

	Local<Object> object = value.As<Object>();
	for (const auto& ancestor : stack) {
		if (ancestor->StrictEquals(object)) {
			throw RuntimeTypeError("Circular structure could not be cloned");
		}
	}
	if (static_cast<int>(stack.size()) >= kMaxDepth) {
		throw RuntimeTypeError("Object nested too deeply could not be cloned");
	}
	Local<Context> context = isolate->GetCurrentContext();
	stack.push_back(object);

	if (object->IsArray()) {
		Local<Array> array = object.As<Array>();
		ValueList elements;
		uint32_t length = array->Length();
		Charge(state, static_cast<size_t>(length) * sizeof(Value));
		elements.reserve(length);
		for (uint32_t ii = 0; ii < length; ++ii) {
			elements.push_back(CopyWithStack(Unmaybe(array->Get(context, ii)), state));
		}
		stack.pop_back();
		return elements;
	}

	ValueMap properties;
	Local<Array> keys = Unmaybe(object->GetOwnPropertyNames(
		context,
		static_cast<PropertyFilter>(PropertyFilter::ONLY_ENUMERABLE | PropertyFilter::SKIP_SYMBOLS),
		KeyConversionMode::kConvertToString
	));
	uint32_t length = keys->Length();
	for (uint32_t ii = 0; ii < length; ++ii) {
		Local<v8::Value> key = Unmaybe(keys->Get(context, ii));
		Local<v8::Value> property = Unmaybe(object->Get(context, key));
		if (property->IsUndefined()) {
			continue;
		}
		std::string name = std_string(isolate, key);
		Charge(state, sizeof(ValueMap::value_type) + name.size());
		properties.emplace(std::move(name), CopyWithStack(property, state));
	}
	stack.pop_back();
	return properties;
}

auto ExternalCopy::CopyInto(const Value& value) -> Local<v8::Value> {
	Isolate* isolate = Isolate::GetCurrent();
	switch (value.GetType()) {
		case Value::Type::Null:
			return Null(isolate);
		case Value::Type::Boolean:
			return Boolean::New(isolate, value.GetBoolean());
		case Value::Type::Number:
			return Number::New(isolate, value.GetNumber());
		case Value::Type::String:
			return v8_string(value.GetString());
		case Value::Type::Array: {
			Local<Context> context = isolate->GetCurrentContext();
			const auto& elements = value.GetArray();
			Local<Array> array = Array::New(isolate, static_cast<int>(elements.size()));
			for (uint32_t ii = 0; ii < elements.size(); ++ii) {
				Unmaybe(array->Set(context, ii, CopyInto(elements[ii])));
			}
			return array;
		}
		case Value::Type::Object: {
			Local<Context> context = isolate->GetCurrentContext();
			Local<Object> object = Object::New(isolate);
			for (const auto& entry : value.GetObject()) {
				Unmaybe(object->CreateDataProperty(context, v8_string(entry.first), CopyInto(entry.second)));
			}
			return object;
		}
	}
	return Undefined(isolate);
}

auto ExternalCopy::CopyThrownValue(Local<v8::Value> value) -> std::string {
	Isolate* isolate = Isolate::GetCurrent();
	Local<Context> context = isolate->GetCurrentContext();
	TryCatch try_catch{isolate};
	if (value->IsObject()) {
		Local<Object> object = value.As<Object>();
		auto get_property = [&](const char* key) -> std::string {
			Local<v8::Value> property;
			if (object->Get(context, v8_symbol(key)).ToLocal(&property) && !property->IsUndefined()) {
				Local<String> string;
				if (property->ToString(context).ToLocal(&string)) {
					return std_string(isolate, string);
				}
			}
			ResetUnlessTerminating(try_catch);
			return {};
		};
		std::string message = get_property("message");
		if (value->IsNativeError() || !message.empty()) {
			std::string name = get_property("name");
			if (name.empty()) {
				return message;
			} else if (message.empty()) {
				return name;
			}
			return name + ": " + message;
		}
	}
	Local<String> string;
	if (!value->IsSymbol() && value->ToString(context).ToLocal(&string)) {
		return std_string(isolate, string);
	}
	ResetUnlessTerminating(try_catch);
	return "An object was thrown from supplied code which could not be converted to a string";
}

} // namespace codejail
