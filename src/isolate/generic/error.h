#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <v8.h>

namespace codejail {

/**
 * JS + C++ exceptions, use with care
 */

// `RuntimeError` can be thrown when v8 already has an exception on deck
class RuntimeError : public std::exception {
	public:
		auto what() const noexcept -> const char* override {
			return "JS exception pending";
		}
};

namespace detail {

// `RuntimeErrorWithMessage` is a general error that has an error message with it
class RuntimeErrorWithMessage : public RuntimeError {
	public:
		explicit RuntimeErrorWithMessage(std::string message) : message{std::move(message)} {}

		auto GetMessage() const {
			return message;
		}

		auto what() const noexcept -> const char* override {
			return message.c_str();
		}

	private:
		std::string message;
};

// `RuntimeErrorConstructible` is a abstract error that can be imported back into v8
class RuntimeErrorConstructible : public RuntimeErrorWithMessage {
	using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
	public:
		virtual auto ConstructError() const -> v8::Local<v8::Value> = 0;
};

// `RuntimeErrorWithConstructor` can be used to construct any of the `v8::Exception` errors
template <v8::Local<v8::Value> (*Error)(v8::Local<v8::String>)>
class RuntimeErrorWithConstructor : public RuntimeErrorConstructible {
	using RuntimeErrorConstructible::RuntimeErrorConstructible;
	public:
		auto ConstructError() const -> v8::Local<v8::Value> final {
			v8::Isolate* isolate = v8::Isolate::GetCurrent();
			v8::MaybeLocal<v8::String> maybe_message = v8::String::NewFromUtf8(isolate, GetMessage().c_str(), v8::NewStringType::kNormal);
			v8::Local<v8::String> message_handle;
			if (maybe_message.ToLocal(&message_handle)) {
				return Error(message_handle);
			}
			// If the MaybeLocal is empty then v8 will have an exception on deck
			return {};
		}
};

} // namespace detail

// `FatalRuntimeError` is for very bad situations when the isolate is now in an unknown state
class FatalRuntimeError : public detail::RuntimeErrorWithMessage {
	using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
};

// These correspond to the given JS error types
using RuntimeGenericError = detail::RuntimeErrorWithConstructor<v8::Exception::Error>;
using RuntimeTypeError = detail::RuntimeErrorWithConstructor<v8::Exception::TypeError>;
using RuntimeRangeError = detail::RuntimeErrorWithConstructor<v8::Exception::RangeError>;

/**
 * Failure categories of a sandbox run. Every error which leaves the sandbox is one of these.
 */
enum class ErrorKind {
	CompileError,
	RuntimeError,
	TimeoutError,
	ResourceError,
	BridgeInstallError,
	ToolInvocationError,
};

class SandboxError : public std::runtime_error {
	public:
		SandboxError(ErrorKind kind, const std::string& message) : std::runtime_error{message}, kind{kind} {}

		auto Kind() const -> ErrorKind {
			return kind;
		}

	private:
		ErrorKind kind;
};

namespace detail {

template <ErrorKind KindValue>
class SandboxErrorOfKind : public SandboxError {
	public:
		explicit SandboxErrorOfKind(const std::string& message) : SandboxError{KindValue, message} {}
};

} // namespace detail

using CompileError = detail::SandboxErrorOfKind<ErrorKind::CompileError>;
using ScriptRuntimeError = detail::SandboxErrorOfKind<ErrorKind::RuntimeError>;
using TimeoutError = detail::SandboxErrorOfKind<ErrorKind::TimeoutError>;
using ResourceError = detail::SandboxErrorOfKind<ErrorKind::ResourceError>;
using BridgeInstallError = detail::SandboxErrorOfKind<ErrorKind::BridgeInstallError>;
using ToolInvocationError = detail::SandboxErrorOfKind<ErrorKind::ToolInvocationError>;

inline auto ErrorKindName(ErrorKind kind) -> const char* {
	switch (kind) {
		case ErrorKind::CompileError: return "CompileError";
		case ErrorKind::RuntimeError: return "RuntimeError";
		case ErrorKind::TimeoutError: return "TimeoutError";
		case ErrorKind::ResourceError: return "ResourceError";
		case ErrorKind::BridgeInstallError: return "BridgeInstallError";
		case ErrorKind::ToolInvocationError: return "ToolInvocationError";
	}
	return "UnknownError";
}

/**
 * Convert a MaybeLocal<T> to Local<T> and throw an error if it's empty. Someone else should throw
 * the v8 exception.
 */
template <class Type>
auto Unmaybe(v8::Maybe<Type> handle) -> Type {
	Type just;
	if (handle.To(&just)) {
		return just;
	} else {
		throw RuntimeError();
	}
}

template <class Type>
auto Unmaybe(v8::MaybeLocal<Type> handle) -> v8::Local<Type> {
	v8::Local<Type> local;
	if (handle.ToLocal(&local)) {
		return local;
	} else {
		throw RuntimeError();
	}
}

namespace detail {

template <class Functor>
inline void RunBarrier(Functor fn) {
	// Runs a function and converts C++ errors to immediate v8 errors. Used at the entry of every
	// native function exposed to the sandbox.
	try {
		fn();
	} catch (const FatalRuntimeError& cc_error) {
		// Execution is terminating
	} catch (const detail::RuntimeErrorConstructible& cc_error) {
		v8::Isolate::GetCurrent()->ThrowException(cc_error.ConstructError());
	} catch (const RuntimeError& cc_error) {
		// A JS error is waiting in the isolate
	} catch (const std::exception& cc_error) {
		// Host failures must not unwind through v8 frames
		v8::Isolate::GetCurrent()->ThrowException(RuntimeGenericError(cc_error.what()).ConstructError());
	}
}

} // namespace detail
} // namespace codejail
