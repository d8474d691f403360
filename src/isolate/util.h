#pragma once
#include <string>
#include <v8.h>
#include "generic/error.h"

namespace codejail {

/**
 * Easy strings
 */
inline auto v8_string(const char* string) -> v8::Local<v8::String> {
	return Unmaybe(v8::String::NewFromOneByte(v8::Isolate::GetCurrent(), (const uint8_t*)string, v8::NewStringType::kNormal)); // NOLINT
}

inline auto v8_symbol(const char* string) -> v8::Local<v8::String> {
	return Unmaybe(v8::String::NewFromOneByte(v8::Isolate::GetCurrent(), (const uint8_t*)string, v8::NewStringType::kInternalized)); // NOLINT
}

inline auto v8_string(const std::string& string) -> v8::Local<v8::String> {
	return Unmaybe(v8::String::NewFromUtf8(v8::Isolate::GetCurrent(), string.data(), v8::NewStringType::kNormal, static_cast<int>(string.size())));
}

inline auto std_string(v8::Isolate* isolate, v8::Local<v8::Value> value) -> std::string {
	v8::String::Utf8Value utf8{isolate, value};
	return *utf8 == nullptr ? std::string{} : std::string{*utf8, static_cast<size_t>(utf8.length())};
}

/**
 * Shorthand dereference of Global to Local
 */
template <typename T>
auto Deref(const v8::Global<T>& handle) -> v8::Local<T> {
	return handle.Get(v8::Isolate::GetCurrent());
}

} // namespace codejail
