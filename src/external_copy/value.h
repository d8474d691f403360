#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace codejail {

class Value;
using ValueList = std::vector<Value>;
using ValueMap = std::map<std::string, Value>;

/**
 * Host-side copy of a JSON-like value. This is the only kind of data which crosses the sandbox
 * boundary in either direction. Object keys are kept sorted.
 */
class Value {
	public:
		enum class Type { Null, Boolean, Number, String, Array, Object };

		Value() = default;
		Value(std::nullptr_t /*null*/) {} // NOLINT(google-explicit-constructor)
		Value(bool value) : value{value} {} // NOLINT(google-explicit-constructor)
		Value(int value) : value{static_cast<double>(value)} {} // NOLINT(google-explicit-constructor)
		Value(double value) : value{value} {} // NOLINT(google-explicit-constructor)
		Value(const char* value) : value{std::string{value}} {} // NOLINT(google-explicit-constructor)
		Value(std::string value) : value{std::move(value)} {} // NOLINT(google-explicit-constructor)
		Value(ValueList value) : value{std::move(value)} {} // NOLINT(google-explicit-constructor)
		Value(ValueMap value) : value{std::move(value)} {} // NOLINT(google-explicit-constructor)

		auto GetType() const -> Type { return static_cast<Type>(value.index()); }
		auto IsNull() const -> bool { return GetType() == Type::Null; }
		auto IsBoolean() const -> bool { return GetType() == Type::Boolean; }
		auto IsNumber() const -> bool { return GetType() == Type::Number; }
		auto IsString() const -> bool { return GetType() == Type::String; }
		auto IsArray() const -> bool { return GetType() == Type::Array; }
		auto IsObject() const -> bool { return GetType() == Type::Object; }

		// Typed accessors throw `std::bad_variant_access` on type mismatch
		auto GetBoolean() const -> bool { return std::get<bool>(value); }
		auto GetNumber() const -> double { return std::get<double>(value); }
		auto GetString() const -> const std::string& { return std::get<std::string>(value); }
		auto GetArray() const -> const ValueList& { return std::get<ValueList>(value); }
		auto GetObject() const -> const ValueMap& { return std::get<ValueMap>(value); }

		// Renders primitives the way `String(value)` would and containers as compact JSON
		auto ToString() const -> std::string;
		auto ToJson() const -> std::string;

		auto operator==(const Value& that) const -> bool { return value == that.value; }
		auto operator!=(const Value& that) const -> bool { return value != that.value; }

	private:
		void AppendJson(std::string& out) const;

		std::variant<std::nullptr_t, bool, double, std::string, ValueList, ValueMap> value;
};

} // namespace codejail
