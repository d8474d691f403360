#include "value.h"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace codejail {
namespace {

auto NumberToString(double number) -> std::string {
	if (std::isnan(number)) {
		return "NaN";
	} else if (std::isinf(number)) {
		return number > 0 ? "Infinity" : "-Infinity";
	} else if (number == 0) {
		// Includes -0
		return "0";
	} else if (std::trunc(number) == number && std::fabs(number) < 1e21) {
		return fmt::format("{:.0f}", number);
	}
	return fmt::format("{}", number);
}

void AppendQuoted(std::string& out, const std::string& string) {
	out += '"';
	for (char ch : string) {
		switch (ch) {
			case '"': out += "\\\""; break;
			case '\\': out += "\\\\"; break;
			case '\b': out += "\\b"; break;
			case '\f': out += "\\f"; break;
			case '\n': out += "\\n"; break;
			case '\r': out += "\\r"; break;
			case '\t': out += "\\t"; break;
			default:
				if (static_cast<unsigned char>(ch) < 0x20) {
					out += fmt::format("\\u{:04x}", static_cast<unsigned>(ch));
				} else {
					out += ch;
				}
		}
	}
	out += '"';
}

} // anonymous namespace

void Value::AppendJson(std::string& out) const {
	switch (GetType()) {
		case Type::Null:
			out += "null";
			break;
		case Type::Boolean:
			out += GetBoolean() ? "true" : "false";
			break;
		case Type::Number:
			// JSON has no representation for NaN or Infinity
			out += std::isfinite(GetNumber()) ? NumberToString(GetNumber()) : "null";
			break;
		case Type::String:
			AppendQuoted(out, GetString());
			break;
		case Type::Array: {
			out += '[';
			bool first = true;
			for (const auto& element : GetArray()) {
				if (!first) {
					out += ',';
				}
				first = false;
				element.AppendJson(out);
			}
			out += ']';
			break;
		}
		case Type::Object: {
			out += '{';
			bool first = true;
			for (const auto& entry : GetObject()) {
				if (!first) {
					out += ',';
				}
				first = false;
				AppendQuoted(out, entry.first);
				out += ':';
				entry.second.AppendJson(out);
			}
			out += '}';
			break;
		}
	}
}

auto Value::ToJson() const -> std::string {
	std::string out;
	AppendJson(out);
	return out;
}

auto Value::ToString() const -> std::string {
	switch (GetType()) {
		case Type::Null: return "null";
		case Type::Boolean: return GetBoolean() ? "true" : "false";
		case Type::Number: return NumberToString(GetNumber());
		case Type::String: return GetString();
		default: return ToJson();
	}
}

} // namespace codejail
