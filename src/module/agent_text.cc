#include "agent_text.h"
#include <array>
#include <string>

namespace codejail {

auto ExtractScriptBlock(const std::string& response) -> std::optional<std::string> {
	static constexpr std::array<const char*, 2> kOpeners{{ "```js\n", "```javascript\n" }};
	size_t fence = response.find("```");
	while (fence != std::string::npos) {
		for (const char* opener : kOpeners) {
			if (response.compare(fence, std::char_traits<char>::length(opener), opener) != 0) {
				continue;
			}
			// The body is never empty, so the closing fence is searched for past its first character
			size_t body = fence + std::char_traits<char>::length(opener);
			size_t close = body < response.size() ? response.find("\n```", body + 1) : std::string::npos;
			if (close == std::string::npos) {
				return std::nullopt;
			}
			return response.substr(body, close - body);
		}
		fence = response.find("```", fence + 3);
	}
	return std::nullopt;
}

auto TruncateText(const std::string& text, size_t max_length) -> std::string {
	if (text.size() <= max_length) {
		return text;
	}
	// Don't split a UTF-8 sequence
	size_t length = max_length;
	while (length > 0 && (static_cast<unsigned char>(text[length]) & 0xc0) == 0x80) {
		--length;
	}
	return text.substr(0, length) + "... (truncated)";
}

} // namespace codejail
