#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace codejail {

// Body of the first ```js or ```javascript fenced block in an agent response
auto ExtractScriptBlock(const std::string& response) -> std::optional<std::string>;

// Cuts `text` to `max_length` bytes and marks the cut with "... (truncated)"
auto TruncateText(const std::string& text, size_t max_length = 10000) -> std::string;

} // namespace codejail
