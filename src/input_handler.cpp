#include "input_handler.h"

#include <iostream>

// ============================================================================
// Input Handler
// ============================================================================

InputHandler::InputHandler(std::istream& in) : in_(in) {}

[[nodiscard]] std::optional<std::string> InputHandler::read_line(const std::string_view prompt)
{
	std::cout << prompt << std::flush;

	std::string line = {};
	if (!std::getline(in_, line)) {
		std::cout << '\n';
		return std::nullopt;
	}
	if (!line.empty() && line.back() == '\r') {
		line.pop_back();
	}
	return line;
}
