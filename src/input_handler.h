#ifndef INPUT_HANDLER_H
#define INPUT_HANDLER_H

#include <istream>
#include <optional>
#include <string>
#include <string_view>

// ============================================================================
// Input Handler
// ============================================================================

// Blocking line input. The terminal stays in canonical mode so the user
// gets normal line editing.
class InputHandler {
	std::istream& in_;

public:
	explicit InputHandler(std::istream& in);

	InputHandler(const InputHandler&)            = delete;
	InputHandler& operator=(const InputHandler&) = delete;

	// nullopt once the input is closed (Ctrl+D).
	[[nodiscard]] std::optional<std::string> read_line(const std::string_view prompt);
};

#endif
