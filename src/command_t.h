#ifndef COMMAND_T
#define COMMAND_T

#include "utilities.h"

#include <charconv>
#include <string>
#include <string_view>
#include <variant>

// ============================================================================
// Commands
// ============================================================================

struct QuitCommand {};
struct PageStep {
	int delta = {};
};
struct GoToPage {
	long long page = {}; // 1-based as typed
};
struct SelectIndex {
	size_t index = {}; // 1-based as typed
};
struct FreeText {
	std::string text = {};
};

using Command = std::variant<QuitCommand, PageStep, GoToPage, SelectIndex, FreeText>;

namespace Commands {

constexpr std::string_view Quit     = "q";
constexpr std::string_view Previous = "<";
constexpr std::string_view Next     = ">";
constexpr char PagePrefix           = 'p';

[[nodiscard]] inline std::string_view trim(const std::string_view text)
{
	const auto begin = text.find_first_not_of(" \t\r\n");
	if (begin == std::string_view::npos) {
		return {};
	}
	const auto end = text.find_last_not_of(" \t\r\n");
	return text.substr(begin, end - begin + 1);
}

// Navigation commands shared by the listing screens. Anything else comes
// back as FreeText for the screen to interpret.
[[nodiscard]] inline Command parse(const std::string_view input)
{
	const auto text = trim(input);

	if (text == Quit) {
		return QuitCommand{};
	}
	if (text == Previous) {
		return PageStep{-1};
	}
	if (text == Next) {
		return PageStep{1};
	}
	if (text.size() > 1 && text.front() == PagePrefix && Util::is_digits(text.substr(1))) {
		long long page = 0;
		const auto digits = text.substr(1);
		if (std::from_chars(digits.data(), digits.data() + digits.size(), page).ec ==
		    std::errc{}) {
			return GoToPage{page};
		}
	}
	if (Util::is_digits(text)) {
		size_t index = 0;
		if (std::from_chars(text.data(), text.data() + text.size(), index).ec ==
		    std::errc{}) {
			return SelectIndex{index};
		}
	}
	return FreeText{std::string(text)};
}

} // namespace Commands

#endif
