#ifndef SCREEN_T
#define SCREEN_T

#include "error_t.h"
#include "item_t.h"
#include "query_t.h"
#include "release_t.h"
#include "result_page_t.h"

#include <memory>
#include <string>
#include <variant>

// ============================================================================
// Screens
// ============================================================================

// Screens are values. Changing page builds a new screen; nothing is
// mutated once a screen has been rendered.

struct Screen;
using ScreenPtr = std::shared_ptr<const Screen>;

struct SearchScreen {};

struct ResultsScreen {
	CompiledQuery query    = {};
	ResultPage<Item> page  = {};
};

struct ItemScreen {
	Item item                                       = {};
	std::shared_ptr<const ResultPage<Release>> releases = {}; // full listing
	size_t release_page                             = 0;
	ResultsScreen parent                            = {};
};

struct ReleaseScreen {
	std::shared_ptr<const ResultPage<Release>> releases = {};
	size_t index                                    = 0; // into releases->items
	ScreenPtr parent                                = {};
	std::string item_slug                           = {};

	[[nodiscard]] const Release& release() const { return releases->items.at(index); }
};

struct MessageScreen {
	std::string text = {};
	ScreenPtr parent = {};
};

struct ErrorScreen {
	Error error      = {};
	ScreenPtr parent = {};
};

struct QuitScreen {};

using ScreenState = std::variant<SearchScreen, ResultsScreen, ItemScreen, ReleaseScreen,
                                 MessageScreen, ErrorScreen, QuitScreen>;

struct Screen {
	ScreenState state = SearchScreen{};
};

template <typename T>
[[nodiscard]] ScreenPtr make_screen(T state)
{
	return std::make_shared<const Screen>(Screen{std::move(state)});
}

template <typename T>
[[nodiscard]] bool holds(const Screen& screen)
{
	return std::holds_alternative<T>(screen.state);
}

#endif
