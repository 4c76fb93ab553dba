#ifndef NAVIGATOR_H
#define NAVIGATOR_H

#include "api_gateway.h"
#include "command_t.h"
#include "downloader.h"
#include "query_compiler.h"
#include "screen_t.h"

#include <string_view>

// ============================================================================
// Navigator
// ============================================================================

// Drives Search -> Results -> Item -> Release. Every step takes the current
// screen and one line of input, performs at most one kind of network work
// and returns the next screen. Failures become Error screens that lead back
// to where the user was.
class Navigator {
	ApiGateway& gateway_;
	const Downloader& downloader_;
	QueryCompiler compiler_;
	size_t release_page_size_ = 20;
	ProgressCallback progress_ = {};

	[[nodiscard]] ScreenPtr on_search(const ScreenPtr& self, const std::string_view input);

	[[nodiscard]] ScreenPtr on_results(const ScreenPtr& self, const ResultsScreen& screen,
	                                   const std::string_view input);

	[[nodiscard]] ScreenPtr on_item(const ScreenPtr& self, const ItemScreen& screen,
	                                const std::string_view input);

	[[nodiscard]] ScreenPtr on_release(const ScreenPtr& self, const ReleaseScreen& screen,
	                                   const std::string_view input);

	[[nodiscard]] ScreenPtr fetch_page(const ScreenPtr& self, const CompiledQuery& query);

	[[nodiscard]] ScreenPtr open_item(const ScreenPtr& self, const ResultsScreen& screen,
	                                  const size_t index);

	[[nodiscard]] ScreenPtr quick_select(const ScreenPtr& self, const ItemScreen& screen,
	                                     const std::string_view input);

	[[nodiscard]] ScreenPtr download(const ScreenPtr& self, const ReleaseScreen& screen,
	                                 const bool all_files);

	[[nodiscard]] std::optional<Error> resolve_dependencies(const Release& release);

public:
	Navigator(ApiGateway& gateway, const Downloader& downloader, QueryCompiler compiler,
	          ProgressCallback progress = {});

	[[nodiscard]] ScreenPtr step(const ScreenPtr& current, const std::string_view input);
};

// Error screen returning to `parent`.
[[nodiscard]] ScreenPtr error_screen(Error error, ScreenPtr parent);

#endif
