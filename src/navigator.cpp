#include "navigator.h"
#include "release_matcher.h"

#include <exception>
#include <sstream>

// ============================================================================
// Navigator
// ============================================================================

namespace {

constexpr std::string_view AllFiles = "all";

[[nodiscard]] ScreenPtr parent_or_search(const ScreenPtr& parent)
{
	return parent ? parent : make_screen(SearchScreen{});
}

[[nodiscard]] Error user_error(std::string message)
{
	return Error{ErrorKind::UserInput, std::move(message)};
}

} // namespace

[[nodiscard]] ScreenPtr error_screen(Error error, ScreenPtr parent)
{
	return make_screen(ErrorScreen{std::move(error), std::move(parent)});
}

Navigator::Navigator(ApiGateway& gateway, const Downloader& downloader,
                     QueryCompiler compiler, ProgressCallback progress)
        : gateway_(gateway),
          downloader_(downloader),
          compiler_(compiler),
          release_page_size_(compiler.page_size()),
          progress_(std::move(progress))
{}

[[nodiscard]] ScreenPtr Navigator::step(const ScreenPtr& current, const std::string_view input)
{
	if (!current) {
		return make_screen(SearchScreen{});
	}

	return std::visit(
	        [&](const auto& screen) -> ScreenPtr {
		        using T = std::decay_t<decltype(screen)>;

		        if constexpr (std::is_same_v<T, SearchScreen>) {
			        return on_search(current, input);
		        } else if constexpr (std::is_same_v<T, ResultsScreen>) {
			        return on_results(current, screen, input);
		        } else if constexpr (std::is_same_v<T, ItemScreen>) {
			        return on_item(current, screen, input);
		        } else if constexpr (std::is_same_v<T, ReleaseScreen>) {
			        return on_release(current, screen, input);
		        } else if constexpr (std::is_same_v<T, MessageScreen> ||
		                             std::is_same_v<T, ErrorScreen>) {
			        return parent_or_search(screen.parent);
		        } else {
			        return current;
		        }
	        },
	        current->state);
}

[[nodiscard]] ScreenPtr Navigator::on_search(const ScreenPtr& self, const std::string_view input)
{
	if (Commands::trim(input) == Commands::Quit) {
		return make_screen(QuitScreen{});
	}

	auto query = compiler_.compile(input, 0);
	if (const auto* error = error_of(query)) {
		return error_screen(*error, self);
	}
	return fetch_page(self, std::get<CompiledQuery>(query));
}

[[nodiscard]] ScreenPtr Navigator::fetch_page(const ScreenPtr& self, const CompiledQuery& query)
{
	auto page = gateway_.search(query);
	if (const auto* error = error_of(page)) {
		return error_screen(*error, self);
	}
	return make_screen(ResultsScreen{query, std::move(std::get<ResultPage<Item>>(page))});
}

[[nodiscard]] ScreenPtr Navigator::on_results(const ScreenPtr& self, const ResultsScreen& screen,
                                              const std::string_view input)
{
	const auto& page = screen.page;

	return std::visit(
	        [&](const auto& command) -> ScreenPtr {
		        using T = std::decay_t<decltype(command)>;

		        if constexpr (std::is_same_v<T, QuitCommand>) {
			        return make_screen(SearchScreen{});
		        } else if constexpr (std::is_same_v<T, PageStep>) {
			        const auto next = wrap_page(static_cast<long long>(page.page_index) +
			                                            command.delta,
			                                    page.page_count);
			        return fetch_page(self, screen.query.at_page(next));
		        } else if constexpr (std::is_same_v<T, GoToPage>) {
			        return fetch_page(self,
			                          screen.query.at_page(wrap_page(command.page - 1,
			                                                         page.page_count)));
		        } else if constexpr (std::is_same_v<T, SelectIndex>) {
			        if (command.index < 1 || command.index > page.items.size()) {
				        return error_screen(user_error("no result numbered " +
				                                       std::to_string(command.index) +
				                                       " on this page"),
				                            self);
			        }
			        return open_item(self, screen, command.index - 1);
		        } else {
			        return error_screen(user_error("unrecognized command \"" +
			                                       command.text + "\""),
			                            self);
		        }
	        },
	        Commands::parse(input));
}

[[nodiscard]] ScreenPtr Navigator::open_item(const ScreenPtr& self, const ResultsScreen& screen,
                                             const size_t index)
{
	const auto& item = screen.page.items[index];

	auto listing = gateway_.list_releases(item.id);
	if (const auto* error = error_of(listing)) {
		return error_screen(*error, self);
	}

	return make_screen(ItemScreen{
	        item,
	        std::make_shared<const ResultPage<Release>>(
	                std::move(std::get<ResultPage<Release>>(listing))),
	        0,
	        screen});
}

[[nodiscard]] ScreenPtr Navigator::on_item(const ScreenPtr& self, const ItemScreen& screen,
                                           const std::string_view input)
{
	const auto page_count = compute_page_count(screen.releases->items.size(),
	                                           release_page_size_);

	// Release listings are paged locally, no request is made here
	const auto at_page = [&](const long long page) {
		ItemScreen next   = screen;
		next.release_page = wrap_page(page, page_count);
		return make_screen(std::move(next));
	};

	return std::visit(
	        [&](const auto& command) -> ScreenPtr {
		        using T = std::decay_t<decltype(command)>;

		        if constexpr (std::is_same_v<T, QuitCommand>) {
			        return make_screen(screen.parent);
		        } else if constexpr (std::is_same_v<T, PageStep>) {
			        return at_page(static_cast<long long>(screen.release_page) + command.delta);
		        } else if constexpr (std::is_same_v<T, GoToPage>) {
			        return at_page(command.page - 1);
		        } else if constexpr (std::is_same_v<T, SelectIndex>) {
			        const auto page = paginate(*screen.releases, screen.release_page,
			                                   release_page_size_);
			        if (command.index < 1 || command.index > page.items.size()) {
				        return error_screen(user_error("no release numbered " +
				                                       std::to_string(command.index) +
				                                       " on this page"),
				                            self);
			        }
			        return make_screen(ReleaseScreen{
			                screen.releases,
			                screen.release_page * release_page_size_ + command.index - 1,
			                self,
			                screen.item.slug});
		        } else {
			        return quick_select(self, screen, command.text);
		        }
	        },
	        Commands::parse(input));
}

[[nodiscard]] ScreenPtr Navigator::quick_select(const ScreenPtr& self, const ItemScreen& screen,
                                                const std::string_view input)
{
	const auto request = ReleaseMatcher::parse_quick_download(input);
	if (!request) {
		return error_screen(user_error("unrecognized command \"" + std::string(input) +
		                               "\""),
		                    self);
	}

	const auto match = ReleaseMatcher::best_match(screen.releases->items, request->version,
	                                              request->loader);
	if (!match) {
		std::string wanted = request->version.value_or("");
		if (request->loader) {
			wanted += (wanted.empty() ? "" : " ") + *request->loader;
		}
		return make_screen(MessageScreen{"No release of " + screen.item.title +
		                                         " matches " + wanted + ".",
		                                 self});
	}

	return make_screen(ReleaseScreen{screen.releases, *match, self, screen.item.slug});
}

[[nodiscard]] ScreenPtr Navigator::on_release(const ScreenPtr& self, const ReleaseScreen& screen,
                                              const std::string_view input)
{
	const auto text = Commands::trim(input);

	if (text.empty()) {
		return download(self, screen, false);
	}
	if (text == AllFiles) {
		return download(self, screen, true);
	}
	return parent_or_search(screen.parent);
}

[[nodiscard]] std::optional<Error> Navigator::resolve_dependencies(const Release& release)
{
	if (release.dependency_items) {
		return std::nullopt;
	}

	std::vector<Item> items = {};
	for (const auto& id : release.dependencies) {
		auto item = gateway_.get_item(id);
		if (const auto* error = error_of(item)) {
			return *error;
		}
		items.push_back(std::move(std::get<Item>(item)));
	}
	release.dependency_items = std::move(items);
	return std::nullopt;
}

[[nodiscard]] ScreenPtr Navigator::download(const ScreenPtr& self, const ReleaseScreen& screen,
                                            const bool all_files)
{
	const auto& release = screen.release();

	if (release.files.empty()) {
		return make_screen(MessageScreen{"Release " + release.version_number +
		                                         " has no files.",
		                                 self});
	}

	// A failed lookup returns to the release listing, not to this release
	if (const auto error = resolve_dependencies(release)) {
		return error_screen(*error, parent_or_search(screen.parent));
	}

	std::vector<std::filesystem::path> written = {};
	try {
		if (all_files) {
			auto result = downloader_.download_all(screen.item_slug, release.files, progress_);
			if (const auto* error = error_of(result)) {
				return error_screen(*error, self);
			}
			written = std::move(std::get<std::vector<std::filesystem::path>>(result));
		} else {
			auto result = downloader_.download(screen.item_slug, *release.primary_file(),
			                                   progress_);
			if (const auto* error = error_of(result)) {
				return error_screen(*error, self);
			}
			written.push_back(std::move(std::get<std::filesystem::path>(result)));
		}
	} catch (const std::exception& e) {
		return error_screen(Error{ErrorKind::Resource, e.what()}, self);
	}

	std::ostringstream text;
	text << "Downloaded " << written.size() << (written.size() == 1 ? " file" : " files")
	     << ":\n";
	for (const auto& path : written) {
		text << "  " << path.string() << '\n';
	}
	if (release.dependency_items && !release.dependency_items->empty()) {
		text << "\nRequired dependencies:\n";
		for (const auto& item : *release.dependency_items) {
			text << "  " << item.title << " (" << item.slug << ")\n";
		}
	}
	return make_screen(MessageScreen{text.str(), self});
}
