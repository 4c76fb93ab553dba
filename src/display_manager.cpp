#include "display_manager.h"
#include "utilities.h"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <ranges>

// ============================================================================
// ANSI Color Codes
// ============================================================================

namespace Color {

using namespace std::string_view_literals;

constexpr auto Reset  = "\033[0m"sv;
constexpr auto Bold   = "\033[1m"sv;
constexpr auto Dim    = "\033[2m"sv;
constexpr auto Cyan   = "\033[96m"sv;
constexpr auto Green  = "\033[92m"sv;
constexpr auto Yellow = "\033[93m"sv;
constexpr auto Red    = "\033[91m"sv;
constexpr auto Gray   = "\033[90m"sv;
} // namespace Color

namespace Display {
constexpr size_t SeparatorLength = 60;
constexpr size_t MaxVersionsShown = 40;
constexpr std::string_view SiteUrl = "https://modrinth.com/";
} // namespace Display

// ============================================================================
// Display Manager
// ============================================================================

using namespace std::string_view_literals;

DisplayManager::DisplayManager(const size_t release_page_size)
        : release_page_size_(release_page_size)
{}

void DisplayManager::render_search(std::ostringstream& buf) const
{
	buf << Color::Bold << Color::Cyan << "modseek"sv << Color::Reset << '\n'
	    << Color::Gray << std::string(Display::SeparatorLength, '=') << Color::Reset << '\n'
	    << "Type search words, filters and an optional sort rule.\n\n"sv
	    << Color::Dim
	    << "  +mod +rp +dp +mp +plugin +shader   project type (-dp excludes)\n"
	    << "  +fabric +forge +neoforge +quilt    loader\n"
	    << "  +server +client +serversupported   platform\n"
	    << "  +v1.20.1   version    +tadventure -tcursed   tag\n"
	    << "  /relevance /downloads /follows /newest /updated\n"sv
	    << Color::Reset << '\n';
}

void DisplayManager::render_item_row(std::ostringstream& buf, const Item& item,
                                     const size_t number) const
{
	std::vector<std::string> loaders = {};
	std::ranges::transform(item.loaders, std::back_inserter(loaders), Util::capitalize);

	buf << Color::Bold << Util::truncate(std::to_string(number), 3) << Color::Reset
	    << ' ' << Util::truncate(item.id, 8)
	    << ' ' << Util::truncate(Util::capitalize(item.kind), 12)
	    << ' ' << Util::truncate(item.title, 30)
	    << ' ' << Util::truncate(item.author, 20)
	    << " ⤓"sv << Util::truncate(Util::group_thousands(item.downloads), 11)
	    << " ♥"sv << Util::truncate(Util::group_thousands(item.follows), 7)
	    << ' ' << Util::truncate(Util::join(loaders, " "), 50, false) << '\n';
}

void DisplayManager::render_results(std::ostringstream& buf, const ResultsScreen& screen) const
{
	const auto& page = screen.page;

	buf << Color::Bold
	    << "#   ID       TYPE         NAME                           AUTHOR               "
	       "DOWNLOADS    FOLLOWS  LOADERS"sv
	    << Color::Reset << '\n';

	if (page.items.empty()) {
		buf << "No matches found.\n"sv;
	}
	for (size_t i = 0; i < page.items.size(); ++i) {
		render_item_row(buf, page.items[i], i + 1);
	}

	buf << Color::Cyan << "Page "sv << (page.page_index + 1) << '/' << page.page_count
	    << " @ "sv << screen.query.page_size << " items/page - "sv
	    << Util::group_thousands(page.total_hits) << " results - Fetched in "sv
	    << Util::group_thousands(static_cast<std::uint64_t>(page.latency.count())) << "ms"sv
	    << Color::Reset << '\n'
	    << Color::Dim << "<number>: Open | < >: Page | p<N>: Go to page | q: New search"sv
	    << Color::Reset << '\n';
}

void DisplayManager::render_release_row(std::ostringstream& buf, const Release& release,
                                        const size_t number) const
{
	buf << Color::Bold << Util::truncate(std::to_string(number), 3) << Color::Reset
	    << ' ' << Util::truncate(Util::capitalize(to_string(release.maturity)), 8)
	    << ' ' << Util::truncate(release.version_number, 20)
	    << ' ' << Util::truncate(release.name, 30)
	    << " ⤓"sv << Util::truncate(Util::group_thousands(release.downloads), 11)
	    << ' ' << Util::truncate(Util::join(release.game_versions, " "), 24)
	    << ' ' << Util::truncate(Util::join(release.loaders, " "), 20)
	    << ' ' << release.files.size() << (release.files.size() == 1 ? " file"sv : " files"sv)
	    << '\n';
}

void DisplayManager::render_item(std::ostringstream& buf, const ItemScreen& screen) const
{
	const auto& item = screen.item;

	std::vector<std::string> loaders = {};
	std::vector<std::string> tags    = {};
	std::ranges::transform(item.loaders, std::back_inserter(loaders), Util::capitalize);
	std::ranges::transform(item.tags, std::back_inserter(tags), Util::capitalize);

	// The API lists versions oldest first
	std::vector<std::string> versions(item.game_versions.rbegin(), item.game_versions.rend());
	const bool more_versions = versions.size() > Display::MaxVersionsShown;
	versions.resize(std::min(versions.size(), Display::MaxVersionsShown));

	buf << Color::Bold << item.title << Color::Reset << "     ⤓"sv
	    << Util::group_thousands(item.downloads) << " ♥"sv
	    << Util::group_thousands(item.follows) << '\n'
	    << "  by "sv << item.author << "\n\n"sv
	    << item.description << "\n\n"sv
	    << "ID: "sv << item.id << '\n'
	    << "Slug: "sv << item.slug << '\n'
	    << "URL: "sv << Display::SiteUrl << item.kind << '/' << item.slug << '\n'
	    << "Short URL: "sv << Display::SiteUrl << item.kind << '/' << item.id << '\n'
	    << "Date Created: "sv << item.date_created << '\n'
	    << "Date Modified: "sv << item.date_modified << '\n'
	    << "Project Type: "sv << item.kind << '\n'
	    << "Client support: "sv << item.client_support << '\n'
	    << "Server support: "sv << item.server_support << '\n'
	    << "License: "sv << item.license << "\n\n"sv
	    << "Loaders: "sv << Util::join(loaders, " ") << '\n'
	    << "Tags: "sv << Util::join(tags, " ") << '\n'
	    << "MC Versions: "sv << Util::join(versions, " ") << (more_versions ? "…"sv : ""sv)
	    << "\n\n"sv;

	const auto page = paginate(*screen.releases, screen.release_page, release_page_size_);

	buf << Color::Gray << std::string(Display::SeparatorLength, '=') << Color::Reset << '\n'
	    << Color::Bold
	    << "#   TYPE     VERSION              NAME                           DOWNLOADS    "
	       "GAME VERSIONS            LOADERS"sv
	    << Color::Reset << '\n';

	if (page.items.empty()) {
		buf << "No releases.\n"sv;
	}
	for (size_t i = 0; i < page.items.size(); ++i) {
		render_release_row(buf, page.items[i], i + 1);
	}

	buf << Color::Cyan << "Page "sv << (page.page_index + 1) << '/' << page.page_count
	    << " - "sv << page.total_hits << " releases - Fetched in "sv
	    << Util::group_thousands(static_cast<std::uint64_t>(page.latency.count())) << "ms"sv
	    << Color::Reset << '\n'
	    << Color::Dim
	    << "<number>: Open | <version> <loader>: Best match | < >: Page | q: Back"sv
	    << Color::Reset << '\n';
}

void DisplayManager::render_release(std::ostringstream& buf, const ReleaseScreen& screen) const
{
	const auto& release = screen.release();

	buf << Color::Bold << release.name << Color::Reset << "  ("sv << release.version_number
	    << ", "sv << to_string(release.maturity) << ")\n"sv
	    << "Game versions: "sv << Util::join(release.game_versions, " ") << '\n'
	    << "Loaders: "sv << Util::join(release.loaders, " ") << '\n'
	    << "Downloads: "sv << Util::group_thousands(release.downloads) << "\n\n"sv
	    << "Files:\n"sv;

	for (const auto& file : release.files) {
		buf << (file.primary ? Color::Green : Color::Reset) << (file.primary ? "* "sv : "  "sv)
		    << file.filename << Color::Reset << "  "sv << Util::format_bytes(file.size) << '\n';
	}

	if (!release.dependencies.empty()) {
		buf << "\nRequired dependencies:\n"sv;
		if (release.dependency_items) {
			for (const auto& item : *release.dependency_items) {
				buf << "  "sv << item.title << " ("sv << item.slug << ")\n"sv;
			}
		} else {
			for (const auto& id : release.dependencies) {
				buf << "  "sv << id << '\n';
			}
		}
	}

	buf << '\n' << Color::Dim << "Enter: Download primary file | all: Download all files | q: Back"sv
	    << Color::Reset << '\n';
}

void DisplayManager::render(const Screen& screen) const
{
	try {
		std::ostringstream buf;
		buf << "\033[2J\033[H"sv; // Clear screen and home

		std::visit(
		        [&](const auto& state) {
			        using T = std::decay_t<decltype(state)>;

			        if constexpr (std::is_same_v<T, SearchScreen>) {
				        render_search(buf);
			        } else if constexpr (std::is_same_v<T, ResultsScreen>) {
				        render_results(buf, state);
			        } else if constexpr (std::is_same_v<T, ItemScreen>) {
				        render_item(buf, state);
			        } else if constexpr (std::is_same_v<T, ReleaseScreen>) {
				        render_release(buf, state);
			        } else if constexpr (std::is_same_v<T, MessageScreen>) {
				        buf << Color::Green << state.text << Color::Reset << '\n';
			        } else if constexpr (std::is_same_v<T, ErrorScreen>) {
				        buf << Color::Red << Color::Bold << to_string(state.error.kind)
				            << Color::Reset << '\n'
				            << std::string(Display::SeparatorLength, '=') << '\n'
				            << state.error.message << '\n'
				            << std::string(Display::SeparatorLength, '=') << '\n';
			        }
		        },
		        screen.state);

		std::cout << buf.str() << std::flush;
	} catch (const std::exception& e) {
		std::cerr << "Display error: "sv << e.what() << '\n';
	}
}

[[nodiscard]] std::string DisplayManager::prompt(const Screen& screen) const
{
	return std::visit(
	        [](const auto& state) -> std::string {
		        using T = std::decay_t<decltype(state)>;

		        if constexpr (std::is_same_v<T, SearchScreen>) {
			        return "Search (q to quit): ";
		        } else if constexpr (std::is_same_v<T, MessageScreen> ||
		                             std::is_same_v<T, ErrorScreen>) {
			        return "Press Enter to continue. ";
		        } else {
			        return "> ";
		        }
	        },
	        screen.state);
}

void DisplayManager::show_progress(const ReleaseFile& file, const std::uint64_t done,
                                   const std::uint64_t total) const
{
	std::cout << '\r' << Color::Yellow << Util::truncate(file.filename, 40) << Color::Reset
	          << ' ' << Util::format_bytes(done);
	if (total > 0) {
		std::cout << " / "sv << Util::format_bytes(total) << " ("sv
		          << std::min<std::uint64_t>(100, done * 100 / total) << "%)"sv;
	}
	std::cout << "\033[K"sv;
	if (total > 0 && done >= total) {
		std::cout << '\n';
	}
	std::cout << std::flush;
}
