#include "fakes.h"
#include "navigator.h"
#include "temp_dir.h"

#include <gtest/gtest.h>

namespace {

Item make_item(std::string id, std::string slug)
{
	Item item  = {};
	item.id    = std::move(id);
	item.slug  = std::move(slug);
	item.title = "Title of " + item.slug;
	item.kind  = "mod";
	return item;
}

Release make_release(std::string id, const Maturity maturity, std::string game_version,
                     std::string loader, std::string url = "https://cdn.test/file.jar")
{
	Release release        = {};
	release.id             = id;
	release.version_number = std::move(id);
	release.maturity       = maturity;
	release.game_versions  = {std::move(game_version)};
	release.loaders        = {std::move(loader)};
	release.files          = {ReleaseFile{.url = std::move(url), .filename = "file.jar",
	                                      .size = 4, .primary = true}};
	return release;
}

template <typename T>
const T& as(const ScreenPtr& screen)
{
	EXPECT_TRUE(screen);
	EXPECT_TRUE(std::holds_alternative<T>(screen->state))
	        << "screen index " << screen->state.index();
	return std::get<T>(screen->state);
}

class NavigatorTest : public ::testing::Test {
protected:
	TempDir dir_;
	FakeGateway gateway_;
	FakeTransport transport_;
	Downloader downloader_{transport_, dir_.path()};
	Navigator navigator_{gateway_, downloader_, QueryCompiler(2)};

	ScreenPtr search_ = make_screen(SearchScreen{});

	void SetUp() override
	{
		gateway_.total_hits = 5; // three pages of two
		gateway_.hits       = {make_item("A", "alpha"), make_item("B", "beta")};
		gateway_.releases["A"] = {
		        make_release("1.0", Maturity::Stable, "1.20", "fabric"),
		        make_release("0.9", Maturity::Beta, "1.20", "forge"),
		        make_release("0.8", Maturity::Stable, "1.19", "fabric"),
		};
	}

	ScreenPtr results() { return navigator_.step(search_, "sodium +fabric"); }

	ScreenPtr item_a() { return navigator_.step(results(), "1"); }
};

} // namespace

TEST_F(NavigatorTest, SearchOpensFirstPage)
{
	const auto screen = results();
	const auto& state = as<ResultsScreen>(screen);

	EXPECT_EQ(state.page.page_index, 0U);
	EXPECT_EQ(state.page.page_count, 3U);
	ASSERT_EQ(gateway_.searches.size(), 1U);
	EXPECT_EQ(gateway_.searches[0].term, "sodium");
	EXPECT_EQ(gateway_.searches[0].offset(), 0U);
}

TEST_F(NavigatorTest, InvalidQueryReturnsToSearch)
{
	const auto screen = navigator_.step(search_, "foo +bogus");
	const auto& error = as<ErrorScreen>(screen);

	EXPECT_EQ(error.error.kind, ErrorKind::UserInput);
	EXPECT_TRUE(gateway_.searches.empty());
	EXPECT_EQ(error.parent, search_);
	EXPECT_EQ(navigator_.step(screen, "anything"), search_);
}

TEST_F(NavigatorTest, GatewayFailureReturnsToSearch)
{
	gateway_.search_error = Error{ErrorKind::Transport, "Couldn't resolve host name"};

	const auto screen = navigator_.step(search_, "sodium");
	EXPECT_EQ(as<ErrorScreen>(screen).error.kind, ErrorKind::Transport);
	EXPECT_EQ(as<ErrorScreen>(screen).parent, search_);
}

TEST_F(NavigatorTest, QuitFromSearchEnds)
{
	EXPECT_TRUE(holds<QuitScreen>(*navigator_.step(search_, "q")));
}

TEST_F(NavigatorTest, PagingWrapsBothWays)
{
	const auto first = results();

	const auto last = navigator_.step(first, "<");
	EXPECT_EQ(as<ResultsScreen>(last).page.page_index, 2U);
	EXPECT_EQ(gateway_.searches.back().offset(), 4U);
	EXPECT_EQ(gateway_.searches.back().groups, gateway_.searches.front().groups);

	const auto wrapped = navigator_.step(last, ">");
	EXPECT_EQ(as<ResultsScreen>(wrapped).page.page_index, 0U);
	EXPECT_EQ(gateway_.searches.back().offset(), 0U);

	// Earlier screens are untouched
	EXPECT_EQ(as<ResultsScreen>(first).page.page_index, 0U);
	EXPECT_EQ(as<ResultsScreen>(last).page.page_index, 2U);
}

TEST_F(NavigatorTest, GoToPageIsModuloPageCount)
{
	const auto second = navigator_.step(results(), "p2");
	EXPECT_EQ(as<ResultsScreen>(second).page.page_index, 1U);

	const auto fifth = navigator_.step(results(), "p5");
	EXPECT_EQ(as<ResultsScreen>(fifth).page.page_index, 1U);
}

TEST_F(NavigatorTest, BadResultsInputStaysOnResults)
{
	const auto page = results();

	for (const auto* input : {"3", "0", "hello", ""}) {
		const auto screen = navigator_.step(page, input);
		EXPECT_EQ(as<ErrorScreen>(screen).error.kind, ErrorKind::UserInput) << input;
		EXPECT_EQ(as<ErrorScreen>(screen).parent, page) << input;
	}
	EXPECT_TRUE(gateway_.release_lookups.empty());
}

TEST_F(NavigatorTest, QuitFromResultsStartsNewSearch)
{
	EXPECT_TRUE(holds<SearchScreen>(*navigator_.step(results(), "q")));
}

TEST_F(NavigatorTest, SelectingAnItemFetchesReleasesOnce)
{
	const auto screen = item_a();
	const auto& state = as<ItemScreen>(screen);

	EXPECT_EQ(state.item.id, "A");
	EXPECT_EQ(state.releases->items.size(), 3U);
	EXPECT_EQ(gateway_.release_lookups, (std::vector<std::string>{"A"}));

	const auto next = navigator_.step(screen, ">");
	EXPECT_EQ(as<ItemScreen>(next).release_page, 1U);
	const auto back = navigator_.step(next, ">");
	EXPECT_EQ(as<ItemScreen>(back).release_page, 0U);
	const auto last = navigator_.step(screen, "<");
	EXPECT_EQ(as<ItemScreen>(last).release_page, 1U);

	EXPECT_EQ(gateway_.release_lookups.size(), 1U);
}

TEST_F(NavigatorTest, GoToReleasePageStaysLocal)
{
	const auto screen = item_a();

	const auto second = navigator_.step(screen, "p2");
	EXPECT_EQ(as<ItemScreen>(second).release_page, 1U);

	const auto fifth = navigator_.step(screen, "p5");
	EXPECT_EQ(as<ItemScreen>(fifth).release_page, 0U);

	EXPECT_EQ(as<ItemScreen>(screen).release_page, 0U);
	EXPECT_EQ(gateway_.release_lookups.size(), 1U);
}

TEST_F(NavigatorTest, MessageReturnsToParent)
{
	const auto item    = item_a();
	const auto message = navigator_.step(item, "v1.18");
	ASSERT_TRUE(holds<MessageScreen>(*message));

	EXPECT_EQ(navigator_.step(message, ""), item);
	EXPECT_EQ(navigator_.step(message, "q"), item);

	const auto orphan = make_screen(MessageScreen{"done", nullptr});
	EXPECT_TRUE(holds<SearchScreen>(*navigator_.step(orphan, "")));
}

TEST_F(NavigatorTest, ReleaseLookupFailureReturnsToResults)
{
	const auto page   = results();
	const auto screen = navigator_.step(page, "2"); // "B" has no releases

	EXPECT_EQ(as<ErrorScreen>(screen).error.kind, ErrorKind::RemoteApplication);
	EXPECT_EQ(as<ErrorScreen>(screen).parent, page);
}

TEST_F(NavigatorTest, QuitFromItemReturnsToResultsPage)
{
	const auto page  = navigator_.step(results(), "p2");
	const auto item  = navigator_.step(page, "1");
	const auto back  = navigator_.step(item, "q");

	EXPECT_EQ(as<ResultsScreen>(back).page.page_index, 1U);
}

TEST_F(NavigatorTest, ReleaseIndexIsRelativeToPage)
{
	const auto second_page = navigator_.step(item_a(), ">");
	const auto release     = navigator_.step(second_page, "1");

	EXPECT_EQ(as<ReleaseScreen>(release).release().id, "0.8");
	EXPECT_EQ(as<ReleaseScreen>(release).item_slug, "alpha");
	EXPECT_EQ(as<ReleaseScreen>(release).parent, second_page);

	const auto error = navigator_.step(second_page, "2");
	EXPECT_EQ(as<ErrorScreen>(error).error.kind, ErrorKind::UserInput);
	EXPECT_EQ(as<ErrorScreen>(error).parent, second_page);
}

TEST_F(NavigatorTest, QuickDownloadPicksBestMatch)
{
	const auto item = item_a();

	const auto fabric = navigator_.step(item, "1.20 fabric");
	EXPECT_EQ(as<ReleaseScreen>(fabric).release().id, "1.0");

	const auto forge = navigator_.step(item, "forge");
	EXPECT_EQ(as<ReleaseScreen>(forge).release().id, "0.9");

	const auto none = navigator_.step(item, "v1.18");
	EXPECT_EQ(as<MessageScreen>(none).parent, item);

	const auto invalid = navigator_.step(item, "fabric forge");
	EXPECT_EQ(as<ErrorScreen>(invalid).error.kind, ErrorKind::UserInput);
	EXPECT_EQ(as<ErrorScreen>(invalid).parent, item);
}

TEST_F(NavigatorTest, DownloadPrimaryFile)
{
	transport_.respond("https://cdn.test/file.jar", 200, "jar!");

	const auto release = navigator_.step(item_a(), "1");
	const auto done    = navigator_.step(release, "");

	EXPECT_EQ(as<MessageScreen>(done).parent, release);
	EXPECT_EQ(read_file(dir_.path() / "alpha" / "file.jar"), "jar!");
	EXPECT_TRUE(gateway_.item_lookups.empty());
}

TEST_F(NavigatorTest, DownloadFailureStaysOnRelease)
{
	const auto release = navigator_.step(item_a(), "1");
	const auto failed  = navigator_.step(release, "all");

	EXPECT_EQ(as<ErrorScreen>(failed).error.kind, ErrorKind::Transport);
	EXPECT_EQ(as<ErrorScreen>(failed).parent, release);
}

TEST_F(NavigatorTest, OtherReleaseInputReturnsToItem)
{
	const auto item    = item_a();
	const auto release = navigator_.step(item, "1");

	EXPECT_EQ(navigator_.step(release, "q"), item);
	EXPECT_EQ(navigator_.step(release, "whatever"), item);
}

TEST_F(NavigatorTest, DependenciesResolvedOnceBeforeDownload)
{
	gateway_.releases["A"][0].dependencies = {"DEP"};
	gateway_.items["DEP"]                  = make_item("DEP", "fabric-api");
	transport_.respond("https://cdn.test/file.jar", 200, "jar!");

	const auto release = navigator_.step(item_a(), "1");
	const auto first   = navigator_.step(release, "");
	const auto second  = navigator_.step(release, "");

	EXPECT_NE(as<MessageScreen>(first).text.find("fabric-api"), std::string::npos);
	EXPECT_TRUE(holds<MessageScreen>(*second));
	EXPECT_EQ(gateway_.item_lookups, (std::vector<std::string>{"DEP"}));
}

TEST_F(NavigatorTest, DependencyFailureReturnsToReleaseListing)
{
	gateway_.releases["A"][0].dependencies = {"MISSING"};

	const auto item    = item_a();
	const auto release = navigator_.step(item, "1");
	const auto failed  = navigator_.step(release, "");

	EXPECT_EQ(as<ErrorScreen>(failed).error.kind, ErrorKind::Transport);
	EXPECT_EQ(as<ErrorScreen>(failed).parent, item);
	EXPECT_TRUE(transport_.requested.empty());
}
