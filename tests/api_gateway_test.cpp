#include "api_gateway.h"
#include "fakes.h"
#include "query_compiler.h"

#include <gtest/gtest.h>

namespace {

constexpr auto Api = "https://api.test/v2";

const std::string SearchBody = R"({
  "hits": [
    {
      "project_id": "AANobbMI", "slug": "sodium", "project_type": "mod",
      "title": "Sodium", "author": "jellysquid3",
      "description": "Rendering engine", "downloads": 1234567, "follows": 890,
      "categories": ["optimization", "fabric", "quilt"],
      "versions": ["1.19", "1.20"],
      "date_created": "2021-01-03T07:55:54Z", "date_modified": "2024-05-01T10:00:00Z",
      "license": "LicenseRef-Polyform-Shield-1.0.0",
      "client_side": "required", "server_side": "unsupported"
    }
  ],
  "offset": 0, "limit": 20, "total_hits": 41
})";

const std::string VersionsBody = R"([
  {
    "id": "v1", "version_type": "release", "version_number": "0.5.8",
    "name": "Sodium 0.5.8", "downloads": 100,
    "game_versions": ["1.20.1"], "loaders": ["fabric"],
    "files": [
      {"url": "https://cdn.test/a.jar", "filename": "sodium-a.jar", "size": 10, "primary": false},
      {"url": "https://cdn.test/b.jar", "filename": "../../evil/dir/sodium-b.jar", "size": 20, "primary": false}
    ],
    "dependencies": [
      {"project_id": "P7dR8mSH", "dependency_type": "required"},
      {"project_id": "optional1", "dependency_type": "optional"},
      {"version_id": "xyz", "dependency_type": "incompatible"}
    ]
  },
  {
    "id": "v2", "version_type": "beta", "version_number": "0.5.7",
    "name": "Sodium 0.5.7", "downloads": 5,
    "game_versions": ["1.20.1"], "loaders": ["fabric"],
    "files": [
      {"url": "https://cdn.test/c.jar", "filename": "c.jar", "size": 1, "primary": false},
      {"url": "https://cdn.test/d.jar", "filename": "d.jar", "size": 2, "primary": true}
    ],
    "dependencies": []
  }
])";

CompiledQuery compile(const std::string_view raw, const size_t page = 0)
{
	return std::get<CompiledQuery>(QueryCompiler(20).compile(raw, page));
}

} // namespace

TEST(ModrinthGateway, SearchUrlCarriesTermPagingSortAndFacets)
{
	FakeTransport transport;
	ModrinthGateway gateway(transport, std::string(Api) + "/");

	const auto result = gateway.search(compile("iris shaders +fabric -forge /follows", 2));
	ASSERT_EQ(transport.requested.size(), 1U);
	EXPECT_EQ(transport.requested[0],
	          std::string(Api) +
	                  "/search?query=iris%20shaders&offset=40&limit=20&index=follows"
	                  "&facets=%5B%5B%22categories%3Afabric%22%5D%2C%5B%22categories%21%3Dforge%22%5D%5D");
	ASSERT_NE(error_of(result), nullptr);
	EXPECT_EQ(error_of(result)->kind, ErrorKind::Transport);
}

TEST(ModrinthGateway, SearchWithoutFiltersOmitsOptionalParameters)
{
	FakeTransport transport;
	ModrinthGateway gateway(transport, Api);

	(void)gateway.search(compile(""));
	ASSERT_EQ(transport.requested.size(), 1U);
	EXPECT_EQ(transport.requested[0], std::string(Api) + "/search?query=&offset=0&limit=20");
}

TEST(ModrinthGateway, SearchMapsHits)
{
	FakeTransport transport;
	ModrinthGateway gateway(transport, Api);
	transport.respond(std::string(Api) + "/search?query=sodium&offset=20&limit=20", 200,
	                  SearchBody);

	const auto result = gateway.search(compile("sodium", 1));
	ASSERT_EQ(error_of(result), nullptr) << error_of(result)->message;

	const auto& page = std::get<ResultPage<Item>>(result);
	EXPECT_EQ(page.page_index, 1U);
	EXPECT_EQ(page.page_count, 3U);
	EXPECT_EQ(page.total_hits, 41U);
	EXPECT_EQ(page.latency, std::chrono::milliseconds(42));
	ASSERT_EQ(page.items.size(), 1U);

	const auto& item = page.items[0];
	EXPECT_EQ(item.id, "AANobbMI");
	EXPECT_EQ(item.slug, "sodium");
	EXPECT_EQ(item.author, "jellysquid3");
	EXPECT_EQ(item.downloads, 1234567U);
	EXPECT_EQ(item.game_versions, (std::vector<std::string>{"1.19", "1.20"}));
	EXPECT_EQ(item.license, "LicenseRef-Polyform-Shield-1.0.0");
	EXPECT_EQ(item.loaders, (std::vector<std::string>{"fabric", "quilt"}));
	EXPECT_EQ(item.tags, (std::vector<std::string>{"optimization"}));
}

TEST(ModrinthGateway, ZeroHitsIsOnePage)
{
	FakeTransport transport;
	ModrinthGateway gateway(transport, Api);
	transport.respond(std::string(Api) + "/search?query=zzz&offset=0&limit=20", 200,
	                  R"({"hits": [], "offset": 0, "limit": 20, "total_hits": 0})");

	const auto result = gateway.search(compile("zzz"));
	ASSERT_EQ(error_of(result), nullptr);
	EXPECT_EQ(std::get<ResultPage<Item>>(result).page_count, 1U);
	EXPECT_EQ(compute_page_count(0, 20), 1U);
	EXPECT_EQ(compute_page_count(20, 20), 1U);
	EXPECT_EQ(compute_page_count(21, 20), 2U);
}

TEST(ModrinthGateway, ServerErrorPayloadIsRemoteApplicationError)
{
	FakeTransport transport;
	ModrinthGateway gateway(transport, Api);
	transport.respond(std::string(Api) + "/search?query=x&offset=0&limit=20", 400,
	                  R"({"error": "invalid_input", "description": "Error while parsing facets"})");

	const auto result = gateway.search(compile("x"));
	ASSERT_NE(error_of(result), nullptr);
	EXPECT_EQ(error_of(result)->kind, ErrorKind::RemoteApplication);
	EXPECT_EQ(error_of(result)->message, "invalid_input: Error while parsing facets");
}

TEST(ModrinthGateway, BadStatusAndMalformedBodiesAreTransportErrors)
{
	FakeTransport transport;
	ModrinthGateway gateway(transport, Api);
	transport.respond(std::string(Api) + "/search?query=a&offset=0&limit=20", 502,
	                  "<html>Bad Gateway</html>");
	transport.respond(std::string(Api) + "/search?query=b&offset=0&limit=20", 200,
	                  "{not json");
	transport.respond(std::string(Api) + "/search?query=c&offset=0&limit=20", 200,
	                  R"({"hits": "nope", "total_hits": 3})");

	for (const auto* term : {"a", "b", "c"}) {
		const auto result = gateway.search(compile(term));
		ASSERT_NE(error_of(result), nullptr) << term;
		EXPECT_EQ(error_of(result)->kind, ErrorKind::Transport) << term;
	}
}

TEST(ModrinthGateway, ReleaseListing)
{
	FakeTransport transport;
	ModrinthGateway gateway(transport, Api);
	transport.respond(std::string(Api) + "/project/AANobbMI/version", 200, VersionsBody);

	const auto result = gateway.list_releases("AANobbMI");
	ASSERT_EQ(error_of(result), nullptr) << error_of(result)->message;

	const auto& listing = std::get<ResultPage<Release>>(result);
	ASSERT_EQ(listing.items.size(), 2U);
	EXPECT_EQ(listing.total_hits, 2U);

	const auto& first = listing.items[0];
	EXPECT_EQ(first.maturity, Maturity::Stable);
	EXPECT_EQ(first.dependencies, (std::vector<std::string>{"P7dR8mSH"}));
	ASSERT_EQ(first.files.size(), 2U);
	EXPECT_TRUE(first.files[0].primary);
	EXPECT_FALSE(first.files[1].primary);
	EXPECT_EQ(first.files[1].filename, "sodium-b.jar");
	EXPECT_EQ(first.primary_file()->url, "https://cdn.test/a.jar");

	const auto& second = listing.items[1];
	EXPECT_EQ(second.maturity, Maturity::Beta);
	EXPECT_FALSE(second.files[0].primary);
	EXPECT_EQ(second.primary_file()->filename, "d.jar");
}

TEST(ModrinthGateway, ReleaseListingMustBeAnArray)
{
	FakeTransport transport;
	ModrinthGateway gateway(transport, Api);
	transport.respond(std::string(Api) + "/project/x/version", 200, R"({"id": "v1"})");

	const auto result = gateway.list_releases("x");
	ASSERT_NE(error_of(result), nullptr);
	EXPECT_EQ(error_of(result)->kind, ErrorKind::Transport);
}

TEST(ModrinthGateway, ProjectObjectMapsOntoItem)
{
	FakeTransport transport;
	ModrinthGateway gateway(transport, Api);
	transport.respond(std::string(Api) + "/project/P7dR8mSH", 200, R"({
	  "id": "P7dR8mSH", "slug": "fabric-api", "project_type": "mod",
	  "title": "Fabric API", "team": "BZoBsPo6", "description": "Core API",
	  "downloads": 5, "followers": 1,
	  "categories": ["library"], "loaders": ["fabric", "quilt"],
	  "game_versions": ["1.20.1"], "versions": ["Lwa3g1uW", "Zf8OxwBq"],
	  "published": "2019-01-01T00:00:00Z",
	  "updated": "2024-01-01T00:00:00Z",
	  "license": {"id": "Apache-2.0", "name": "Apache License 2.0", "url": null},
	  "client_side": "optional", "server_side": "optional"
	})");

	const auto result = gateway.get_item("P7dR8mSH");
	ASSERT_EQ(error_of(result), nullptr) << error_of(result)->message;

	const auto& item = std::get<Item>(result);
	EXPECT_EQ(item.id, "P7dR8mSH");
	EXPECT_EQ(item.title, "Fabric API");
	EXPECT_EQ(item.license, "Apache-2.0");
	EXPECT_EQ(item.date_created, "2019-01-01T00:00:00Z");
	EXPECT_EQ(item.game_versions, (std::vector<std::string>{"1.20.1"}));
	EXPECT_EQ(item.loaders, (std::vector<std::string>{"fabric", "quilt"}));
	EXPECT_EQ(item.tags, (std::vector<std::string>{"library"}));
}
