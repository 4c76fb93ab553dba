#ifndef TESTS_FAKES_H
#define TESTS_FAKES_H

#include "api_gateway.h"
#include "http_client.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Canned responses by exact URL. Unknown URLs fail like a refused
// connection.
class FakeTransport : public Transport {
public:
	std::map<std::string, HttpResponse> responses = {};
	std::vector<std::string> requested            = {};
	size_t chunk_size                             = 4;

	void respond(const std::string& url, const long status, std::string body)
	{
		responses[url] = HttpResponse{.status  = status,
		                              .body    = std::move(body),
		                              .latency = std::chrono::milliseconds(42)};
	}

	[[nodiscard]] HttpResponse get(const std::string& url) override
	{
		requested.push_back(url);
		if (const auto it = responses.find(url); it != responses.end()) {
			return it->second;
		}
		return HttpResponse{.error = "Couldn't connect to server"};
	}

	[[nodiscard]] HttpResponse stream(const std::string& url, const ChunkSink& sink) override
	{
		auto response = get(url);
		if (!response.ok()) {
			return response;
		}
		for (size_t i = 0; i < response.body.size(); i += chunk_size) {
			if (!sink(std::string_view(response.body).substr(i, chunk_size))) {
				return HttpResponse{.status = response.status,
				                    .error  = "Failed writing received data to disk/application"};
			}
		}
		response.body.clear();
		return response;
	}
};

// Scripted gateway for navigation tests.
class FakeGateway : public ApiGateway {
public:
	std::vector<CompiledQuery> searches      = {};
	std::vector<std::string> release_lookups = {};
	std::vector<std::string> item_lookups    = {};

	size_t total_hits                       = 0;
	std::vector<Item> hits                  = {};
	std::map<std::string, std::vector<Release>> releases = {};
	std::map<std::string, Item> items       = {};
	std::optional<Error> search_error       = std::nullopt;

	[[nodiscard]] Result<ResultPage<Item>> search(const CompiledQuery& query) override
	{
		searches.push_back(query);
		if (search_error) {
			return *search_error;
		}
		return ResultPage<Item>{.items      = hits,
		                        .page_index = query.page_index,
		                        .page_count = compute_page_count(total_hits, query.page_size),
		                        .total_hits = total_hits};
	}

	[[nodiscard]] Result<ResultPage<Release>> list_releases(const std::string& item_id) override
	{
		release_lookups.push_back(item_id);
		const auto it = releases.find(item_id);
		if (it == releases.end()) {
			return Error{ErrorKind::RemoteApplication, "not_found: the requested project was not found"};
		}
		return ResultPage<Release>{.items = it->second, .total_hits = it->second.size()};
	}

	[[nodiscard]] Result<Item> get_item(const std::string& item_id) override
	{
		item_lookups.push_back(item_id);
		const auto it = items.find(item_id);
		if (it == items.end()) {
			return Error{ErrorKind::Transport, "GET /project/" + item_id + " failed"};
		}
		return it->second;
	}
};

#endif
