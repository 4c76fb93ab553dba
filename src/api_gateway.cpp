#include "api_gateway.h"
#include "api_json.h"
#include "filter_vocabulary.h"

#include <nlohmann/json.hpp>

#include <exception>
#include <stdexcept>

// ============================================================================
// API Gateway
// ============================================================================

namespace {

using nlohmann::json;

constexpr size_t MaxBodyExcerpt = 300;

// Separates server-reported errors from transport failures and bad bodies.
[[nodiscard]] Result<json> decode(const std::string& url, const HttpResponse& response)
{
	if (!response.received()) {
		return Error{ErrorKind::Transport,
		             "GET " + url + " failed: " + response.error};
	}

	const auto data = json::parse(response.body, nullptr, false);

	if (data.is_object() && data.contains("error")) {
		return Error{ErrorKind::RemoteApplication,
		             data.value("error", std::string()) + ": " +
		                     data.value("description", std::string())};
	}
	if (!response.ok()) {
		return Error{ErrorKind::Transport,
		             "GET " + url + " returned HTTP " + std::to_string(response.status) +
		                     "\n" + response.body.substr(0, MaxBodyExcerpt)};
	}
	if (data.is_discarded()) {
		return Error{ErrorKind::Transport,
		             "GET " + url + " returned malformed JSON\n" +
		                     response.body.substr(0, MaxBodyExcerpt)};
	}
	return data;
}

[[nodiscard]] Error malformed(const std::string& url, const std::exception& e)
{
	return Error{ErrorKind::Transport,
	             "unexpected response from " + url + "\n" + e.what()};
}

} // namespace

ModrinthGateway::ModrinthGateway(Transport& transport, std::string api_url)
        : transport_(transport),
          api_url_(std::move(api_url))
{
	while (!api_url_.empty() && api_url_.back() == '/') {
		api_url_.pop_back();
	}
}

[[nodiscard]] std::string ModrinthGateway::search_url(const CompiledQuery& query) const
{
	std::string url = api_url_ + "/search?query=" + Http::url_encode(query.term) +
	                  "&offset=" + std::to_string(query.offset()) +
	                  "&limit=" + std::to_string(query.page_size);

	if (query.sort) {
		url += "&index=" + std::string(Vocabulary::to_string(*query.sort));
	}
	if (!query.groups.empty()) {
		url += "&facets=" + Http::url_encode(ApiJson::encode_groups(query.groups));
	}
	return url;
}

[[nodiscard]] Result<ResultPage<Item>> ModrinthGateway::search(const CompiledQuery& query)
{
	std::string url = {};
	try {
		url                 = search_url(query);
		const auto response = transport_.get(url);
		const auto data     = decode(url, response);
		if (const auto* error = error_of(data)) {
			return *error;
		}

		const auto& body = std::get<json>(data);
		ResultPage<Item> page = {.page_index = query.page_index,
		                         .total_hits = body.at("total_hits").get<size_t>(),
		                         .latency    = response.latency};
		page.page_count = compute_page_count(page.total_hits, query.page_size);

		const auto& hits = body.at("hits");
		if (!hits.is_array()) {
			throw std::invalid_argument("\"hits\" is not an array");
		}
		for (const auto& hit : hits) {
			page.items.push_back(ApiJson::item_from_json(hit));
		}
		return page;
	} catch (const std::exception& e) {
		return malformed(url, e);
	}
}

[[nodiscard]] Result<ResultPage<Release>> ModrinthGateway::list_releases(
        const std::string& item_id)
{
	std::string url = {};
	try {
		url                 = api_url_ + "/project/" + Http::url_encode(item_id) + "/version";
		const auto response = transport_.get(url);
		const auto data     = decode(url, response);
		if (const auto* error = error_of(data)) {
			return *error;
		}

		const auto& body = std::get<json>(data);
		if (!body.is_array()) {
			throw std::invalid_argument("expected an array of versions");
		}

		ResultPage<Release> listing = {.latency = response.latency};
		for (const auto& entry : body) {
			listing.items.push_back(ApiJson::release_from_json(entry));
		}
		listing.total_hits = listing.items.size();
		return listing;
	} catch (const std::exception& e) {
		return malformed(url, e);
	}
}

[[nodiscard]] Result<Item> ModrinthGateway::get_item(const std::string& item_id)
{
	std::string url = {};
	try {
		url                 = api_url_ + "/project/" + Http::url_encode(item_id);
		const auto response = transport_.get(url);
		const auto data     = decode(url, response);
		if (const auto* error = error_of(data)) {
			return *error;
		}
		return ApiJson::item_from_json(std::get<json>(data));
	} catch (const std::exception& e) {
		return malformed(url, e);
	}
}
