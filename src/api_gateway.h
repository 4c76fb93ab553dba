#ifndef API_GATEWAY_H
#define API_GATEWAY_H

#include "error_t.h"
#include "http_client.h"
#include "item_t.h"
#include "query_t.h"
#include "release_t.h"
#include "result_page_t.h"

#include <string>

// ============================================================================
// API Gateway
// ============================================================================

class ApiGateway {
public:
	virtual ~ApiGateway() = default;

	[[nodiscard]] virtual Result<ResultPage<Item>> search(const CompiledQuery& query) = 0;

	// The whole release list of one item as a single page, newest first.
	[[nodiscard]] virtual Result<ResultPage<Release>> list_releases(
	        const std::string& item_id) = 0;

	[[nodiscard]] virtual Result<Item> get_item(const std::string& item_id) = 0;
};

class ModrinthGateway final : public ApiGateway {
	Transport& transport_;
	std::string api_url_ = {};

	[[nodiscard]] std::string search_url(const CompiledQuery& query) const;

public:
	ModrinthGateway(Transport& transport, std::string api_url);

	[[nodiscard]] Result<ResultPage<Item>> search(const CompiledQuery& query) override;

	[[nodiscard]] Result<ResultPage<Release>> list_releases(
	        const std::string& item_id) override;

	[[nodiscard]] Result<Item> get_item(const std::string& item_id) override;
};

#endif
