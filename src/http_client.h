#ifndef HTTP_CLIENT_H
#define HTTP_CLIENT_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

// ============================================================================
// HTTP Transport
// ============================================================================

struct HttpResponse {
	long status                       = 0;
	std::string body                  = {};
	std::string error                 = {}; // set when no response arrived
	std::chrono::milliseconds latency = {};

	[[nodiscard]] bool received() const { return error.empty(); }

	[[nodiscard]] bool ok() const
	{
		return received() && status >= 200 && status < 300;
	}
};

// Receives the body piece by piece; returning false aborts the transfer.
using ChunkSink = std::function<bool(std::string_view chunk)>;

class Transport {
public:
	virtual ~Transport() = default;

	[[nodiscard]] virtual HttpResponse get(const std::string& url) = 0;

	// The body is handed to `sink` instead of being kept in the response.
	[[nodiscard]] virtual HttpResponse stream(const std::string& url,
	                                          const ChunkSink& sink) = 0;
};

// libcurl backed transport. One easy handle per request.
class CurlTransport final : public Transport {
	std::string user_agent_ = {};
	size_t chunk_size_      = 0;

public:
	CurlTransport(std::string user_agent, const size_t chunk_size);

	[[nodiscard]] HttpResponse get(const std::string& url) override;

	[[nodiscard]] HttpResponse stream(const std::string& url,
	                                  const ChunkSink& sink) override;
};

// curl_global_init / curl_global_cleanup for the lifetime of main().
class CurlSession {
public:
	CurlSession();

	~CurlSession();

	CurlSession(const CurlSession&)            = delete;
	CurlSession& operator=(const CurlSession&) = delete;
};

namespace Http {

[[nodiscard]] std::string url_encode(const std::string_view text);

} // namespace Http

#endif
