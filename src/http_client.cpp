#include "http_client.h"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>

// ============================================================================
// HTTP Transport
// ============================================================================

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

constexpr long MaxRedirects = 10;

[[nodiscard]] CurlHandle make_handle(const std::string& url,
                                     const std::string& user_agent)
{
	CurlHandle handle(curl_easy_init(), &curl_easy_cleanup);
	if (!handle) {
		throw std::runtime_error("curl_easy_init failed");
	}

	curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
	curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(handle.get(), CURLOPT_MAXREDIRS, MaxRedirects);
	curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, user_agent.c_str());
	return handle;
}

size_t write_string(char* data, size_t size, size_t nmemb, void* userp)
{
	auto* body = static_cast<std::string*>(userp);
	body->append(data, size * nmemb);
	return size * nmemb;
}

size_t write_sink(char* data, size_t size, size_t nmemb, void* userp)
{
	const auto* sink = static_cast<const ChunkSink*>(userp);
	const size_t n   = size * nmemb;
	try {
		return (*sink)(std::string_view(data, n)) ? n : 0;
	} catch (const std::exception&) {
		return 0;
	}
}

// Runs the transfer and fills status, latency and error.
void perform(CURL* handle, HttpResponse& response)
{
	const auto start = std::chrono::steady_clock::now();
	const auto code  = curl_easy_perform(handle);
	response.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
	        std::chrono::steady_clock::now() - start);

	curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);

	if (code != CURLE_OK) {
		response.error = curl_easy_strerror(code);
	}
}

} // namespace

CurlTransport::CurlTransport(std::string user_agent, const size_t chunk_size)
        : user_agent_(std::move(user_agent)),
          chunk_size_(chunk_size)
{}

[[nodiscard]] HttpResponse CurlTransport::get(const std::string& url)
{
	HttpResponse response = {};
	const auto handle     = make_handle(url, user_agent_);

	curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_string);
	curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);

	perform(handle.get(), response);
	return response;
}

[[nodiscard]] HttpResponse CurlTransport::stream(const std::string& url,
                                                 const ChunkSink& sink)
{
	HttpResponse response = {};
	const auto handle     = make_handle(url, user_agent_);

	curl_easy_setopt(handle.get(), CURLOPT_FAILONERROR, 1L);
	curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_sink);
	curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &sink);
	if (chunk_size_ > 0) {
		curl_easy_setopt(handle.get(), CURLOPT_BUFFERSIZE,
		                 static_cast<long>(chunk_size_));
	}

	perform(handle.get(), response);
	return response;
}

CurlSession::CurlSession()
{
	if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
		throw std::runtime_error("curl_global_init failed");
	}
}

CurlSession::~CurlSession()
{
	curl_global_cleanup();
}

namespace Http {

[[nodiscard]] std::string url_encode(const std::string_view text)
{
	// curl_easy_escape treats a zero length as "use strlen"
	if (text.empty()) {
		return {};
	}

	const CurlHandle handle(curl_easy_init(), &curl_easy_cleanup);
	if (!handle) {
		throw std::runtime_error("curl_easy_init failed");
	}

	char* escaped = curl_easy_escape(handle.get(), text.data(),
	                                 static_cast<int>(text.size()));
	if (!escaped) {
		throw std::runtime_error("curl_easy_escape failed");
	}

	std::string result(escaped);
	curl_free(escaped);
	return result;
}

} // namespace Http
