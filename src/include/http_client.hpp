#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <curl/curl.h>

namespace placelist {

struct HttpResponse {
	int status_code = 0;
	std::string body;
	std::string content_type;
	std::string error;
	bool success = false;
	std::string final_url;        // Final URL after redirects
	int redirect_count = 0;       // Number of redirects followed
};

struct HttpRequestConfig {
	std::string user_agent;
	std::string accept_language;
	int64_t timeout_ms = 45000;
	int64_t connect_timeout_ms = 10000;
	int64_t max_response_bytes = 10485760;  // 0 = unlimited
	bool compress = true;
	// Polled during the transfer; the request aborts once it becomes true
	const std::atomic<bool> *interrupted = nullptr;
};

// Initialize HTTP client (call in extension load)
void InitializeHttpClient();

// Returns an error message for URLs the client refuses, empty when the URL is usable.
// Accepted: absolute http://, https:// and file:// URLs.
std::string GetListUrlValidationError(const std::string &url);

// True for text/html and XHTML, or when the server sent no Content-Type
bool IsHtmlContentType(const std::string &content_type);

bool IsFileUrl(const std::string &url);

// "file:///tmp/list.html" -> "/tmp/list.html"
std::string FileUrlToPath(const std::string &url);

class HttpClient {
public:
	// Single http(s) GET attempt, no retries
	static HttpResponse Fetch(const std::string &url, const HttpRequestConfig &config);
};

} // namespace placelist
