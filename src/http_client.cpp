#include "http_client.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>

namespace placelist {

static std::once_flag g_curl_init_flag;

void InitializeHttpClient() {
	std::call_once(g_curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Helper to lowercase string
static std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

// Helper to trim whitespace
static std::string TrimString(const std::string &str) {
	size_t start = str.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) return "";
	size_t end = str.find_last_not_of(" \t\r\n");
	return str.substr(start, end - start + 1);
}

bool IsHtmlContentType(const std::string &content_type) {
	if (TrimString(content_type).empty()) {
		return true;
	}
	std::string media_type = ToLower(TrimString(content_type.substr(0, content_type.find(';'))));
	return media_type == "text/html" || media_type == "application/xhtml+xml";
}

bool IsFileUrl(const std::string &url) {
	return ToLower(url.substr(0, 7)) == "file://";
}

std::string FileUrlToPath(const std::string &url) {
	std::string path = url.substr(7);
	// file://localhost/path
	if (ToLower(path.substr(0, 10)) == "localhost/") {
		path = path.substr(9);
	}
	return path;
}

std::string GetListUrlValidationError(const std::string &url) {
	if (url.empty()) {
		return "URL is empty";
	}
	if (url.size() > 8192) {
		return "URL exceeds 8192 characters";
	}
	std::string lower = ToLower(url);
	size_t proto_end = lower.find("://");
	if (proto_end == std::string::npos) {
		return "URL must be absolute (e.g. https://maps.app.goo.gl/...): '" + url + "'";
	}
	std::string scheme = lower.substr(0, proto_end);
	if (scheme == "file") {
		return url.size() > 7 ? "" : "file URL has no path";
	}
	if (scheme != "http" && scheme != "https") {
		return "Unsupported URL scheme '" + scheme + "', expected http or https";
	}
	size_t host_start = proto_end + 3;
	size_t host_end = url.find_first_of("/?#", host_start);
	if (host_end == std::string::npos) {
		host_end = url.size();
	}
	if (host_end == host_start) {
		return "URL has no hostname: '" + url + "'";
	}
	return "";
}

// Callback data structures
struct WriteData {
	std::string *body;
	int64_t max_bytes;
	bool truncated;
};

struct HeaderData {
	std::string content_type;
};

// Write callback for response body
static size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp) {
	size_t total_size = size * nmemb;
	WriteData *data = static_cast<WriteData *>(userp);
	if (data->max_bytes > 0 && static_cast<int64_t>(data->body->size() + total_size) > data->max_bytes) {
		data->truncated = true;
		// Returning a short count aborts the transfer
		return 0;
	}
	data->body->append(static_cast<char *>(contents), total_size);
	return total_size;
}

// Header callback for response headers
static size_t HeaderCallback(char *buffer, size_t size, size_t nitems, void *userdata) {
	size_t total_size = size * nitems;
	HeaderData *headers = static_cast<HeaderData *>(userdata);

	std::string header(buffer, total_size);
	size_t colon_pos = header.find(':');
	if (colon_pos != std::string::npos) {
		std::string name = ToLower(TrimString(header.substr(0, colon_pos)));
		if (name == "content-type") {
			headers->content_type = TrimString(header.substr(colon_pos + 1));
		}
	}
	return total_size;
}

// Progress callback, used to honor query interruption
static int ProgressCallback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
	auto interrupted = static_cast<const std::atomic<bool> *>(clientp);
	return (interrupted && interrupted->load()) ? 1 : 0;
}

// RAII wrapper for the curl easy handle and its header list
class CurlRequestGuard {
public:
	CurlRequestGuard() : curl_(curl_easy_init()), headers_(nullptr) {}
	~CurlRequestGuard() {
		if (headers_) {
			curl_slist_free_all(headers_);
		}
		if (curl_) {
			curl_easy_cleanup(curl_);
		}
	}
	CurlRequestGuard(const CurlRequestGuard &) = delete;
	CurlRequestGuard &operator=(const CurlRequestGuard &) = delete;

	CURL *get() const { return curl_; }
	void AddHeader(const std::string &header) { headers_ = curl_slist_append(headers_, header.c_str()); }
	curl_slist *headers() const { return headers_; }

private:
	CURL *curl_;
	curl_slist *headers_;
};

HttpResponse HttpClient::Fetch(const std::string &url, const HttpRequestConfig &config) {
	HttpResponse response;

	InitializeHttpClient();
	CurlRequestGuard request;
	CURL *curl = request.get();
	if (!curl) {
		response.error = "Failed to acquire curl handle";
		return response;
	}

	// Response data
	std::string body;
	WriteData write_data {&body, config.max_response_bytes, false};
	HeaderData header_data;

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

	// Set callbacks
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_data);
	curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
	curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_data);
	if (config.interrupted) {
		curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
		curl_easy_setopt(curl, CURLOPT_XFERINFODATA, config.interrupted);
		curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
	}

	// Google serves the full list page only to browser-like clients
	if (!config.user_agent.empty()) {
		curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());
	}
	if (!config.accept_language.empty()) {
		request.AddHeader("Accept-Language: " + config.accept_language);
	}
	if (request.headers()) {
		curl_easy_setopt(curl, CURLOPT_HTTPHEADER, request.headers());
	}

	// Enable compression
	if (config.compress) {
		curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
	}

	curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config.timeout_ms));
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config.connect_timeout_ms));
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

	// Local files go through DuckDB's FileSystem, never through curl
#if LIBCURL_VERSION_NUM >= 0x075500
	curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
	curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
	curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
	curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
#endif

	// Follow redirects (maps.app.goo.gl short links redirect to the list page)
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

	CURLcode res = curl_easy_perform(curl);

	if (res == CURLE_OK) {
		long status_code = 0;
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
		response.status_code = static_cast<int>(status_code);

		char *effective_url = nullptr;
		curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
		if (effective_url) {
			response.final_url = effective_url;
		}
		long redirect_count = 0;
		curl_easy_getinfo(curl, CURLINFO_REDIRECT_COUNT, &redirect_count);
		response.redirect_count = static_cast<int>(redirect_count);

		response.body = std::move(body);
		response.content_type = std::move(header_data.content_type);

		response.success = response.status_code >= 200 && response.status_code < 300;
		if (!response.success) {
			response.error = "HTTP status " + std::to_string(response.status_code);
		}
	} else if (write_data.truncated) {
		response.error = "Response exceeds the maximum of " + std::to_string(config.max_response_bytes) + " bytes";
	} else if (res == CURLE_ABORTED_BY_CALLBACK) {
		response.error = "Request interrupted";
	} else {
		response.error = curl_easy_strerror(res);
	}

	return response;
}

} // namespace placelist
