#include "placelist_functions.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/config.hpp"

namespace placelist {

using namespace duckdb;

const char *const DEFAULT_USER_AGENT =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/126.0.0.0 Safari/537.36";
const char *const DEFAULT_ACCEPT_LANGUAGE = "en-US,en;q=0.9";

PlaceListSettings ReadPlaceListSettings(ClientContext &context) {
	PlaceListSettings settings;
	settings.http.user_agent = DEFAULT_USER_AGENT;
	settings.http.accept_language = DEFAULT_ACCEPT_LANGUAGE;

	Value setting_value;
	if (context.TryGetCurrentSetting("placelist_user_agent", setting_value) && !setting_value.IsNull()) {
		settings.http.user_agent = setting_value.ToString();
	}
	if (context.TryGetCurrentSetting("placelist_accept_language", setting_value) && !setting_value.IsNull()) {
		settings.http.accept_language = setting_value.ToString();
	}
	if (context.TryGetCurrentSetting("placelist_timeout_ms", setting_value) && !setting_value.IsNull()) {
		settings.http.timeout_ms = setting_value.GetValue<int64_t>();
	}
	if (context.TryGetCurrentSetting("placelist_max_response_bytes", setting_value) && !setting_value.IsNull()) {
		settings.http.max_response_bytes = setting_value.GetValue<int64_t>();
	}
	if (context.TryGetCurrentSetting("placelist_max_depth", setting_value) && !setting_value.IsNull()) {
		auto max_depth = setting_value.GetValue<int64_t>();
		if (max_depth <= 0) {
			throw InvalidInputException("placelist_max_depth must be positive, got %lld", max_depth);
		}
		settings.options.max_depth = static_cast<size_t>(max_depth);
	}
	return settings;
}

bool ApplyPlaceListParameter(PlaceListSettings &settings, const std::string &name, const Value &value) {
	if (value.IsNull()) {
		throw BinderException("Parameter '%s' cannot be NULL", name);
	}
	if (name == "user_agent") {
		settings.http.user_agent = StringValue::Get(value);
	} else if (name == "accept_language") {
		settings.http.accept_language = StringValue::Get(value);
	} else if (name == "timeout") {
		// seconds, like the other HTTP table functions
		auto seconds = value.GetValue<int>();
		if (seconds <= 0) {
			throw BinderException("timeout must be positive, got %d", seconds);
		}
		settings.http.timeout_ms = static_cast<int64_t>(seconds) * 1000;
	} else if (name == "max_depth") {
		auto max_depth = value.GetValue<int>();
		if (max_depth <= 0) {
			throw BinderException("max_depth must be positive, got %d", max_depth);
		}
		settings.options.max_depth = static_cast<size_t>(max_depth);
	} else {
		return false;
	}
	return true;
}

static void LogDiagnostics(ClientContext &context, const GoogleMapsListData &list,
                           const PlaceListDiagnostics &diagnostics) {
	DUCKDB_LOG_DEBUG(context, "Initialization script: %llu bytes, payload: %llu bytes, layout v%d",
	                 static_cast<uint64_t>(diagnostics.script_length), static_cast<uint64_t>(diagnostics.payload_length),
	                 PlaceListLayout::LAYOUT_VERSION);
	if (diagnostics.used_nested_payload) {
		DUCKDB_LOG_DEBUG(context, "List found in a payload serialized inside a string");
	}
	for (const auto &message : diagnostics.decode.messages) {
		DUCKDB_LOG_DEBUG(context, "%s", message);
	}
	DUCKDB_LOG_INFO(context, "Extracted %llu places from list '%s' (%llu entries skipped)",
	                static_cast<uint64_t>(list.Places().size()), list.Name(),
	                static_cast<uint64_t>(diagnostics.decode.dropped_places));
}

GoogleMapsListData DecodePlaceListHtml(ClientContext &context, const std::string &html,
                                       const PlaceListOptions &options) {
	PlaceListDiagnostics diagnostics;
	auto list = ExtractPlaceListFromHtml(html, options, &diagnostics);
	LogDiagnostics(context, list, diagnostics);
	return list;
}

static void CheckExternalAccess(ClientContext &context, const std::string &url) {
	auto &config = DBConfig::GetConfig(context);
	if (!config.options.enable_external_access) {
		throw PermissionException("Cannot fetch Google Maps list from %s: external access is disabled", url);
	}
}

// file:// sources are read through DuckDB's FileSystem, so allowed_directories applies
static std::string ReadLocalPage(ClientContext &context, const std::string &url, int64_t max_bytes) {
	auto path = FileUrlToPath(url);
	auto &fs = FileSystem::GetFileSystem(context);
	auto handle = fs.OpenFile(path, FileFlags::FILE_FLAGS_READ);
	auto file_size = handle->GetFileSize();
	if (max_bytes > 0 && file_size > static_cast<idx_t>(max_bytes)) {
		throw IOException("Failed to read Google Maps list from %s: file exceeds the maximum of %lld bytes", path,
		                  static_cast<long long>(max_bytes));
	}
	std::string content(file_size, '\0');
	if (file_size > 0) {
		auto bytes_read = handle->Read(&content[0], file_size);
		content.resize(static_cast<size_t>(bytes_read));
	}
	return content;
}

GoogleMapsListData DownloadPlaceList(ClientContext &context, const std::string &url,
                                     const PlaceListSettings &settings) {
	auto url_error = GetListUrlValidationError(url);
	if (!url_error.empty()) {
		throw BinderException("Invalid list URL: %s", url_error);
	}
	CheckExternalAccess(context, url);

	if (IsFileUrl(url)) {
		DUCKDB_LOG_INFO(context, "Reading Google Maps list from %s", url);
		return DecodePlaceListHtml(context, ReadLocalPage(context, url, settings.http.max_response_bytes),
		                           settings.options);
	}

	DUCKDB_LOG_INFO(context, "Downloading Google Maps list from %s", url);

	HttpRequestConfig http = settings.http;
	http.interrupted = &context.interrupted;
	auto response = HttpClient::Fetch(url, http);
	if (!response.success) {
		throw IOException("Failed to download Google Maps list from %s: %s", url, response.error);
	}
	if (response.redirect_count > 0) {
		DUCKDB_LOG_DEBUG(context, "Followed %d redirects to %s", response.redirect_count, response.final_url);
	}
	if (!IsHtmlContentType(response.content_type)) {
		DUCKDB_LOG_DEBUG(context, "Response from %s has content type '%s', expected HTML", url,
		                 response.content_type);
	}

	return DecodePlaceListHtml(context, response.body, settings.options);
}

} // namespace placelist
