#pragma once

//===--------------------------------------------------------------------===//
// placelist_functions.hpp - Shared pieces of the SQL functions
//===--------------------------------------------------------------------===//

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "http_client.hpp"
#include "placelist_pipeline.hpp"

#include <string>

namespace placelist {

extern const char *const DEFAULT_USER_AGENT;
extern const char *const DEFAULT_ACCEPT_LANGUAGE;

// Effective configuration of one function call: placelist_* settings overridden by
// named parameters
struct PlaceListSettings {
	HttpRequestConfig http;
	PlaceListOptions options;
};

// Read the placelist_* extension settings
PlaceListSettings ReadPlaceListSettings(duckdb::ClientContext &context);

// Apply a named parameter shared by the functions. Returns false for unknown names.
bool ApplyPlaceListParameter(PlaceListSettings &settings, const std::string &name, const duckdb::Value &value);

// Download (http/https) or read (file://) and decode a list page.
// Throws BinderException for unusable URLs, PermissionException when external access is
// disabled, IOException for transport failures and PlaceListException for payload problems.
GoogleMapsListData DownloadPlaceList(duckdb::ClientContext &context, const std::string &url,
                                     const PlaceListSettings &settings);

// Decode a list page held in memory, logging the diagnostics
GoogleMapsListData DecodePlaceListHtml(duckdb::ClientContext &context, const std::string &html,
                                       const PlaceListOptions &options);

// Register read_placelist() and parse_placelist()
void RegisterReadPlaceListFunctions(duckdb::ExtensionLoader &loader);

// Register export_placelist_kml() and placelist_kml()
void RegisterKmlFunctions(duckdb::ExtensionLoader &loader);

} // namespace placelist
