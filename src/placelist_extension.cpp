#define DUCKDB_EXTENSION_MAIN

#include "placelist_extension.hpp"
#include "placelist_functions.hpp"
#include "http_client.hpp"
#include "duckdb.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace placelist {

using namespace duckdb;

static void LoadInternal(ExtensionLoader &loader) {
	auto &db = loader.GetDatabaseInstance();
	auto &config = DBConfig::GetConfig(db);

	InitializeHttpClient();

	// Register placelist_user_agent setting
	config.AddExtensionOption("placelist_user_agent",
	                          "User agent string for Google Maps list requests",
	                          LogicalType::VARCHAR,
	                          Value(DEFAULT_USER_AGENT));

	// Register placelist_accept_language setting
	config.AddExtensionOption("placelist_accept_language",
	                          "Accept-Language header for Google Maps list requests",
	                          LogicalType::VARCHAR,
	                          Value(DEFAULT_ACCEPT_LANGUAGE));

	// Register placelist_timeout_ms setting
	config.AddExtensionOption("placelist_timeout_ms",
	                          "HTTP request timeout in milliseconds",
	                          LogicalType::BIGINT,
	                          Value::BIGINT(45000));

	// Register placelist_max_response_bytes setting
	config.AddExtensionOption("placelist_max_response_bytes",
	                          "Maximum response body size in bytes (0 = unlimited)",
	                          LogicalType::BIGINT,
	                          Value::BIGINT(10485760)); // 10MB default

	// Register placelist_max_depth setting
	config.AddExtensionOption("placelist_max_depth",
	                          "Maximum nesting depth accepted in the initialization payload",
	                          LogicalType::BIGINT,
	                          Value::BIGINT(128));

	// Register read_placelist() and parse_placelist() table functions
	RegisterReadPlaceListFunctions(loader);

	// Register export_placelist_kml() table function and placelist_kml() scalar function
	RegisterKmlFunctions(loader);
}

void PlacelistExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string PlacelistExtension::Name() {
	return "placelist";
}

std::string PlacelistExtension::Version() const {
#ifdef EXT_VERSION_PLACELIST
	return EXT_VERSION_PLACELIST;
#else
	return "";
#endif
}

} // namespace placelist

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(placelist, loader) {
	placelist::LoadInternal(loader);
}

}
