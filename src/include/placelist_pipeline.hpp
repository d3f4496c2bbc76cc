#pragma once

#include "placelist_model.hpp"
#include "positional_decoder.hpp"
#include <string>

namespace placelist {

struct PlaceListOptions {
	// Identifies the script element carrying the payload
	std::string script_marker = "window.APP_INITIALIZATION_STATE";
	// The payload array follows this assignment
	std::string assignment_marker = "window.APP_INITIALIZATION_STATE=";
	// Share URL prefix used by the structural search
	std::string signature_marker = "https://www.google.com/maps/placelists/list/";
	// Maximum container nesting accepted in the payload
	size_t max_depth = 128;
};

// Everything the pipeline learned besides the list itself, for logging
struct PlaceListDiagnostics {
	DecodeDiagnostics decode;
	size_t script_length = 0;
	size_t payload_length = 0;
	// The list was found in a payload serialized inside a string of the outer payload
	bool used_nested_payload = false;
};

// HTML page -> list. Throws PlaceListException (SCRIPT_NOT_FOUND and every kind below).
GoogleMapsListData ExtractPlaceListFromHtml(const std::string &html, const PlaceListOptions &options,
                                            PlaceListDiagnostics *diagnostics = nullptr);

// Script text -> list. Throws PlaceListException (PAYLOAD_EXTRACTION_FAILED,
// PAYLOAD_PARSE_FAILED, SIGNATURE_NOT_FOUND, STRUCTURE_TOO_DEEP, REQUIRED_FIELD_MISSING).
GoogleMapsListData ExtractPlaceListFromScript(const std::string &script, const PlaceListOptions &options,
                                              PlaceListDiagnostics *diagnostics = nullptr);

} // namespace placelist
