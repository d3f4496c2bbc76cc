#pragma once

#include <string>

namespace placelist {
namespace test {

// The smallest list page payload the decoder understands: one place with every field
static const char *const SAMPLE_SCRIPT =
    R"JS(window.APP_INITIALIZATION_STATE=[null,null,[0,0,"https://www.google.com/maps/placelists/list/abc"],["Jane"],"My List","A description",0,0,[[null,[0,0,0,0,"123 Main St",[0,0,40.1,-3.7]],"Cafe","Nice coffee"]]];window.APP_FLAGS=[1];)JS";

// Same list with the payload serialized inside a string, behind an anti-XSSI prefix
static const char *const NESTED_SCRIPT =
    R"JS(window.APP_INITIALIZATION_STATE=[[null,")]}'\n[[null,null,[0,0,\"https://www.google.com/maps/placelists/list/xyz\"],[\"Ann\"],\"Nested List\",null,0,0,[[null,null,\"Museum\"]]]]"]];)JS";

inline std::string WrapInHtml(const std::string &script) {
	return "<!DOCTYPE html><html><head><title>My List - Google Maps</title>"
	       "<script>var analytics = {\"enabled\": true};</script>"
	       "<script nonce=\"abc\">" + script + "</script>"
	       "</head><body><div id=\"app\"></div>"
	       "<script>window.WIZ_global_data = {};</script>"
	       "</body></html>";
}

} // namespace test
} // namespace placelist
