#pragma once

#include <string>

namespace placelist {

// Marker identifying the script that bootstraps a Google Maps page
extern const char *const INITIALIZATION_SCRIPT_MARKER;

// Parse html with libxml2 and return the text of the first <script> element, in
// document order, whose content contains marker. Empty string when there is none.
std::string FindInitializationScript(const std::string &html, const std::string &marker);

} // namespace placelist
