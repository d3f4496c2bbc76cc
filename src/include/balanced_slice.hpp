#pragma once

#include <string>

namespace placelist {

// Extract a bracket-balanced expression from text that is not JSON as a whole
// (e.g. a JavaScript body containing "window.X=[...];").
//
// Finds the first occurrence of marker_prefix, then the first open_char after it, and
// scans forward counting open_char/close_char nesting. Brackets inside double-quoted
// string literals are ignored; backslash escapes inside strings are honored.
//
// Returns the slice from the opening through the matching closing character, or an
// empty string when the marker, the opening character or the matching close is missing.
// An empty marker_prefix starts the search at the beginning of the text.
std::string ExtractBalanced(const std::string &text, const std::string &marker_prefix, char open_char,
                            char close_char);

} // namespace placelist
