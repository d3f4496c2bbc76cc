#include "balanced_slice.hpp"

namespace placelist {

std::string ExtractBalanced(const std::string &text, const std::string &marker_prefix, char open_char,
                            char close_char) {
	size_t marker_pos = text.find(marker_prefix);
	if (marker_pos == std::string::npos) {
		return "";
	}

	size_t start = text.find(open_char, marker_pos + marker_prefix.size());
	if (start == std::string::npos) {
		return "";
	}

	int depth = 0;
	bool in_string = false;
	bool escape_next = false;

	for (size_t i = start; i < text.size(); i++) {
		char c = text[i];

		if (in_string) {
			if (escape_next) {
				escape_next = false;
			} else if (c == '\\') {
				escape_next = true;
			} else if (c == '"') {
				in_string = false;
			}
			continue;
		}

		if (c == '"') {
			in_string = true;
		} else if (c == open_char) {
			depth++;
		} else if (c == close_char) {
			depth--;
			if (depth == 0) {
				return text.substr(start, i - start + 1);
			}
		}
	}

	// Truncated input
	return "";
}

} // namespace placelist
