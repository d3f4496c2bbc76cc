#pragma once

#include "payload_node.hpp"
#include <string>

namespace placelist {

// Share URL prefix carried by the list array of a Google Maps list page
extern const char *const PLACELIST_SHARE_URL_MARKER;

// Position of the share URL inside the list array: list[2][2].
// Reverse-engineered from captured pages. A change here is a payload format change.
struct PlaceListSignature {
	static constexpr size_t SHARE_BLOCK_OFFSET = 2;
	static constexpr size_t SHARE_URL_OFFSET = 2;
};

// True when node is an array whose element at SHARE_BLOCK_OFFSET is an array whose
// element at SHARE_URL_OFFSET is a string containing marker
bool MatchesSignature(const PayloadNode &node, const std::string &marker);

// Depth-first, pre-order, left-to-right search for the first array matching the signature.
// Object members are visited in source order. Returns nullptr when nothing matches.
// Throws STRUCTURE_TOO_DEEP when containers nest deeper than max_depth.
const PayloadNode *FindSignatureMatch(const PayloadNode &root, const std::string &marker, size_t max_depth);

// Collects the string nodes containing marker, in the same traversal order as
// FindSignatureMatch. Used to look for payloads serialized inside strings.
void CollectMarkerStrings(const PayloadNode &root, const std::string &marker, size_t max_depth,
                          std::vector<const PayloadNode *> &result);

} // namespace placelist
