#include "signature_search.hpp"
#include "placelist_error.hpp"

namespace placelist {

const char *const PLACELIST_SHARE_URL_MARKER = "https://www.google.com/maps/placelists/list/";

constexpr size_t PlaceListSignature::SHARE_BLOCK_OFFSET;
constexpr size_t PlaceListSignature::SHARE_URL_OFFSET;

static void CheckDepth(size_t depth, size_t max_depth) {
	if (depth > max_depth) {
		throw PlaceListException(PlaceListErrorType::STRUCTURE_TOO_DEEP,
		                         "Initialization payload nests deeper than " + std::to_string(max_depth) + " levels.");
	}
}

bool MatchesSignature(const PayloadNode &node, const std::string &marker) {
	const PayloadNode *share_block = node.At(PlaceListSignature::SHARE_BLOCK_OFFSET);
	if (!share_block || !share_block->IsArray()) {
		return false;
	}
	const PayloadNode *share_url = share_block->At(PlaceListSignature::SHARE_URL_OFFSET);
	if (!share_url || !share_url->IsString()) {
		return false;
	}
	return share_url->GetString().find(marker) != std::string::npos;
}

static const PayloadNode *SearchNode(const PayloadNode &node, const std::string &marker, size_t depth,
                                     size_t max_depth) {
	switch (node.GetType()) {
		case PayloadNodeType::NULL_VALUE:
		case PayloadNodeType::BOOLEAN:
		case PayloadNodeType::NUMBER:
		case PayloadNodeType::STRING:
			return nullptr;
		case PayloadNodeType::ARRAY: {
			CheckDepth(depth, max_depth);
			if (MatchesSignature(node, marker)) {
				return &node;
			}
			for (const auto &element : node.Elements()) {
				const PayloadNode *match = SearchNode(*element, marker, depth + 1, max_depth);
				if (match) {
					return match;
				}
			}
			return nullptr;
		}
		case PayloadNodeType::OBJECT: {
			CheckDepth(depth, max_depth);
			for (const auto &member : node.Members()) {
				const PayloadNode *match = SearchNode(*member.second, marker, depth + 1, max_depth);
				if (match) {
					return match;
				}
			}
			return nullptr;
		}
	}
	return nullptr;
}

const PayloadNode *FindSignatureMatch(const PayloadNode &root, const std::string &marker, size_t max_depth) {
	return SearchNode(root, marker, 1, max_depth);
}

static void CollectStrings(const PayloadNode &node, const std::string &marker, size_t depth, size_t max_depth,
                           std::vector<const PayloadNode *> &result) {
	switch (node.GetType()) {
		case PayloadNodeType::NULL_VALUE:
		case PayloadNodeType::BOOLEAN:
		case PayloadNodeType::NUMBER:
			return;
		case PayloadNodeType::STRING:
			if (node.GetString().find(marker) != std::string::npos) {
				result.push_back(&node);
			}
			return;
		case PayloadNodeType::ARRAY:
			CheckDepth(depth, max_depth);
			for (const auto &element : node.Elements()) {
				CollectStrings(*element, marker, depth + 1, max_depth, result);
			}
			return;
		case PayloadNodeType::OBJECT:
			CheckDepth(depth, max_depth);
			for (const auto &member : node.Members()) {
				CollectStrings(*member.second, marker, depth + 1, max_depth, result);
			}
			return;
	}
}

void CollectMarkerStrings(const PayloadNode &root, const std::string &marker, size_t max_depth,
                          std::vector<const PayloadNode *> &result) {
	CollectStrings(root, marker, 1, max_depth, result);
}

} // namespace placelist
