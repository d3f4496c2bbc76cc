#include "placelist_pipeline.hpp"
#include "balanced_slice.hpp"
#include "payload_node.hpp"
#include "placelist_error.hpp"
#include "script_locator.hpp"
#include "signature_search.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/unique_ptr.hpp"

namespace placelist {

// Google also ships payloads as JSON text inside a string of the outer payload, usually
// behind an anti-XSSI prefix such as ")]}'". Slice the embedded array out and search it.
static duckdb::unique_ptr<GoogleMapsListData> DecodeNestedPayloads(const PayloadNode &root,
                                                                const PlaceListOptions &options,
                                                                PlaceListDiagnostics *diagnostics) {
	std::vector<const PayloadNode *> candidates;
	CollectMarkerStrings(root, options.signature_marker, options.max_depth, candidates);

	for (const PayloadNode *candidate : candidates) {
		std::string embedded = ExtractBalanced(candidate->GetString(), "", '[', ']');
		if (embedded.empty()) {
			continue;
		}

		PayloadNodePtr nested;
		try {
			nested = ParsePayload(embedded, options.max_depth);
		} catch (PlaceListException &ex) {
			if (ex.GetType() != PlaceListErrorType::PAYLOAD_PARSE_FAILED) {
				throw;
			}
			if (diagnostics) {
				diagnostics->decode.messages.push_back("Ignored embedded string that is not JSON: " + ex.GetDetail());
			}
			continue;
		}

		const PayloadNode *list = FindSignatureMatch(*nested, options.signature_marker, options.max_depth);
		if (!list) {
			continue;
		}
		if (diagnostics) {
			diagnostics->used_nested_payload = true;
		}
		return duckdb::make_uniq<GoogleMapsListData>(
		    DecodePlaceList(*list, diagnostics ? &diagnostics->decode : nullptr));
	}
	return nullptr;
}

GoogleMapsListData ExtractPlaceListFromScript(const std::string &script, const PlaceListOptions &options,
                                              PlaceListDiagnostics *diagnostics) {
	if (diagnostics) {
		diagnostics->script_length = script.size();
	}

	std::string payload = ExtractBalanced(script, options.assignment_marker, '[', ']');
	if (payload.empty()) {
		throw PlaceListException(PlaceListErrorType::PAYLOAD_EXTRACTION_FAILED,
		                         "Failed to isolate the APP_INITIALIZATION_STATE JSON payload.");
	}
	if (diagnostics) {
		diagnostics->payload_length = payload.size();
	}

	PayloadNodePtr root = ParsePayload(payload, options.max_depth);

	const PayloadNode *list = FindSignatureMatch(*root, options.signature_marker, options.max_depth);
	if (list) {
		return DecodePlaceList(*list, diagnostics ? &diagnostics->decode : nullptr);
	}

	auto nested = DecodeNestedPayloads(*root, options, diagnostics);
	if (nested) {
		return std::move(*nested);
	}

	throw PlaceListException(PlaceListErrorType::SIGNATURE_NOT_FOUND,
	                         "Could not locate the list details within the initialization payload. "
	                         "The JSON parsed fine, so the payload shape has most likely changed.");
}

GoogleMapsListData ExtractPlaceListFromHtml(const std::string &html, const PlaceListOptions &options,
                                            PlaceListDiagnostics *diagnostics) {
	std::string script = FindInitializationScript(html, options.script_marker);
	if (script.empty()) {
		throw PlaceListException(PlaceListErrorType::SCRIPT_NOT_FOUND,
		                         "Unable to locate the window.APP_INITIALIZATION_STATE script in the HTML document.");
	}
	return ExtractPlaceListFromScript(script, options, diagnostics);
}

} // namespace placelist
