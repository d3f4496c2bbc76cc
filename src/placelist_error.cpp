#include "placelist_error.hpp"

namespace placelist {

const char *PlaceListErrorTypeToString(PlaceListErrorType type) {
	switch (type) {
		case PlaceListErrorType::NONE: return "";
		case PlaceListErrorType::SCRIPT_NOT_FOUND: return "script_not_found";
		case PlaceListErrorType::PAYLOAD_EXTRACTION_FAILED: return "payload_extraction_failed";
		case PlaceListErrorType::PAYLOAD_PARSE_FAILED: return "payload_parse_failed";
		case PlaceListErrorType::SIGNATURE_NOT_FOUND: return "signature_not_found";
		case PlaceListErrorType::STRUCTURE_TOO_DEEP: return "structure_too_deep";
		case PlaceListErrorType::REQUIRED_FIELD_MISSING: return "required_field_missing";
		default: return "unknown";
	}
}

PlaceListException::PlaceListException(PlaceListErrorType type, const std::string &message)
    : duckdb::InvalidInputException(std::string(PlaceListErrorTypeToString(type)) + ": " + message), type_(type),
      detail_(message) {
}

} // namespace placelist
