#pragma once

#include <string>
#include <cstdint>
#include "duckdb/common/exception.hpp"

namespace placelist {

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

// Failure kinds of the extraction pipeline, in pipeline order
enum class PlaceListErrorType : uint8_t {
	NONE = 0,
	SCRIPT_NOT_FOUND = 1,
	PAYLOAD_EXTRACTION_FAILED = 2,
	PAYLOAD_PARSE_FAILED = 3,
	SIGNATURE_NOT_FOUND = 4,
	STRUCTURE_TOO_DEEP = 5,
	REQUIRED_FIELD_MISSING = 6
};

const char *PlaceListErrorTypeToString(PlaceListErrorType type);

// Raised by the extraction pipeline. The message is prefixed with the error kind,
// e.g. "signature_not_found: ...", so that SQL users can tell the kinds apart.
class PlaceListException : public duckdb::InvalidInputException {
public:
	PlaceListException(PlaceListErrorType type, const std::string &message);

	PlaceListErrorType GetType() const {
		return type_;
	}
	const std::string &GetDetail() const {
		return detail_;
	}

private:
	PlaceListErrorType type_;
	std::string detail_;
};

} // namespace placelist
