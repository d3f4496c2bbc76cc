#pragma once

#include "payload_node.hpp"
#include "placelist_model.hpp"
#include <string>
#include <vector>

namespace placelist {

//===--------------------------------------------------------------------===//
// Payload layout
//===--------------------------------------------------------------------===//
// The list array carries no field names. Fields are read by position:
//
//   list[3][0]            creator
//   list[4]               name (required)
//   list[5]               description
//   list[8]               place entries
//
//   entry[1]              location block
//   entry[1][4]           address
//   entry[1][5][2]        latitude   (only together with longitude)
//   entry[1][5][3]        longitude
//   entry[2]              place name (entry dropped when missing)
//   entry[3]              notes
//
// Bump LAYOUT_VERSION whenever an offset changes.
struct PlaceListLayout {
	static constexpr int LAYOUT_VERSION = 1;

	static constexpr size_t CREATOR_BLOCK = 3;
	static constexpr size_t CREATOR_NAME = 0;
	static constexpr size_t LIST_NAME = 4;
	static constexpr size_t LIST_DESCRIPTION = 5;
	static constexpr size_t PLACES = 8;

	static constexpr size_t PLACE_LOCATION = 1;
	static constexpr size_t PLACE_NAME = 2;
	static constexpr size_t PLACE_NOTES = 3;
	static constexpr size_t LOCATION_ADDRESS = 4;
	static constexpr size_t LOCATION_COORDINATES = 5;
	static constexpr size_t COORDINATE_LATITUDE = 2;
	static constexpr size_t COORDINATE_LONGITUDE = 3;
};

// Non-fatal anomalies seen while decoding
struct DecodeDiagnostics {
	size_t dropped_places = 0;
	size_t places_without_coordinates = 0;
	std::vector<std::string> messages;
};

// Try-get accessors: return false/nullptr when the index is out of range or the
// element has another type
const PayloadNode *TryGetArray(const PayloadNode &array, size_t index);
bool TryGetString(const PayloadNode &array, size_t index, std::string &result);
bool TryGetNumber(const PayloadNode &array, size_t index, double &result);

// Decode one place entry. Returns false when the entry has no usable name.
bool DecodePlace(const PayloadNode &entry, GoogleMapsPlace &place);

// Decode the matched list array.
// Throws REQUIRED_FIELD_MISSING when the list has no usable name; bad place entries
// are skipped and reported through diagnostics when given.
GoogleMapsListData DecodePlaceList(const PayloadNode &list, DecodeDiagnostics *diagnostics = nullptr);

} // namespace placelist
