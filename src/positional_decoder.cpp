#include "positional_decoder.hpp"
#include "placelist_error.hpp"

namespace placelist {

constexpr int PlaceListLayout::LAYOUT_VERSION;
constexpr size_t PlaceListLayout::CREATOR_BLOCK;
constexpr size_t PlaceListLayout::CREATOR_NAME;
constexpr size_t PlaceListLayout::LIST_NAME;
constexpr size_t PlaceListLayout::LIST_DESCRIPTION;
constexpr size_t PlaceListLayout::PLACES;
constexpr size_t PlaceListLayout::PLACE_LOCATION;
constexpr size_t PlaceListLayout::PLACE_NAME;
constexpr size_t PlaceListLayout::PLACE_NOTES;
constexpr size_t PlaceListLayout::LOCATION_ADDRESS;
constexpr size_t PlaceListLayout::LOCATION_COORDINATES;
constexpr size_t PlaceListLayout::COORDINATE_LATITUDE;
constexpr size_t PlaceListLayout::COORDINATE_LONGITUDE;

const PayloadNode *TryGetArray(const PayloadNode &array, size_t index) {
	const PayloadNode *element = array.At(index);
	if (!element || !element->IsArray()) {
		return nullptr;
	}
	return element;
}

bool TryGetString(const PayloadNode &array, size_t index, std::string &result) {
	const PayloadNode *element = array.At(index);
	if (!element || !element->IsString()) {
		return false;
	}
	result = element->GetString();
	return true;
}

bool TryGetNumber(const PayloadNode &array, size_t index, double &result) {
	const PayloadNode *element = array.At(index);
	if (!element || !element->IsNumber()) {
		return false;
	}
	result = element->GetNumber();
	return true;
}

static void DecodeLocation(const PayloadNode &location, GoogleMapsPlace &place) {
	TryGetString(location, PlaceListLayout::LOCATION_ADDRESS, place.address);

	const PayloadNode *coordinates = TryGetArray(location, PlaceListLayout::LOCATION_COORDINATES);
	if (!coordinates) {
		return;
	}
	double latitude;
	double longitude;
	if (!TryGetNumber(*coordinates, PlaceListLayout::COORDINATE_LATITUDE, latitude) ||
	    !TryGetNumber(*coordinates, PlaceListLayout::COORDINATE_LONGITUDE, longitude)) {
		return;
	}
	place.SetCoordinates(latitude, longitude);
}

bool DecodePlace(const PayloadNode &entry, GoogleMapsPlace &place) {
	place = GoogleMapsPlace();
	if (!TryGetString(entry, PlaceListLayout::PLACE_NAME, place.name) || IsBlank(place.name)) {
		return false;
	}
	TryGetString(entry, PlaceListLayout::PLACE_NOTES, place.notes);

	const PayloadNode *location = TryGetArray(entry, PlaceListLayout::PLACE_LOCATION);
	if (location) {
		DecodeLocation(*location, place);
	}
	return true;
}

GoogleMapsListData DecodePlaceList(const PayloadNode &list, DecodeDiagnostics *diagnostics) {
	std::string name;
	if (!TryGetString(list, PlaceListLayout::LIST_NAME, name) || IsBlank(name)) {
		throw PlaceListException(PlaceListErrorType::REQUIRED_FIELD_MISSING, "Unable to determine the list name.");
	}

	std::string description;
	TryGetString(list, PlaceListLayout::LIST_DESCRIPTION, description);

	std::string creator;
	const PayloadNode *creator_block = TryGetArray(list, PlaceListLayout::CREATOR_BLOCK);
	if (creator_block) {
		TryGetString(*creator_block, PlaceListLayout::CREATOR_NAME, creator);
	}

	std::vector<GoogleMapsPlace> places;
	const PayloadNode *entries = TryGetArray(list, PlaceListLayout::PLACES);
	if (entries) {
		places.reserve(entries->Elements().size());
		for (size_t i = 0; i < entries->Elements().size(); i++) {
			const PayloadNode &entry = *entries->Elements()[i];
			if (!entry.IsArray()) {
				if (diagnostics) {
					diagnostics->dropped_places++;
					diagnostics->messages.push_back("Skipped place entry " + std::to_string(i) + ": expected array, got " +
					                                PayloadNodeTypeToString(entry.GetType()));
				}
				continue;
			}
			GoogleMapsPlace place;
			if (!DecodePlace(entry, place)) {
				if (diagnostics) {
					diagnostics->dropped_places++;
					diagnostics->messages.push_back("Skipped place entry " + std::to_string(i) +
					                                " without a name: " + entry.ToString().substr(0, 200));
				}
				continue;
			}
			if (!place.has_coordinates && diagnostics) {
				diagnostics->places_without_coordinates++;
				diagnostics->messages.push_back("Place '" + place.name + "' has no coordinates");
			}
			places.push_back(std::move(place));
		}
	} else if (diagnostics) {
		diagnostics->messages.push_back("List array carries no place entries");
	}

	return GoogleMapsListData(std::move(name), std::move(description), std::move(creator), std::move(places));
}

} // namespace placelist
