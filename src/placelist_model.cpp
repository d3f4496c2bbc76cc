#include "placelist_model.hpp"
#include "placelist_error.hpp"
#include <cctype>
#include <utility>

namespace placelist {

bool IsBlank(const std::string &value) {
	for (char c : value) {
		if (!std::isspace(static_cast<unsigned char>(c))) {
			return false;
		}
	}
	return true;
}

bool GoogleMapsPlace::operator==(const GoogleMapsPlace &other) const {
	if (name != other.name || address != other.address || notes != other.notes) {
		return false;
	}
	if (has_coordinates != other.has_coordinates) {
		return false;
	}
	if (!has_coordinates) {
		return true;
	}
	return latitude == other.latitude && longitude == other.longitude;
}

GoogleMapsListData::GoogleMapsListData(std::string name, std::string description, std::string creator,
                                       std::vector<GoogleMapsPlace> places)
    : name_(std::move(name)), description_(std::move(description)), creator_(std::move(creator)),
      places_(std::move(places)) {
	if (IsBlank(name_)) {
		throw PlaceListException(PlaceListErrorType::REQUIRED_FIELD_MISSING, "Unable to determine the list name.");
	}
}

bool GoogleMapsListData::operator==(const GoogleMapsListData &other) const {
	return name_ == other.name_ && description_ == other.description_ && creator_ == other.creator_ &&
	       places_ == other.places_;
}

} // namespace placelist
