#pragma once

#include <string>
#include <vector>

namespace placelist {

// A single pin of a Google Maps list.
// Optional text fields are empty when the payload does not carry them.
struct GoogleMapsPlace {
	std::string name;
	std::string address;
	std::string notes;

	// Latitude and longitude only exist as a pair
	bool has_coordinates = false;
	double latitude = 0.0;
	double longitude = 0.0;

	void SetCoordinates(double lat, double lon) {
		latitude = lat;
		longitude = lon;
		has_coordinates = true;
	}

	bool operator==(const GoogleMapsPlace &other) const;
	bool operator!=(const GoogleMapsPlace &other) const {
		return !(*this == other);
	}
};

// Metadata and places of a Google Maps list, in source order.
// The name is always non-blank: the constructor throws REQUIRED_FIELD_MISSING otherwise.
class GoogleMapsListData {
public:
	GoogleMapsListData(std::string name, std::string description, std::string creator,
	                   std::vector<GoogleMapsPlace> places);

	const std::string &Name() const {
		return name_;
	}
	const std::string &Description() const {
		return description_;
	}
	const std::string &Creator() const {
		return creator_;
	}
	const std::vector<GoogleMapsPlace> &Places() const {
		return places_;
	}

	bool operator==(const GoogleMapsListData &other) const;
	bool operator!=(const GoogleMapsListData &other) const {
		return !(*this == other);
	}

private:
	std::string name_;
	std::string description_;
	std::string creator_;
	std::vector<GoogleMapsPlace> places_;
};

// True when the string is empty or only contains whitespace
bool IsBlank(const std::string &value);

} // namespace placelist
