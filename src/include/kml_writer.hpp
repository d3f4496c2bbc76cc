#pragma once

#include "placelist_model.hpp"
#include <string>

namespace placelist {

extern const char *const KML_NAMESPACE;

// Render the list as an indented UTF-8 KML 2.2 document.
// Throws duckdb::IOException when libxml2 fails to produce the document.
std::string RenderKml(const GoogleMapsListData &list);

// "lon,lat,0" as expected by <coordinates>
std::string FormatKmlCoordinates(const GoogleMapsPlace &place);

// Address and notes joined by a blank line, skipping blank parts
std::string BuildPlacemarkDescription(const GoogleMapsPlace &place);

} // namespace placelist
