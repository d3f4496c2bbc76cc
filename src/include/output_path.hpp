#pragma once

#include <string>

namespace placelist {

// Replace characters that are not allowed in file names (on any common platform) and
// control characters with '_', trim surrounding '_' and spaces.
// Falls back to "GoogleMapsList" when nothing usable remains.
std::string SanitizeFileName(const std::string &name);

// Absolute destination of the KML file.
// A non-blank requested path wins; otherwise "<sanitized list name>.kml".
// Relative paths are resolved against working_directory.
std::string ResolveOutputPath(const std::string &requested_path, const std::string &list_name,
                              const std::string &working_directory);

// Directory part of path, empty when there is none
std::string ParentDirectory(const std::string &path);

} // namespace placelist
