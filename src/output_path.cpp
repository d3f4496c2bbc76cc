#include "output_path.hpp"
#include "placelist_model.hpp"
#include "duckdb/common/string_util.hpp"
#include <cctype>

namespace placelist {

using duckdb::StringUtil;

static const char *const DEFAULT_FILE_NAME = "GoogleMapsList";
static const char *const INVALID_FILE_NAME_CHARS = "<>:\"/\\|?*";

std::string SanitizeFileName(const std::string &name) {
	if (IsBlank(name)) {
		return DEFAULT_FILE_NAME;
	}

	std::string sanitized;
	sanitized.reserve(name.size());
	for (char c : name) {
		unsigned char uc = static_cast<unsigned char>(c);
		if (uc < 0x20 || uc == 0x7f || std::string(INVALID_FILE_NAME_CHARS).find(c) != std::string::npos) {
			sanitized += '_';
		} else {
			sanitized += c;
		}
	}

	size_t start = sanitized.find_first_not_of("_ ");
	if (start == std::string::npos) {
		return DEFAULT_FILE_NAME;
	}
	size_t end = sanitized.find_last_not_of("_ ");
	return sanitized.substr(start, end - start + 1);
}

static bool IsAbsolutePath(const std::string &path) {
	if (StringUtil::StartsWith(path, "/") || StringUtil::StartsWith(path, "\\")) {
		return true;
	}
	// Windows drive letter, e.g. C:\ or C:/
	return path.size() >= 3 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':' &&
	       (path[2] == '\\' || path[2] == '/');
}

static std::string JoinPath(const std::string &directory, const std::string &file) {
	if (directory.empty()) {
		return file;
	}
	char last = directory.back();
	if (last == '/' || last == '\\') {
		return directory + file;
	}
	return directory + "/" + file;
}

std::string ResolveOutputPath(const std::string &requested_path, const std::string &list_name,
                              const std::string &working_directory) {
	std::string path;
	if (!IsBlank(requested_path)) {
		path = requested_path;
	} else {
		path = SanitizeFileName(list_name);
		if (!StringUtil::EndsWith(StringUtil::Lower(path), ".kml")) {
			path += ".kml";
		}
	}

	if (IsAbsolutePath(path)) {
		return path;
	}
	if (StringUtil::StartsWith(path, "./")) {
		path = path.substr(2);
	}
	return JoinPath(working_directory, path);
}

std::string ParentDirectory(const std::string &path) {
	size_t pos = path.find_last_of("/\\");
	if (pos == std::string::npos || pos == 0) {
		return "";
	}
	return path.substr(0, pos);
}

} // namespace placelist
