#include "script_locator.hpp"
#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

namespace placelist {

const char *const INITIALIZATION_SCRIPT_MARKER = "window.APP_INITIALIZATION_STATE";

// RAII wrapper for xmlDoc
class ScriptDocGuard {
public:
	explicit ScriptDocGuard(xmlDocPtr doc) : doc_(doc) {}
	~ScriptDocGuard() {
		if (doc_) {
			xmlFreeDoc(doc_);
		}
	}
	ScriptDocGuard(const ScriptDocGuard &) = delete;
	ScriptDocGuard &operator=(const ScriptDocGuard &) = delete;

	xmlDocPtr get() const { return doc_; }
	explicit operator bool() const { return doc_ != nullptr; }
private:
	xmlDocPtr doc_;
};

static std::string GetNodeText(xmlNodePtr node) {
	xmlChar *content = xmlNodeGetContent(node);
	if (!content) {
		return "";
	}
	std::string result(reinterpret_cast<char *>(content));
	xmlFree(content);
	return result;
}

// Depth-first, document order
static bool FindScript(xmlNodePtr node, const std::string &marker, std::string &result) {
	for (xmlNodePtr cur = node; cur; cur = cur->next) {
		if (cur->type != XML_ELEMENT_NODE) {
			continue;
		}
		if (xmlStrcasecmp(cur->name, BAD_CAST "script") == 0) {
			std::string text = GetNodeText(cur);
			if (text.find(marker) != std::string::npos) {
				result = std::move(text);
				return true;
			}
			continue;
		}
		if (cur->children && FindScript(cur->children, marker, result)) {
			return true;
		}
	}
	return false;
}

std::string FindInitializationScript(const std::string &html, const std::string &marker) {
	if (html.empty()) {
		return "";
	}

	ScriptDocGuard doc(htmlReadMemory(html.c_str(), static_cast<int>(html.size()), nullptr, "UTF-8",
	                                  HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
	                                      HTML_PARSE_NONET));
	if (!doc) {
		return "";
	}

	xmlNodePtr root = xmlDocGetRootElement(doc.get());
	if (!root) {
		return "";
	}

	std::string result;
	FindScript(root, marker, result);
	return result;
}

} // namespace placelist
