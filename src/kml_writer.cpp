#include "kml_writer.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/types/value.hpp"
#include <libxml/xmlwriter.h>

namespace placelist {

const char *const KML_NAMESPACE = "http://www.opengis.net/kml/2.2";

// RAII wrapper for the memory buffer and the writer on top of it
class KmlWriterGuard {
public:
	KmlWriterGuard() : buffer_(xmlBufferCreate()), writer_(nullptr) {
		if (buffer_) {
			writer_ = xmlNewTextWriterMemory(buffer_, 0);
		}
	}
	~KmlWriterGuard() {
		Release();
		if (buffer_) {
			xmlBufferFree(buffer_);
		}
	}
	KmlWriterGuard(const KmlWriterGuard &) = delete;
	KmlWriterGuard &operator=(const KmlWriterGuard &) = delete;

	xmlTextWriterPtr get() const { return writer_; }
	explicit operator bool() const { return writer_ != nullptr; }

	// Frees the writer, which flushes everything into the buffer
	void Release() {
		if (writer_) {
			xmlFreeTextWriter(writer_);
			writer_ = nullptr;
		}
	}
	std::string Content() const {
		return std::string(reinterpret_cast<const char *>(xmlBufferContent(buffer_)), xmlBufferLength(buffer_));
	}

private:
	xmlBufferPtr buffer_;
	xmlTextWriterPtr writer_;
};

static void Check(int rc, const char *step) {
	if (rc < 0) {
		throw duckdb::IOException("Failed to write KML document (%s)", step);
	}
}

static const xmlChar *X(const char *str) {
	return reinterpret_cast<const xmlChar *>(str);
}

std::string FormatKmlCoordinates(const GoogleMapsPlace &place) {
	return duckdb::Value::DOUBLE(place.longitude).ToString() + "," +
	       duckdb::Value::DOUBLE(place.latitude).ToString() + ",0";
}

std::string BuildPlacemarkDescription(const GoogleMapsPlace &place) {
	std::string description;
	if (!IsBlank(place.address)) {
		description = place.address;
	}
	if (!IsBlank(place.notes)) {
		if (!description.empty()) {
			description += "\n\n";
		}
		description += place.notes;
	}
	return description;
}

static void WritePlacemark(xmlTextWriterPtr writer, const GoogleMapsPlace &place) {
	Check(xmlTextWriterStartElement(writer, X("Placemark")), "Placemark");
	Check(xmlTextWriterWriteElement(writer, X("name"), X(place.name.c_str())), "Placemark name");

	std::string description = BuildPlacemarkDescription(place);
	if (!description.empty()) {
		Check(xmlTextWriterStartElement(writer, X("description")), "description");
		// CDATA cannot contain its own terminator
		if (description.find("]]>") == std::string::npos) {
			Check(xmlTextWriterWriteCDATA(writer, X(description.c_str())), "description");
		} else {
			Check(xmlTextWriterWriteString(writer, X(description.c_str())), "description");
		}
		Check(xmlTextWriterEndElement(writer), "description");
	}

	if (place.has_coordinates) {
		Check(xmlTextWriterStartElement(writer, X("Point")), "Point");
		Check(xmlTextWriterWriteElement(writer, X("coordinates"), X(FormatKmlCoordinates(place).c_str())),
		      "coordinates");
		Check(xmlTextWriterEndElement(writer), "Point");
	}

	Check(xmlTextWriterEndElement(writer), "Placemark");
}

std::string RenderKml(const GoogleMapsListData &list) {
	KmlWriterGuard guard;
	if (!guard) {
		throw duckdb::IOException("Failed to allocate KML writer");
	}
	xmlTextWriterPtr writer = guard.get();

	Check(xmlTextWriterSetIndent(writer, 1), "indent");
	Check(xmlTextWriterSetIndentString(writer, X("  ")), "indent");
	Check(xmlTextWriterStartDocument(writer, nullptr, "UTF-8", nullptr), "start document");
	Check(xmlTextWriterStartElementNS(writer, nullptr, X("kml"), X(KML_NAMESPACE)), "kml");
	Check(xmlTextWriterStartElement(writer, X("Document")), "Document");

	Check(xmlTextWriterWriteElement(writer, X("name"), X(list.Name().c_str())), "name");
	if (!IsBlank(list.Description())) {
		Check(xmlTextWriterWriteElement(writer, X("description"), X(list.Description().c_str())), "description");
	}

	for (const auto &place : list.Places()) {
		WritePlacemark(writer, place);
	}

	// Closes Document and kml
	Check(xmlTextWriterEndDocument(writer), "end document");
	guard.Release();
	return guard.Content();
}

} // namespace placelist
