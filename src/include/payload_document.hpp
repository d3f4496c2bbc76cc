#pragma once

#include "yyjson.hpp"
#include <string>

namespace placelist {

// Owns the yyjson document read from one payload slice.
// Check Ok() before touching Root(); Error() describes a failed read.
class PayloadDocument {
public:
	explicit PayloadDocument(const std::string &json) : doc_(nullptr), error_() {
		doc_ = duckdb_yyjson::yyjson_read_opts(const_cast<char *>(json.data()), json.size(),
		                                       duckdb_yyjson::YYJSON_READ_NOFLAG, nullptr, &error_);
	}
	~PayloadDocument() {
		if (doc_) {
			duckdb_yyjson::yyjson_doc_free(doc_);
		}
	}

	PayloadDocument(const PayloadDocument &) = delete;
	PayloadDocument &operator=(const PayloadDocument &) = delete;

	bool Ok() const {
		return doc_ != nullptr;
	}
	duckdb_yyjson::yyjson_val *Root() const {
		return doc_ ? duckdb_yyjson::yyjson_doc_get_root(doc_) : nullptr;
	}
	const duckdb_yyjson::yyjson_read_err &Error() const {
		return error_;
	}

private:
	duckdb_yyjson::yyjson_doc *doc_;
	duckdb_yyjson::yyjson_read_err error_;
};

} // namespace placelist
