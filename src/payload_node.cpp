#include "payload_node.hpp"
#include "placelist_error.hpp"
#include "payload_document.hpp"
#include <cstdio>

namespace placelist {

using namespace duckdb_yyjson;

const char *PayloadNodeTypeToString(PayloadNodeType type) {
	switch (type) {
		case PayloadNodeType::NULL_VALUE: return "null";
		case PayloadNodeType::BOOLEAN: return "boolean";
		case PayloadNodeType::NUMBER: return "number";
		case PayloadNodeType::STRING: return "string";
		case PayloadNodeType::ARRAY: return "array";
		case PayloadNodeType::OBJECT: return "object";
		default: return "unknown";
	}
}

//===--------------------------------------------------------------------===//
// Factories
//===--------------------------------------------------------------------===//

PayloadNodePtr PayloadNode::Null() {
	return PayloadNodePtr(new PayloadNode(PayloadNodeType::NULL_VALUE));
}

PayloadNodePtr PayloadNode::Boolean(bool value) {
	PayloadNodePtr node(new PayloadNode(PayloadNodeType::BOOLEAN));
	node->bool_value_ = value;
	return node;
}

PayloadNodePtr PayloadNode::Number(double value) {
	PayloadNodePtr node(new PayloadNode(PayloadNodeType::NUMBER));
	node->number_value_ = value;
	return node;
}

PayloadNodePtr PayloadNode::String(std::string value) {
	PayloadNodePtr node(new PayloadNode(PayloadNodeType::STRING));
	node->string_value_ = std::move(value);
	return node;
}

PayloadNodePtr PayloadNode::Array(std::vector<PayloadNodePtr> elements) {
	PayloadNodePtr node(new PayloadNode(PayloadNodeType::ARRAY));
	node->elements_ = std::move(elements);
	return node;
}

PayloadNodePtr PayloadNode::Object(std::vector<std::pair<std::string, PayloadNodePtr>> members) {
	PayloadNodePtr node(new PayloadNode(PayloadNodeType::OBJECT));
	node->members_ = std::move(members);
	return node;
}

const PayloadNode *PayloadNode::At(size_t index) const {
	if (type_ != PayloadNodeType::ARRAY || index >= elements_.size()) {
		return nullptr;
	}
	return elements_[index].get();
}

bool PayloadNode::Equals(const PayloadNode &other) const {
	if (type_ != other.type_) {
		return false;
	}
	switch (type_) {
		case PayloadNodeType::NULL_VALUE:
			return true;
		case PayloadNodeType::BOOLEAN:
			return bool_value_ == other.bool_value_;
		case PayloadNodeType::NUMBER:
			return number_value_ == other.number_value_;
		case PayloadNodeType::STRING:
			return string_value_ == other.string_value_;
		case PayloadNodeType::ARRAY:
			if (elements_.size() != other.elements_.size()) {
				return false;
			}
			for (size_t i = 0; i < elements_.size(); i++) {
				if (!elements_[i]->Equals(*other.elements_[i])) {
					return false;
				}
			}
			return true;
		case PayloadNodeType::OBJECT:
			// Member order is irrelevant
			if (members_.size() != other.members_.size()) {
				return false;
			}
			for (const auto &member : members_) {
				bool matched = false;
				for (const auto &candidate : other.members_) {
					if (candidate.first == member.first && candidate.second->Equals(*member.second)) {
						matched = true;
						break;
					}
				}
				if (!matched) {
					return false;
				}
			}
			return true;
	}
	return false;
}

static void AppendQuoted(const std::string &value, std::string &out) {
	out += '"';
	for (unsigned char c : value) {
		switch (c) {
			case '"': out += "\\\""; break;
			case '\\': out += "\\\\"; break;
			case '\n': out += "\\n"; break;
			case '\r': out += "\\r"; break;
			case '\t': out += "\\t"; break;
			default:
				if (c < 0x20) {
					char hex_buf[7];
					snprintf(hex_buf, sizeof(hex_buf), "\\u%04x", c);
					out += hex_buf;
				} else {
					out += static_cast<char>(c);
				}
		}
	}
	out += '"';
}

static void AppendNode(const PayloadNode &node, std::string &out) {
	switch (node.GetType()) {
		case PayloadNodeType::NULL_VALUE:
			out += "null";
			return;
		case PayloadNodeType::BOOLEAN:
			out += node.GetBoolean() ? "true" : "false";
			return;
		case PayloadNodeType::NUMBER: {
			char num_buf[32];
			snprintf(num_buf, sizeof(num_buf), "%.17g", node.GetNumber());
			out += num_buf;
			return;
		}
		case PayloadNodeType::STRING:
			AppendQuoted(node.GetString(), out);
			return;
		case PayloadNodeType::ARRAY: {
			out += '[';
			bool first = true;
			for (const auto &element : node.Elements()) {
				if (!first) {
					out += ',';
				}
				first = false;
				AppendNode(*element, out);
			}
			out += ']';
			return;
		}
		case PayloadNodeType::OBJECT: {
			out += '{';
			bool first = true;
			for (const auto &member : node.Members()) {
				if (!first) {
					out += ',';
				}
				first = false;
				AppendQuoted(member.first, out);
				out += ':';
				AppendNode(*member.second, out);
			}
			out += '}';
			return;
		}
	}
}

std::string PayloadNode::ToString() const {
	std::string result;
	AppendNode(*this, result);
	return result;
}

//===--------------------------------------------------------------------===//
// yyjson conversion
//===--------------------------------------------------------------------===//

static PayloadNodePtr ConvertValue(yyjson_val *val, size_t depth, size_t max_depth) {
	// depth counts the enclosing containers including this one
	if ((yyjson_is_arr(val) || yyjson_is_obj(val)) && depth > max_depth) {
		throw PlaceListException(PlaceListErrorType::STRUCTURE_TOO_DEEP,
		                         "Initialization payload nests deeper than " + std::to_string(max_depth) + " levels.");
	}

	if (yyjson_is_arr(val)) {
		std::vector<PayloadNodePtr> elements;
		elements.reserve(yyjson_arr_size(val));
		yyjson_arr_iter iter;
		yyjson_arr_iter_init(val, &iter);
		yyjson_val *element;
		while ((element = yyjson_arr_iter_next(&iter))) {
			elements.push_back(ConvertValue(element, depth + 1, max_depth));
		}
		return PayloadNode::Array(std::move(elements));
	}
	if (yyjson_is_obj(val)) {
		std::vector<std::pair<std::string, PayloadNodePtr>> members;
		members.reserve(yyjson_obj_size(val));
		yyjson_obj_iter iter;
		yyjson_obj_iter_init(val, &iter);
		yyjson_val *key;
		while ((key = yyjson_obj_iter_next(&iter))) {
			yyjson_val *member = yyjson_obj_iter_get_val(key);
			std::string name(yyjson_get_str(key), yyjson_get_len(key));
			members.emplace_back(std::move(name), ConvertValue(member, depth + 1, max_depth));
		}
		return PayloadNode::Object(std::move(members));
	}
	if (yyjson_is_str(val)) {
		return PayloadNode::String(std::string(yyjson_get_str(val), yyjson_get_len(val)));
	}
	if (yyjson_is_num(val)) {
		return PayloadNode::Number(yyjson_get_num(val));
	}
	if (yyjson_is_bool(val)) {
		return PayloadNode::Boolean(yyjson_get_bool(val));
	}
	return PayloadNode::Null();
}

PayloadNodePtr ParsePayload(const std::string &json, size_t max_depth) {
	PayloadDocument doc(json);
	if (!doc.Ok()) {
		const yyjson_read_err &err = doc.Error();
		std::string message = "Initialization payload is not valid JSON";
		if (err.msg) {
			message += ": ";
			message += err.msg;
		}
		message += " (at byte " + std::to_string(err.pos) + ")";
		throw PlaceListException(PlaceListErrorType::PAYLOAD_PARSE_FAILED, message);
	}

	yyjson_val *root = doc.Root();
	if (!root) {
		throw PlaceListException(PlaceListErrorType::PAYLOAD_PARSE_FAILED, "Empty initialization payload.");
	}
	return ConvertValue(root, 1, max_depth);
}

} // namespace placelist
