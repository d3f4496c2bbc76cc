#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace placelist {

enum class PayloadNodeType : uint8_t { NULL_VALUE = 0, BOOLEAN = 1, NUMBER = 2, STRING = 3, ARRAY = 4, OBJECT = 5 };

const char *PayloadNodeTypeToString(PayloadNodeType type);

class PayloadNode;
using PayloadNodePtr = std::unique_ptr<PayloadNode>;

// Schema-less JSON value held between parsing and decoding.
// A closed tagged union: the active member is selected by GetType().
// Nodes are built once by the factories below and never modified afterwards.
class PayloadNode {
public:
	static PayloadNodePtr Null();
	static PayloadNodePtr Boolean(bool value);
	static PayloadNodePtr Number(double value);
	static PayloadNodePtr String(std::string value);
	static PayloadNodePtr Array(std::vector<PayloadNodePtr> elements);
	static PayloadNodePtr Object(std::vector<std::pair<std::string, PayloadNodePtr>> members);

	PayloadNodeType GetType() const {
		return type_;
	}
	bool IsArray() const {
		return type_ == PayloadNodeType::ARRAY;
	}
	bool IsString() const {
		return type_ == PayloadNodeType::STRING;
	}
	bool IsNumber() const {
		return type_ == PayloadNodeType::NUMBER;
	}

	// Only meaningful for the matching type
	bool GetBoolean() const {
		return bool_value_;
	}
	double GetNumber() const {
		return number_value_;
	}
	const std::string &GetString() const {
		return string_value_;
	}
	const std::vector<PayloadNodePtr> &Elements() const {
		return elements_;
	}
	const std::vector<std::pair<std::string, PayloadNodePtr>> &Members() const {
		return members_;
	}

	// Array element at index, nullptr when this is not an array or the index is out of range
	const PayloadNode *At(size_t index) const;

	bool Equals(const PayloadNode &other) const;

	// Compact JSON rendering, used in diagnostics
	std::string ToString() const;

private:
	explicit PayloadNode(PayloadNodeType type) : type_(type) {
	}

	PayloadNodeType type_;
	bool bool_value_ = false;
	double number_value_ = 0.0;
	std::string string_value_;
	std::vector<PayloadNodePtr> elements_;
	std::vector<std::pair<std::string, PayloadNodePtr>> members_;
};

// Parse JSON text into a PayloadNode tree.
// Throws PAYLOAD_PARSE_FAILED on invalid JSON and STRUCTURE_TOO_DEEP when arrays/objects
// nest deeper than max_depth.
PayloadNodePtr ParsePayload(const std::string &json, size_t max_depth);

} // namespace placelist
