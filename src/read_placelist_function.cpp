// read_placelist() and parse_placelist() table functions
// One row per place of a Google Maps list

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"
#include "placelist_functions.hpp"

namespace placelist {

using namespace duckdb;

//===--------------------------------------------------------------------===//
// Bind Data
//===--------------------------------------------------------------------===//

struct ReadPlaceListBindData : public TableFunctionData {
	// URL for read_placelist, HTML text for parse_placelist
	string source;
	bool source_is_html = false;
	PlaceListSettings settings;
};

//===--------------------------------------------------------------------===//
// Global State
//===--------------------------------------------------------------------===//

struct ReadPlaceListGlobalState : public GlobalTableFunctionState {
	unique_ptr<GoogleMapsListData> list;
	idx_t current_idx = 0;
	bool fetched = false;

	idx_t MaxThreads() const override { return 1; }
};

//===--------------------------------------------------------------------===//
// Bind Function
//===--------------------------------------------------------------------===//

static void AddPlaceColumns(vector<LogicalType> &return_types, vector<string> &names) {
	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("list_name");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("list_description");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("list_creator");

	return_types.push_back(LogicalType::BIGINT);
	names.push_back("place_index");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("name");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("address");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("notes");

	return_types.push_back(LogicalType::DOUBLE);
	names.push_back("latitude");

	return_types.push_back(LogicalType::DOUBLE);
	names.push_back("longitude");
}

static unique_ptr<FunctionData> BindPlaceList(ClientContext &context, TableFunctionBindInput &input,
                                              vector<LogicalType> &return_types, vector<string> &names,
                                              bool source_is_html) {
	auto bind_data = make_uniq<ReadPlaceListBindData>();
	bind_data->source_is_html = source_is_html;

	const char *function_name = source_is_html ? "parse_placelist" : "read_placelist";
	if (input.inputs.empty() || input.inputs[0].IsNull()) {
		throw BinderException("%s() requires a %s argument", function_name, source_is_html ? "HTML" : "URL");
	}
	bind_data->source = StringValue::Get(input.inputs[0]);

	bind_data->settings = ReadPlaceListSettings(context);
	for (auto &kv : input.named_parameters) {
		if (!ApplyPlaceListParameter(bind_data->settings, kv.first, kv.second)) {
			throw BinderException("%s() does not support parameter '%s'", function_name, kv.first);
		}
	}

	if (!source_is_html) {
		auto url_error = GetListUrlValidationError(bind_data->source);
		if (!url_error.empty()) {
			throw BinderException("Invalid list URL: %s", url_error);
		}
	}

	AddPlaceColumns(return_types, names);
	return std::move(bind_data);
}

static unique_ptr<FunctionData> ReadPlaceListBind(ClientContext &context, TableFunctionBindInput &input,
                                                  vector<LogicalType> &return_types, vector<string> &names) {
	return BindPlaceList(context, input, return_types, names, false);
}

static unique_ptr<FunctionData> ParsePlaceListBind(ClientContext &context, TableFunctionBindInput &input,
                                                   vector<LogicalType> &return_types, vector<string> &names) {
	return BindPlaceList(context, input, return_types, names, true);
}

//===--------------------------------------------------------------------===//
// Init Global
//===--------------------------------------------------------------------===//

static unique_ptr<GlobalTableFunctionState> ReadPlaceListInitGlobal(ClientContext &context,
                                                                    TableFunctionInitInput &input) {
	return make_uniq<ReadPlaceListGlobalState>();
}

//===--------------------------------------------------------------------===//
// Table Function
//===--------------------------------------------------------------------===//

static Value OptionalText(const std::string &text) {
	return text.empty() ? Value() : Value(text);
}

static void ReadPlaceListFunction(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
	auto &bind_data = data.bind_data->Cast<ReadPlaceListBindData>();
	auto &state = data.global_state->Cast<ReadPlaceListGlobalState>();

	// Fetch and decode on first call
	if (!state.fetched) {
		if (bind_data.source_is_html) {
			state.list = make_uniq<GoogleMapsListData>(
			    DecodePlaceListHtml(context, bind_data.source, bind_data.settings.options));
		} else {
			state.list = make_uniq<GoogleMapsListData>(
			    DownloadPlaceList(context, bind_data.source, bind_data.settings));
		}
		state.fetched = true;
	}

	auto &list = *state.list;
	auto &places = list.Places();

	idx_t count = 0;
	while (count < STANDARD_VECTOR_SIZE && state.current_idx < places.size()) {
		const auto &place = places[state.current_idx];

		output.SetValue(0, count, Value(list.Name()));
		output.SetValue(1, count, OptionalText(list.Description()));
		output.SetValue(2, count, OptionalText(list.Creator()));
		output.SetValue(3, count, Value::BIGINT(static_cast<int64_t>(state.current_idx)));
		output.SetValue(4, count, Value(place.name));
		output.SetValue(5, count, OptionalText(place.address));
		output.SetValue(6, count, OptionalText(place.notes));
		output.SetValue(7, count, place.has_coordinates ? Value::DOUBLE(place.latitude) : Value());
		output.SetValue(8, count, place.has_coordinates ? Value::DOUBLE(place.longitude) : Value());

		state.current_idx++;
		count++;
	}

	output.SetCardinality(count);
}

//===--------------------------------------------------------------------===//
// Register Functions
//===--------------------------------------------------------------------===//

static void AddNamedParameters(TableFunction &function, bool with_http) {
	if (with_http) {
		function.named_parameters["user_agent"] = LogicalType::VARCHAR;
		function.named_parameters["accept_language"] = LogicalType::VARCHAR;
		function.named_parameters["timeout"] = LogicalType::INTEGER;
	}
	function.named_parameters["max_depth"] = LogicalType::INTEGER;
}

void RegisterReadPlaceListFunctions(ExtensionLoader &loader) {
	TableFunction read_func("read_placelist", {LogicalType::VARCHAR}, ReadPlaceListFunction, ReadPlaceListBind,
	                        ReadPlaceListInitGlobal);
	AddNamedParameters(read_func, true);
	loader.RegisterFunction(read_func);

	TableFunction parse_func("parse_placelist", {LogicalType::VARCHAR}, ReadPlaceListFunction, ParsePlaceListBind,
	                         ReadPlaceListInitGlobal);
	AddNamedParameters(parse_func, false);
	loader.RegisterFunction(parse_func);
}

} // namespace placelist
