// KML functions for Google Maps lists
// export_placelist_kml() writes a .kml file, placelist_kml() renders one in memory

#include "duckdb.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/logging/logger.hpp"
#include "kml_writer.hpp"
#include "output_path.hpp"
#include "placelist_functions.hpp"

namespace placelist {

using namespace duckdb;

//===--------------------------------------------------------------------===//
// export_placelist_kml
//===--------------------------------------------------------------------===//

struct ExportKmlBindData : public TableFunctionData {
	string url;
	// Empty means "<list name>.kml" in the working directory
	string output_path;
	PlaceListSettings settings;
};

struct ExportKmlGlobalState : public GlobalTableFunctionState {
	bool done = false;

	idx_t MaxThreads() const override { return 1; }
};

static unique_ptr<FunctionData> ExportKmlBind(ClientContext &context, TableFunctionBindInput &input,
                                              vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<ExportKmlBindData>();

	if (input.inputs.empty() || input.inputs[0].IsNull()) {
		throw BinderException("export_placelist_kml() requires a URL argument");
	}
	bind_data->url = StringValue::Get(input.inputs[0]);

	bind_data->settings = ReadPlaceListSettings(context);
	for (auto &kv : input.named_parameters) {
		if (kv.first == "output") {
			if (kv.second.IsNull()) {
				throw BinderException("Parameter 'output' cannot be NULL");
			}
			bind_data->output_path = StringValue::Get(kv.second);
		} else if (!ApplyPlaceListParameter(bind_data->settings, kv.first, kv.second)) {
			throw BinderException("export_placelist_kml() does not support parameter '%s'", kv.first);
		}
	}

	auto url_error = GetListUrlValidationError(bind_data->url);
	if (!url_error.empty()) {
		throw BinderException("Invalid list URL: %s", url_error);
	}

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("output_path");

	return_types.push_back(LogicalType::VARCHAR);
	names.push_back("list_name");

	return_types.push_back(LogicalType::BIGINT);
	names.push_back("place_count");

	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> ExportKmlInitGlobal(ClientContext &context,
                                                                TableFunctionInitInput &input) {
	return make_uniq<ExportKmlGlobalState>();
}

static void CreateDirectories(FileSystem &fs, const string &directory) {
	if (directory.empty() || fs.DirectoryExists(directory)) {
		return;
	}
	CreateDirectories(fs, ParentDirectory(directory));
	fs.CreateDirectory(directory);
}

static void WriteTextFile(FileSystem &fs, const string &path, const string &content) {
	CreateDirectories(fs, ParentDirectory(path));
	auto handle = fs.OpenFile(path, FileFlags::FILE_FLAGS_WRITE | FileFlags::FILE_FLAGS_FILE_CREATE_NEW);
	handle->Write(const_cast<char *>(content.data()), content.size());
	handle->Sync();
	handle->Close();
}

static void ExportKmlFunction(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
	auto &bind_data = data.bind_data->Cast<ExportKmlBindData>();
	auto &state = data.global_state->Cast<ExportKmlGlobalState>();

	if (state.done) {
		output.SetCardinality(0);
		return;
	}
	state.done = true;

	auto list = DownloadPlaceList(context, bind_data.url, bind_data.settings);

	auto &fs = FileSystem::GetFileSystem(context);
	auto path = ResolveOutputPath(bind_data.output_path, list.Name(), FileSystem::GetWorkingDirectory());
	DUCKDB_LOG_DEBUG(context, "Preparing to write KML file to %s", path);

	WriteTextFile(fs, path, RenderKml(list));
	DUCKDB_LOG_INFO(context, "KML file created at %s", path);

	output.SetValue(0, 0, Value(path));
	output.SetValue(1, 0, Value(list.Name()));
	output.SetValue(2, 0, Value::BIGINT(static_cast<int64_t>(list.Places().size())));
	output.SetCardinality(1);
}

//===--------------------------------------------------------------------===//
// placelist_kml
//===--------------------------------------------------------------------===//

static void PlaceListKmlFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &context = state.GetContext();
	auto settings = ReadPlaceListSettings(context);

	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t html) {
		auto list = DecodePlaceListHtml(context, html.GetString(), settings.options);
		return StringVector::AddString(result, RenderKml(list));
	});
}

//===--------------------------------------------------------------------===//
// Register Functions
//===--------------------------------------------------------------------===//

void RegisterKmlFunctions(ExtensionLoader &loader) {
	TableFunction export_func("export_placelist_kml", {LogicalType::VARCHAR}, ExportKmlFunction, ExportKmlBind,
	                          ExportKmlInitGlobal);
	export_func.named_parameters["output"] = LogicalType::VARCHAR;
	export_func.named_parameters["user_agent"] = LogicalType::VARCHAR;
	export_func.named_parameters["accept_language"] = LogicalType::VARCHAR;
	export_func.named_parameters["timeout"] = LogicalType::INTEGER;
	export_func.named_parameters["max_depth"] = LogicalType::INTEGER;
	loader.RegisterFunction(export_func);

	ScalarFunction kml_func("placelist_kml", {LogicalType::VARCHAR}, LogicalType::VARCHAR, PlaceListKmlFunction);
	loader.RegisterFunction(kml_func);
}

} // namespace placelist
