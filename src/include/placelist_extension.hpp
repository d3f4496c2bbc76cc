#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension.hpp"

namespace placelist {

class PlacelistExtension : public duckdb::Extension {
public:
	void Load(duckdb::ExtensionLoader &loader) override;
	std::string Name() override;
	std::string Version() const override;
};

} // namespace placelist
