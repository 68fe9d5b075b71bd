#include <iostream>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include <CanopyTools.Traits/ExperimentMetadata.h>

#include "../TestRasters.h"

using namespace CanopyTools::Traits;
using namespace CanopyTools::Tests;

int main()
{
	auto document = nlohmann::json::parse(R"([
		{
			"timestamp": "2018-05-01T12:30:45",
			"species": "Sorghum bicolor",
			"plots": [ { "name": 12, "species": "Zea mays" }, { "name": "North" }, "invalid" ]
		},
		{ "germplasmName": "PI 123", "species": null, "season": 4 }
	])");

	ExperimentMetadata metadata = ExperimentMetadata::fromJson(document);
	if (metadata.records().size() != 2)
	{
		std::cerr << "record count mismatch\n";
		return 1;
	}

	const MetadataRecord& first = metadata.records()[0];
	if (!first.species || *first.species != "Sorghum bicolor" || first.plots.size() != 2)
	{
		std::cerr << "first record mismatch\n";
		return 1;
	}
	if (!first.plots[0].name || *first.plots[0].name != "12" || *first.plots[0].species != "Zea mays")
	{
		std::cerr << "numeric plot name was not converted\n";
		return 1;
	}
	if (first.plots[1].species)
	{
		std::cerr << "absent plot species is present\n";
		return 1;
	}

	const MetadataRecord& second = metadata.records()[1];
	if (second.species || !second.germplasmName || *second.germplasmName != "PI 123")
	{
		std::cerr << "second record mismatch\n";
		return 1;
	}

	if (!metadata.timestamp() || *metadata.timestamp() != "2018-05-01T12:30:45")
	{
		std::cerr << "timestamp fallback mismatch\n";
		return 1;
	}

	// Files
	TemporaryDirectory directory;
	fs::path objectFile = directory.path() / "object.json";
	fs::path invalidFile = directory.path() / "invalid.json";
	{
		std::ofstream out(objectFile.string());
		out << R"({ "species": "Triticum" })";
	}
	{
		std::ofstream out(invalidFile.string());
		out << "{ not json";
	}

	ExperimentMetadata loaded = ExperimentMetadata::load({ objectFile.string(), objectFile.string() });
	if (loaded.records().size() != 2 || *loaded.records()[1].species != "Triticum" || loaded.timestamp())
	{
		std::cerr << "loaded metadata mismatch\n";
		return 1;
	}

	bool thrown = false;
	try
	{
		ExperimentMetadata::load({ invalidFile.string() });
	}
	catch (std::runtime_error&)
	{
		thrown = true;
	}
	if (!thrown)
	{
		std::cerr << "invalid metadata file was accepted\n";
		return 1;
	}

	thrown = false;
	try
	{
		ExperimentMetadata::fromJson(nlohmann::json::parse("[1, 2]"));
	}
	catch (std::invalid_argument&)
	{
		thrown = true;
	}
	if (!thrown)
	{
		std::cerr << "non-object record was accepted\n";
		return 1;
	}

	return 0;
}
