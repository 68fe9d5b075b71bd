#include <iostream>
#include <vector>
#include <string>

#include <boost/algorithm/string.hpp>

#include <CanopyTools.Traits/TraitTable.h>
#include <CanopyTools.Vegetation/RecordWriter.h>

#include "../TestRasters.h"

using namespace CanopyTools::Traits;
using namespace CanopyTools::Vegetation;
using namespace CanopyTools::Tests;

int main()
{
	TemporaryDirectory directory;
	TraitTable table(TraitConfiguration::standard());

	fs::path path = directory.path() / "canopycover.csv";
	std::vector<std::vector<std::string>> rows;
	{
		CsvWriter writer(path, table.fieldNames());
		if (!fs::exists(writer.partialPath()) || fs::exists(path))
		{
			std::cerr << "rows are not written into the partial file\n";
			return 1;
		}

		TraitRecord traits;
		for (int i = 0; i < 3; ++i)
		{
			traits.set(TraitField::CanopyCover, std::to_string(10 * i));
			traits.set(TraitField::Site, "plot_" + std::to_string(i));
			rows.push_back(traitRow(table.generateTraitsList(traits)));
			writer.writeRow(rows.back());
		}
		writer.commit();
	}

	if (!fs::exists(path) || fs::exists(path.string() + ".part"))
	{
		std::cerr << "commit did not rename the partial file\n";
		return 1;
	}

	std::vector<std::string> lines = readLines(path);
	if (lines.size() != 4 || lines[0] != "local_datetime,canopy_cover,species,site,method")
	{
		std::cerr << "header mismatch\n";
		return 1;
	}
	for (std::size_t i = 0; i < rows.size(); ++i)
	{
		std::vector<std::string> values;
		boost::split(values, lines[i + 1], boost::is_any_of(","));
		if (values != rows[i])
		{
			std::cerr << "row " << i << " mismatch: " << lines[i + 1] << "\n";
			return 1;
		}
	}
	if (lines[1] != ",0,Unknown,plot_0,Green Canopy Cover Estimation from Field Scanner RGB images")
	{
		std::cerr << "row rendering mismatch: " << lines[1] << "\n";
		return 1;
	}

	// Abandoned writers leave nothing behind
	fs::path abandoned = directory.path() / "abandoned.csv";
	{
		CsvWriter writer(abandoned, GeostreamRow::header());
		writer.writeRow({ "a", "b" });
	}
	if (fs::exists(abandoned) || fs::exists(abandoned.string() + ".part"))
	{
		std::cerr << "abandoned writer left files\n";
		return 1;
	}

	fs::path aborted = directory.path() / "aborted.csv";
	{
		CsvWriter writer(aborted, GeostreamRow::header());
		writer.abort();
		if (fs::exists(writer.partialPath()))
		{
			std::cerr << "abort did not remove the partial file\n";
			return 1;
		}
	}

	GeostreamRow row;
	row.site = "plot_1";
	row.trait = "Canopy Cover";
	row.value = "1.05";
	std::vector<std::string> values = row.values();
	if (values.size() != GeostreamRow::header().size() || values[1] != "Canopy Cover" || values[6] != "1.05")
	{
		std::cerr << "geostream row mismatch\n";
		return 1;
	}

	return 0;
}
