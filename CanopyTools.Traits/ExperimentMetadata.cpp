#include <fstream>
#include <stdexcept>

#include "ExperimentMetadata.h"

using json = nlohmann::json;

namespace CanopyTools
{
namespace Traits
{
namespace
{
boost::optional<std::string> readText(const json& object, const char* key)
{
	auto it = object.find(key);
	if (it == object.end() || it->is_null())
		return boost::none;
	if (it->is_string())
		return it->get<std::string>();
	return it->dump();
}
} // anonymous

MetadataRecord MetadataRecord::fromJson(const json& value)
{
	if (!value.is_object())
		throw std::invalid_argument("Metadata record must be a JSON object.");

	MetadataRecord record;
	record.species = readText(value, "species");
	record.germplasmName = readText(value, "germplasmName");
	record.timestamp = readText(value, "timestamp");

	auto plots = value.find("plots");
	if (plots != value.end() && plots->is_array())
	{
		for (const json& plot : *plots)
		{
			if (!plot.is_object())
				continue;

			PlotEntry entry;
			entry.name = readText(plot, "name");
			entry.species = readText(plot, "species");
			record.plots.push_back(entry);
		}
	}
	return record;
}

void ExperimentMetadata::append(const json& document)
{
	if (document.is_array())
	{
		for (const json& item : document)
			_records.push_back(MetadataRecord::fromJson(item));
	}
	else
		_records.push_back(MetadataRecord::fromJson(document));
}

boost::optional<std::string> ExperimentMetadata::timestamp() const
{
	if (_records.empty())
		return boost::none;
	return _records.front().timestamp;
}

ExperimentMetadata ExperimentMetadata::fromJson(const json& document)
{
	ExperimentMetadata metadata;
	metadata.append(document);
	return metadata;
}

ExperimentMetadata ExperimentMetadata::load(const std::vector<std::string>& paths)
{
	ExperimentMetadata metadata;
	for (const std::string& path : paths)
	{
		std::ifstream input(path);
		if (!input.is_open())
			throw std::runtime_error("Unable to open metadata file \"" + path + "\".");

		try
		{
			metadata.append(json::parse(input));
		}
		catch (const json::exception& ex)
		{
			throw std::runtime_error("Invalid metadata file \"" + path + "\": " + ex.what());
		}
		catch (const std::invalid_argument& ex)
		{
			throw std::runtime_error("Invalid metadata file \"" + path + "\": " + ex.what());
		}
	}
	return metadata;
}
} // Traits
} // CanopyTools
