#pragma once

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

namespace CanopyTools
{
namespace Traits
{
/// <summary>
/// Represents a plot entry of an experiment metadata record.
/// </summary>
struct PlotEntry
{
	boost::optional<std::string> name;
	boost::optional<std::string> species;
};

/// <summary>
/// Represents a single experiment metadata record.
/// </summary>
struct MetadataRecord
{
	boost::optional<std::string> species;
	boost::optional<std::string> germplasmName;
	boost::optional<std::string> timestamp;
	std::vector<PlotEntry> plots;

	/// <summary>
	/// Reads the known keys of a JSON object, other keys are ignored.
	/// </summary>
	/// <remarks>
	/// Non-string scalar values are converted to their textual form, nulls are treated as absent.
	/// </remarks>
	/// <exception cref="std::invalid_argument">The value is not a JSON object.</exception>
	static MetadataRecord fromJson(const nlohmann::json& value);
};

/// <summary>
/// Represents the experiment metadata bundle of a run.
/// </summary>
class ExperimentMetadata
{
	std::vector<MetadataRecord> _records;

public:
	ExperimentMetadata() = default;
	explicit ExperimentMetadata(std::vector<MetadataRecord> records)
		: _records(std::move(records))
	{ }

	const std::vector<MetadataRecord>& records() const { return _records; }

	/// <summary>
	/// Appends the records of a JSON document, either a single object or an array of objects.
	/// </summary>
	void append(const nlohmann::json& document);

	/// <summary>
	/// Retrieves the timestamp of the first record, if any.
	/// </summary>
	boost::optional<std::string> timestamp() const;

	/// <summary>
	/// Parses a JSON document into a metadata bundle.
	/// </summary>
	static ExperimentMetadata fromJson(const nlohmann::json& document);

	/// <summary>
	/// Loads and concatenates the metadata files in the given order.
	/// </summary>
	/// <exception cref="std::runtime_error">A file cannot be opened or is not valid metadata.</exception>
	static ExperimentMetadata load(const std::vector<std::string>& paths);
};
} // Traits
} // CanopyTools
