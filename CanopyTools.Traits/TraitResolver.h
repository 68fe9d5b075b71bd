#pragma once

#include <string>

#include <boost/optional.hpp>

#include "TraitTable.h"
#include "ExperimentMetadata.h"

namespace CanopyTools
{
namespace Traits
{
/// <summary>
/// Optional overrides supplied to a run.
/// </summary>
struct RunArguments
{
	boost::optional<std::string> species;
	boost::optional<std::string> germplasmName;
	boost::optional<std::string> citationAuthor;
	boost::optional<std::string> citationTitle;
	boost::optional<std::string> citationYear;
	boost::optional<std::string> timestamp;
};

/// <summary>
/// Resolves trait values from the run arguments and the experiment metadata.
/// </summary>
class TraitResolver
{
	TraitTable _table;
	RunArguments _arguments;
	ExperimentMetadata _metadata;

public:
	TraitResolver(const TraitTable& table, const RunArguments& arguments, const ExperimentMetadata& metadata)
		: _table(table), _arguments(arguments), _metadata(metadata)
	{ }

	const TraitTable& table() const { return _table; }
	const RunArguments& arguments() const { return _arguments; }
	const ExperimentMetadata& metadata() const { return _metadata; }

	/// <summary>
	/// Returns a copy of the traits with the metadata and the run argument overrides applied.
	/// </summary>
	/// <param name="current">The traits to start from.</param>
	/// <param name="runYear">The year of the run timestamp, used as citation year when none is given.</param>
	TraitRecord setupDefaultTraits(const TraitRecord& current, const std::string& runYear = std::string()) const;

	/// <summary>
	/// Finds the species of the plot.
	/// </summary>
	/// <param name="plotName">The name of the plot.</param>
	/// <param name="resolved">The species resolved by <see cref="setupDefaultTraits"/>, if known.</param>
	/// <remarks>
	/// Priority: exact name match, case insensitive name match, resolved species, species argument,
	/// species of any metadata record, <c>"Unknown"</c>.
	/// </remarks>
	std::string plotSpecies(const std::string& plotName,
	                        const boost::optional<std::string>& resolved = boost::none) const;
};
} // Traits
} // CanopyTools
