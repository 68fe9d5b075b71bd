#include <boost/algorithm/string/predicate.hpp>

#include "TraitResolver.h"

namespace CanopyTools
{
namespace Traits
{
TraitRecord TraitResolver::setupDefaultTraits(const TraitRecord& current, const std::string& runYear) const
{
	TraitRecord traits = current;

	for (const MetadataRecord& record : _metadata.records())
	{
		if (record.species)
			traits.set(TraitField::Species, *record.species);
		if (record.germplasmName)
			traits.set(TraitField::Species, *record.germplasmName);
	}

	if (_arguments.germplasmName)
		traits.set(TraitField::Species, *_arguments.germplasmName);
	if (_arguments.species)
		traits.set(TraitField::Species, *_arguments.species);
	if (_arguments.citationAuthor)
		traits.set(TraitField::CitationAuthor, *_arguments.citationAuthor);
	if (_arguments.citationTitle)
		traits.set(TraitField::CitationTitle, *_arguments.citationTitle);

	if (_arguments.citationYear)
		traits.set(TraitField::CitationYear, *_arguments.citationYear);
	else if (!runYear.empty() && _table.configuration().contains(TraitField::CitationYear))
		traits.set(TraitField::CitationYear, runYear);

	return traits;
}

std::string TraitResolver::plotSpecies(const std::string& plotName,
                                       const boost::optional<std::string>& resolved) const
{
	boost::optional<std::string> possible;
	boost::optional<std::string> optional;

	for (const MetadataRecord& record : _metadata.records())
	{
		if (record.species)
			optional = record.species;

		for (const PlotEntry& plot : record.plots)
		{
			if (!plot.name)
				continue;
			if (*plot.name == plotName)
			{
				if (plot.species)
					return *plot.species;
			}
			else if (plot.species && boost::iequals(*plot.name, plotName))
				possible = plot.species;
		}
	}

	if (possible)
		return *possible;
	if (resolved)
		return *resolved;
	if (_arguments.species)
		return *_arguments.species;
	if (optional)
		return *optional;
	return "Unknown";
}
} // Traits
} // CanopyTools
