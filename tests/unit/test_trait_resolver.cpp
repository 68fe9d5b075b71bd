#include <iostream>

#include <CanopyTools.Traits/TraitResolver.h>

using namespace CanopyTools::Traits;

namespace
{
MetadataRecord plots(std::vector<PlotEntry> entries, boost::optional<std::string> species = boost::none)
{
	MetadataRecord record;
	record.species = species;
	record.plots = std::move(entries);
	return record;
}
} // anonymous

int main()
{
	TraitTable table(TraitConfiguration::extended());
	RunArguments none;

	// Metadata overrides
	MetadataRecord germplasm;
	germplasm.germplasmName = "Sorghum bicolor";
	MetadataRecord species;
	species.species = "Zea mays";
	ExperimentMetadata metadata({ species, germplasm });

	TraitRecord defaults = table.traitsTable().second;
	TraitRecord traits = TraitResolver(table, none, metadata).setupDefaultTraits(defaults);
	if (traits.get(TraitField::Species)->str() != "Sorghum bicolor")
	{
		std::cerr << "metadata germplasm did not override species\n";
		return 1;
	}
	if (defaults.get(TraitField::Species)->str() != "Unknown")
	{
		std::cerr << "setupDefaultTraits modified its input\n";
		return 1;
	}

	// Argument overrides
	RunArguments arguments;
	arguments.germplasmName = "Germplasm";
	arguments.species = "Explicit";
	arguments.citationAuthor = "Author";
	arguments.citationTitle = "Title";
	traits = TraitResolver(table, arguments, metadata).setupDefaultTraits(defaults, "2019");
	if (traits.get(TraitField::Species)->str() != "Explicit" ||
		traits.get(TraitField::CitationAuthor)->str() != "Author" ||
		traits.get(TraitField::CitationTitle)->str() != "Title")
	{
		std::cerr << "argument overrides mismatch\n";
		return 1;
	}
	if (traits.get(TraitField::CitationYear)->str() != "2019")
	{
		std::cerr << "run year was not used as citation year\n";
		return 1;
	}

	arguments.citationYear = "2017";
	traits = TraitResolver(table, arguments, metadata).setupDefaultTraits(defaults, "2019");
	if (traits.get(TraitField::CitationYear)->str() != "2017")
	{
		std::cerr << "citation year argument did not win\n";
		return 1;
	}

	TraitTable standardTable(TraitConfiguration::standard());
	traits = TraitResolver(standardTable, none, ExperimentMetadata()).setupDefaultTraits(
		standardTable.traitsTable().second, "2019");
	if (traits.contains(TraitField::CitationYear))
	{
		std::cerr << "citation year set without citation field\n";
		return 1;
	}

	// Plot species
	ExperimentMetadata plotMetadata({
		plots({ { std::string("Plot 1"), std::string("Exact") }, { std::string("plot 2"), std::string("Insensitive") } },
		      std::string("Fallback")),
		plots({ { std::string("PLOT 1"), std::string("Other") }, { std::string("12"), boost::none } })
	});

	TraitResolver resolver(table, none, plotMetadata);
	if (resolver.plotSpecies("Plot 1") != "Exact")
	{
		std::cerr << "exact plot match failed\n";
		return 1;
	}
	if (resolver.plotSpecies("PLOT 2") != "Insensitive")
	{
		std::cerr << "case insensitive plot match failed\n";
		return 1;
	}
	if (resolver.plotSpecies("Plot 3") != "Fallback" || resolver.plotSpecies("12") != "Fallback")
	{
		std::cerr << "metadata species fallback failed\n";
		return 1;
	}

	RunArguments speciesArgument;
	speciesArgument.species = "Argument";
	if (TraitResolver(table, speciesArgument, plotMetadata).plotSpecies("Plot 3") != "Argument" ||
		TraitResolver(table, speciesArgument, plotMetadata).plotSpecies("plot 2") != "Insensitive")
	{
		std::cerr << "species argument priority mismatch\n";
		return 1;
	}

	if (resolver.plotSpecies("Plot 3", std::string("Resolved")) != "Resolved" ||
		resolver.plotSpecies("Plot 1", std::string("Resolved")) != "Exact" ||
		resolver.plotSpecies("plot 2", std::string("Resolved")) != "Insensitive")
	{
		std::cerr << "resolved species priority mismatch\n";
		return 1;
	}

	if (TraitResolver(table, none, ExperimentMetadata()).plotSpecies("Plot 1") != "Unknown")
	{
		std::cerr << "unknown plot species mismatch\n";
		return 1;
	}

	return 0;
}
