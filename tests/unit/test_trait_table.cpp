#include <iostream>
#include <stdexcept>

#include <CanopyTools.Traits/TraitConfiguration.h>
#include <CanopyTools.Traits/TraitTable.h>

using namespace CanopyTools::Traits;

int main()
{
	TraitTable standard(TraitConfiguration::standard());
	TraitTable extended(TraitConfiguration::extended());

	std::vector<std::string> names = standard.fieldNames();
	std::vector<std::string> expectedNames = { "local_datetime", "canopy_cover", "species", "site", "method" };
	if (names != expectedNames)
	{
		std::cerr << "standard field order mismatch\n";
		return 1;
	}
	if (extended.fields().size() != 9 || extended.fieldNames()[2] != "access_level")
	{
		std::cerr << "extended field order mismatch\n";
		return 1;
	}

	// Defaults
	if (standard.defaultTrait("canopy_cover") != TraitValue::list() ||
		standard.defaultTrait("site").str() != "[]")
	{
		std::cerr << "array valued defaults are not empty lists\n";
		return 1;
	}
	if (standard.defaultTrait("species").str() != "Unknown" ||
		standard.defaultTrait("method").str() != "Green Canopy Cover Estimation from Field Scanner RGB images")
	{
		std::cerr << "constant defaults mismatch\n";
		return 1;
	}
	if (standard.defaultTrait("local_datetime") != TraitValue("") ||
		standard.defaultTrait("no_such_field") != TraitValue(""))
	{
		std::cerr << "other defaults are not empty strings\n";
		return 1;
	}
	if (standard.defaultTrait(TraitField::CitationYear).str() != "" ||
		extended.defaultTrait(TraitField::CitationYear).str() != "2016" ||
		extended.defaultTrait(TraitField::CitationAuthor).str() != "\"Zongyang, Li\"")
	{
		std::cerr << "citation defaults mismatch\n";
		return 1;
	}

	// Traits table
	auto table = extended.traitsTable();
	if (table.first != extended.fields() || table.second.size() != extended.fields().size())
	{
		std::cerr << "traitsTable size mismatch\n";
		return 1;
	}
	if (*table.second.get(TraitField::AccessLevel) != TraitValue("2"))
	{
		std::cerr << "traitsTable default mismatch\n";
		return 1;
	}

	// Traits list
	TraitRecord traits;
	traits.set(TraitField::Site, "plot_1");
	traits.set(TraitField::CanopyCover, "42.5");
	std::vector<TraitValue> values = standard.generateTraitsList(traits);
	if (values.size() != standard.fields().size())
	{
		std::cerr << "generateTraitsList length mismatch\n";
		return 1;
	}
	if (values[0].str() != "" || values[1].str() != "42.5" || values[2].str() != "Unknown" ||
		values[3].str() != "plot_1" || values[4].str() != standard.defaultTrait("method").str())
	{
		std::cerr << "generateTraitsList is not aligned to the fields\n";
		return 1;
	}

	TraitValue items = TraitValue::list({ "a", "b" });
	if (items.str() != "[a b]" || items == TraitValue("[a b]") || !items.isList() ||
		items.items() != std::vector<std::string>({ "a", "b" }) || !TraitValue::list().items().empty())
	{
		std::cerr << "list rendering mismatch\n";
		return 1;
	}

	// Validation
	bool thrown = false;
	try
	{
		TraitRecord::fromNames({ { "species", "Sorghum" }, { "colour", "green" } });
	}
	catch (std::invalid_argument&)
	{
		thrown = true;
	}
	if (!thrown)
	{
		std::cerr << "unknown trait name was accepted\n";
		return 1;
	}

	TraitRecord named = TraitRecord::fromNames({ { "species", "Sorghum" } });
	if (!named.contains(TraitField::Species) || named.size() != 1)
	{
		std::cerr << "fromNames did not set the field\n";
		return 1;
	}

	thrown = false;
	try
	{
		TraitConfiguration invalid({ TraitField::Site }, { TraitField::Site }, { { TraitField::Site, "x" } });
	}
	catch (std::invalid_argument&)
	{
		thrown = true;
	}
	if (!thrown)
	{
		std::cerr << "conflicting configuration was accepted\n";
		return 1;
	}

	return 0;
}
