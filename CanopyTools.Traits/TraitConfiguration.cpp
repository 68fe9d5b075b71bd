#include <array>
#include <algorithm>
#include <istream>
#include <ostream>
#include <stdexcept>

#include <boost/algorithm/string.hpp>

#include "TraitConfiguration.h"

namespace CanopyTools
{
namespace Traits
{
namespace
{
const std::array<std::string, TraitFieldCount> FieldNames =
{
	"local_datetime",
	"canopy_cover",
	"access_level",
	"species",
	"site",
	"citation_author",
	"citation_year",
	"citation_title",
	"method"
};

const std::string MethodName = "Green Canopy Cover Estimation from Field Scanner RGB images";
} // anonymous

const std::string& fieldName(TraitField field)
{
	return FieldNames.at(static_cast<std::size_t>(field));
}

boost::optional<TraitField> parseTraitField(const std::string& name)
{
	auto it = std::find(FieldNames.begin(), FieldNames.end(), name);
	if (it == FieldNames.end())
		return boost::none;
	return static_cast<TraitField>(it - FieldNames.begin());
}

std::istream& operator>>(std::istream& input, Variant& variant)
{
	std::string str;
	input >> str;
	boost::to_lower(str);
	boost::trim(str);

	if (str == "standard")
		variant = Variant::Standard;
	else if (str == "extended")
		variant = Variant::Extended;
	else
		input.setstate(std::ios_base::failbit);
	return input;
}

std::ostream& operator<<(std::ostream& output, const Variant& variant)
{
	switch (variant)
	{
	case Variant::Standard:
		output << "standard";
		break;
	case Variant::Extended:
		output << "extended";
		break;
	}
	return output;
}

TraitConfiguration::TraitConfiguration(std::vector<TraitField> fields,
                                       std::set<TraitField> arrayValued,
                                       std::map<TraitField, std::string> defaults)
	: fields(std::move(fields)), arrayValued(std::move(arrayValued)), defaults(std::move(defaults))
{
	if (this->fields.empty())
		throw std::invalid_argument("At least 1 trait field must be configured.");
	for (const auto& item : this->defaults)
		if (this->arrayValued.count(item.first))
			throw std::invalid_argument("The field '" + fieldName(item.first) + "' cannot have both list and constant default.");
}

bool TraitConfiguration::contains(TraitField field) const
{
	return std::find(fields.begin(), fields.end(), field) != fields.end();
}

TraitConfiguration TraitConfiguration::standard()
{
	return TraitConfiguration(
		{ TraitField::LocalDatetime, TraitField::CanopyCover, TraitField::Species, TraitField::Site, TraitField::Method },
		{ TraitField::CanopyCover, TraitField::Site },
		{
			{ TraitField::Species, "Unknown" },
			{ TraitField::Method, MethodName }
		});
}

TraitConfiguration TraitConfiguration::extended()
{
	return TraitConfiguration(
		{
			TraitField::LocalDatetime, TraitField::CanopyCover, TraitField::AccessLevel, TraitField::Species,
			TraitField::Site, TraitField::CitationAuthor, TraitField::CitationYear, TraitField::CitationTitle,
			TraitField::Method
		},
		{ TraitField::CanopyCover, TraitField::Site },
		{
			{ TraitField::AccessLevel, "2" },
			{ TraitField::Species, "Unknown" },
			{ TraitField::CitationAuthor, "\"Zongyang, Li\"" },
			{ TraitField::CitationYear, "2016" },
			{ TraitField::CitationTitle, "Maricopa Field Station Data and Metadata" },
			{ TraitField::Method, MethodName }
		});
}

TraitConfiguration TraitConfiguration::forVariant(Variant variant)
{
	return variant == Variant::Extended ? extended() : standard();
}
} // Traits
} // CanopyTools
