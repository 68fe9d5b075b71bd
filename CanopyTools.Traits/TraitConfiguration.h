#pragma once

#include <string>
#include <vector>
#include <set>
#include <map>
#include <iosfwd>

#include <boost/optional.hpp>

namespace CanopyTools
{
namespace Traits
{
/// <summary>
/// The closed set of trait fields known to the calculator.
/// </summary>
enum class TraitField
{
	LocalDatetime,
	CanopyCover,
	AccessLevel,
	Species,
	Site,
	CitationAuthor,
	CitationYear,
	CitationTitle,
	Method
};

/// <summary>
/// The number of values in <see cref="TraitField"/>.
/// </summary>
const std::size_t TraitFieldCount = 9;

/// <summary>
/// Retrieves the canonical (CSV header) name of a field, e.g. <c>"local_datetime"</c>.
/// </summary>
const std::string& fieldName(TraitField field);

/// <summary>
/// Looks up a field by its canonical name.
/// </summary>
/// <returns>The field, or <c>boost::none</c> for unknown names.</returns>
boost::optional<TraitField> parseTraitField(const std::string& name);

/// <summary>
/// The output variants of the calculator.
/// </summary>
enum class Variant
{
	/// <summary>
	/// Minimal trait set, single CSV output.
	/// </summary>
	Standard,
	/// <summary>
	/// Citation trait set, geostream CSV output and nodata cutoff.
	/// </summary>
	Extended
};

std::istream& operator>>(std::istream& input, Variant& variant);
std::ostream& operator<<(std::ostream& output, const Variant& variant);

/// <summary>
/// Represents the immutable trait configuration of a run.
/// </summary>
struct TraitConfiguration
{
	/// <summary>
	/// The emitted fields in CSV column order.
	/// </summary>
	const std::vector<TraitField> fields;

	/// <summary>
	/// Fields whose default is an empty list.
	/// </summary>
	const std::set<TraitField> arrayValued;

	/// <summary>
	/// Fields with a fixed default value.
	/// </summary>
	const std::map<TraitField, std::string> defaults;

	TraitConfiguration(std::vector<TraitField> fields,
	                   std::set<TraitField> arrayValued,
	                   std::map<TraitField, std::string> defaults);

	/// <summary>
	/// Determines whether the field is emitted.
	/// </summary>
	bool contains(TraitField field) const;

	/// <summary>
	/// Local time, cover, species, site and method.
	/// </summary>
	static TraitConfiguration standard();

	/// <summary>
	/// The standard fields extended with access level and citation information.
	/// </summary>
	static TraitConfiguration extended();

	static TraitConfiguration forVariant(Variant variant);
};
} // Traits
} // CanopyTools
