#pragma once

#include <string>
#include <vector>
#include <array>
#include <map>
#include <utility>

#include <boost/optional.hpp>

#include "TraitConfiguration.h"

namespace CanopyTools
{
namespace Traits
{
/// <summary>
/// Represents a trait value, either a single text or a list of texts.
/// </summary>
class TraitValue
{
	bool _isList;
	std::string _text;
	std::vector<std::string> _items;

public:
	TraitValue() : _isList(false) { }
	TraitValue(const std::string& text) : _isList(false), _text(text) { }
	TraitValue(const char* text) : _isList(false), _text(text) { }

	/// <summary>
	/// Creates a list value.
	/// </summary>
	static TraitValue list(std::vector<std::string> items = std::vector<std::string>());

	bool isList() const { return _isList; }
	const std::string& text() const { return _text; }
	const std::vector<std::string>& items() const { return _items; }

	/// <summary>
	/// Renders the value for CSV output.
	/// </summary>
	/// <remarks>
	/// Lists render as their space separated items in square brackets, e.g. <c>"[]"</c>.
	/// </remarks>
	std::string str() const;

	bool operator==(const TraitValue& other) const;
	bool operator!=(const TraitValue& other) const { return !(*this == other); }
};

/// <summary>
/// Represents a set of trait values with explicit presence for every field.
/// </summary>
class TraitRecord
{
	std::array<boost::optional<TraitValue>, TraitFieldCount> _values;

public:
	/// <summary>
	/// Builds a record from field names.
	/// </summary>
	/// <exception cref="std::invalid_argument">A name is not a known trait field.</exception>
	static TraitRecord fromNames(const std::map<std::string, TraitValue>& values);

	bool contains(TraitField field) const { return _values[index(field)].is_initialized(); }
	const boost::optional<TraitValue>& get(TraitField field) const { return _values[index(field)]; }
	void set(TraitField field, const TraitValue& value) { _values[index(field)] = value; }

	/// <summary>
	/// Counts the present fields.
	/// </summary>
	std::size_t size() const;

	bool operator==(const TraitRecord& other) const { return _values == other._values; }
	bool operator!=(const TraitRecord& other) const { return !(*this == other); }

private:
	static std::size_t index(TraitField field) { return static_cast<std::size_t>(field); }
};

/// <summary>
/// Provides the fields and default values of a trait configuration.
/// </summary>
class TraitTable
{
	TraitConfiguration _configuration;

public:
	explicit TraitTable(const TraitConfiguration& configuration)
		: _configuration(configuration)
	{ }

	const TraitConfiguration& configuration() const { return _configuration; }

	/// <summary>
	/// Retrieves the emitted fields in column order.
	/// </summary>
	const std::vector<TraitField>& fields() const { return _configuration.fields; }

	/// <summary>
	/// Retrieves the names of the emitted fields in column order.
	/// </summary>
	std::vector<std::string> fieldNames() const;

	/// <summary>
	/// Returns the default value for the field.
	/// </summary>
	/// <returns>An empty list for array valued fields, the configured constant if any, otherwise an empty text.</returns>
	TraitValue defaultTrait(TraitField field) const;

	/// <summary>
	/// Returns the default value for the field name, an empty text for unknown names.
	/// </summary>
	TraitValue defaultTrait(const std::string& name) const;

	/// <summary>
	/// Returns the fields and a record holding the default value of each of them.
	/// </summary>
	std::pair<std::vector<TraitField>, TraitRecord> traitsTable() const;

	/// <summary>
	/// Returns the values of the record aligned to <see cref="fields"/>, defaults substituted for absent fields.
	/// </summary>
	std::vector<TraitValue> generateTraitsList(const TraitRecord& traits) const;
};
} // Traits
} // CanopyTools
