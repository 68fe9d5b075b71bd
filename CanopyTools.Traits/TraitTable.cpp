#include <stdexcept>

#include <boost/algorithm/string/join.hpp>

#include "TraitTable.h"

namespace CanopyTools
{
namespace Traits
{
#pragma region TraitValue

TraitValue TraitValue::list(std::vector<std::string> items)
{
	TraitValue value;
	value._isList = true;
	value._items = std::move(items);
	return value;
}

std::string TraitValue::str() const
{
	if (_isList)
		return "[" + boost::algorithm::join(_items, " ") + "]";
	return _text;
}

bool TraitValue::operator==(const TraitValue& other) const
{
	if (_isList != other._isList)
		return false;
	return _isList ? _items == other._items : _text == other._text;
}

#pragma endregion

#pragma region TraitRecord

TraitRecord TraitRecord::fromNames(const std::map<std::string, TraitValue>& values)
{
	TraitRecord record;
	for (const auto& item : values)
	{
		boost::optional<TraitField> field = parseTraitField(item.first);
		if (!field)
			throw std::invalid_argument("Unknown trait field '" + item.first + "'.");
		record.set(*field, item.second);
	}
	return record;
}

std::size_t TraitRecord::size() const
{
	std::size_t count = 0;
	for (const auto& value : _values)
		if (value)
			++count;
	return count;
}

#pragma endregion

#pragma region TraitTable

std::vector<std::string> TraitTable::fieldNames() const
{
	std::vector<std::string> names;
	names.reserve(fields().size());
	for (TraitField field : fields())
		names.push_back(fieldName(field));
	return names;
}

TraitValue TraitTable::defaultTrait(TraitField field) const
{
	if (_configuration.arrayValued.count(field))
		return TraitValue::list();

	auto it = _configuration.defaults.find(field);
	if (it != _configuration.defaults.end())
		return TraitValue(it->second);

	return TraitValue();
}

TraitValue TraitTable::defaultTrait(const std::string& name) const
{
	boost::optional<TraitField> field = parseTraitField(name);
	return field ? defaultTrait(*field) : TraitValue();
}

std::pair<std::vector<TraitField>, TraitRecord> TraitTable::traitsTable() const
{
	TraitRecord traits;
	for (TraitField field : fields())
		traits.set(field, defaultTrait(field));
	return std::make_pair(fields(), traits);
}

std::vector<TraitValue> TraitTable::generateTraitsList(const TraitRecord& traits) const
{
	std::vector<TraitValue> values;
	values.reserve(fields().size());
	for (TraitField field : fields())
	{
		const boost::optional<TraitValue>& value = traits.get(field);
		values.push_back(value ? *value : defaultTrait(field));
	}
	return values;
}

#pragma endregion
} // Traits
} // CanopyTools
