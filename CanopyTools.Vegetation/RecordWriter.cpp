#include <stdexcept>

#include <boost/algorithm/string/join.hpp>

#include "RecordWriter.h"

namespace CanopyTools
{
namespace Vegetation
{
#pragma region CsvWriter

CsvWriter::CsvWriter(const fs::path& path, const std::vector<std::string>& header)
	: _path(path), _partialPath(path.string() + ".part")
{
	_out.open(_partialPath.string(), std::ios::out | std::ios::trunc);
	if (!_out.is_open())
		throw std::runtime_error("Unable to open \"" + _partialPath.string() + "\" for writing.");
	writeRow(header);
}

CsvWriter::~CsvWriter()
{
	if (!_isCommitted)
	{
		_out.close();
		boost::system::error_code error;
		fs::remove(_partialPath, error);
	}
}

void CsvWriter::writeRow(const std::vector<std::string>& values)
{
	if (_isCommitted)
		throw std::logic_error("The file \"" + _path.string() + "\" is already committed.");

	_out << boost::algorithm::join(values, ",") << '\n';
	if (!_out)
		throw std::runtime_error("Error at writing \"" + _partialPath.string() + "\".");
}

void CsvWriter::commit()
{
	if (_isCommitted)
		return;

	_out.close();
	if (_out.fail())
		throw std::runtime_error("Error at closing \"" + _partialPath.string() + "\".");

	fs::rename(_partialPath, _path);
	_isCommitted = true;
}

void CsvWriter::abort()
{
	if (_isCommitted)
		return;

	_out.close();
	fs::remove(_partialPath);
}

#pragma endregion

std::vector<std::string> traitRow(const std::vector<Traits::TraitValue>& values)
{
	std::vector<std::string> row;
	row.reserve(values.size());
	for (const Traits::TraitValue& value : values)
		row.push_back(value.str());
	return row;
}

#pragma region GeostreamRow

const std::vector<std::string>& GeostreamRow::header()
{
	static const std::vector<std::string> columns =
	{
		"site", "trait", "lat", "lon", "dp_time", "source", "value", "timestamp"
	};
	return columns;
}

std::vector<std::string> GeostreamRow::values() const
{
	return { site, trait, lat, lon, dpTime, source, value, timestamp };
}

#pragma endregion
} // Vegetation
} // CanopyTools
