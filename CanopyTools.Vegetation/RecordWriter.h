#pragma once

#include <string>
#include <vector>
#include <fstream>

#include <boost/filesystem.hpp>

#include <CanopyTools.Traits/TraitTable.h>

namespace fs = boost::filesystem;

namespace CanopyTools
{
namespace Vegetation
{
/// <summary>
/// Writes comma separated rows into a file.
/// </summary>
/// <remarks>
/// Rows are written into a partial file beside the target, which is renamed on <see cref="commit"/>.
/// The partial file is removed when the writer is destroyed without commit.
/// Values are joined without quoting.
/// </remarks>
class CsvWriter
{
	fs::path _path;
	fs::path _partialPath;
	std::ofstream _out;
	bool _isCommitted = false;

public:
	/// <summary>
	/// Opens the partial file and writes the header row.
	/// </summary>
	/// <exception cref="std::runtime_error">The file cannot be written.</exception>
	CsvWriter(const fs::path& path, const std::vector<std::string>& header);
	~CsvWriter();

	CsvWriter(const CsvWriter&) = delete;
	CsvWriter& operator=(const CsvWriter&) = delete;

	const fs::path& path() const { return _path; }
	const fs::path& partialPath() const { return _partialPath; }
	bool isCommitted() const { return _isCommitted; }

	/// <summary>
	/// Writes a row.
	/// </summary>
	/// <exception cref="std::runtime_error">The row cannot be written.</exception>
	void writeRow(const std::vector<std::string>& values);

	/// <summary>
	/// Closes the partial file and moves it to its final name.
	/// </summary>
	void commit();

	/// <summary>
	/// Closes and removes the partial file.
	/// </summary>
	void abort();
};

/// <summary>
/// Renders trait values as a CSV row.
/// </summary>
std::vector<std::string> traitRow(const std::vector<Traits::TraitValue>& values);

/// <summary>
/// Represents a geolocated observation of a plot.
/// </summary>
struct GeostreamRow
{
	std::string site;
	std::string trait;
	std::string lat;
	std::string lon;
	std::string dpTime;
	std::string source;
	std::string value;
	std::string timestamp;

	/// <summary>
	/// The column names of the geostream file.
	/// </summary>
	static const std::vector<std::string>& header();

	std::vector<std::string> values() const;
};
} // Vegetation
} // CanopyTools
