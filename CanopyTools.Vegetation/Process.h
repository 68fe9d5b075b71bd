#pragma once

#include <string>
#include <vector>
#include <stdexcept>

#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

#include <CanopyTools.Common/Operation.h>
#include <CanopyTools.Common/IO/Logger.h>
#include <CanopyTools.Traits/TraitConfiguration.h>
#include <CanopyTools.Traits/TraitTable.h>
#include <CanopyTools.Traits/TraitResolver.h>
#include <CanopyTools.Traits/TimeStamps.h>

#include "RecordWriter.h"

namespace CanopyTools
{
namespace Vegetation
{
/// <summary>
/// Thrown when none of the candidate files is a supported image.
/// </summary>
class ImageNotFound : public std::runtime_error
{
public:
	explicit ImageNotFound(const std::string& message)
		: std::runtime_error(message)
	{ }
};

/// <summary>
/// Represents an output file of a run.
/// </summary>
struct OutputFile
{
	std::string path;
	std::string key;
};

/// <summary>
/// Represents the summary of a run.
/// </summary>
struct ProcessResult
{
	enum Codes
	{
		Success = 0,
		NoFiles = -1000,
		NoResults = -1001
	};

	int code = Success;
	std::vector<OutputFile> files;
	std::string error;

	nlohmann::json toJson() const;
};

/// <summary>
/// Represents the outcome of processing a single image.
/// </summary>
struct ImageOutcome
{
	enum Kind
	{
		/// <summary>
		/// The rows of the image were written.
		/// </summary>
		Ok,
		/// <summary>
		/// The image was skipped, the run continues.
		/// </summary>
		Skip,
		/// <summary>
		/// The run cannot continue.
		/// </summary>
		Fatal
	};

	Kind kind;
	std::string reason;

	static ImageOutcome ok() { return { Ok, std::string() }; }
	static ImageOutcome skip(const std::string& reason) { return { Skip, reason }; }
	static ImageOutcome fatal(const std::string& reason) { return { Fatal, reason }; }
};

/// <summary>
/// Calculates the canopy cover of the candidate images and writes the CSV files.
/// </summary>
class Process : public CanopyTools::Operation
{
public:
	/// <summary>
	/// Number of significant digits of the cover values.
	/// </summary>
	int significantDigits = 3;

	/// <summary>
	/// Maximal ratio of nodata pixels, a negative value disables the check.
	/// </summary>
	double nodataCutoff;

	/// <summary>
	/// Write geostream rows for the georeferenced images.
	/// </summary>
	bool writeGeostream;

public:
	Process(const std::vector<std::string>& files,
	        const std::string& workingSpace,
	        const Traits::RunArguments& arguments,
	        const Traits::ExperimentMetadata& metadata,
	        Traits::Variant variant = Traits::Variant::Standard,
	        IO::Logger* logger = nullptr);

	Process(const Process&) = delete;
	Process& operator=(const Process&) = delete;

	/// <summary>
	/// Determines whether the file has a supported image extension.
	/// </summary>
	static bool isSupported(const std::string& file);

	/// <summary>
	/// Verifies that at least one of the files is a supported image.
	/// </summary>
	/// <exception cref="ImageNotFound">No supported image is given.</exception>
	static void checkContinue(const std::vector<std::string>& files);

	/// <summary>
	/// Retrieves the name of the plot the image belongs to.
	/// </summary>
	static std::string plotName(const std::string& file);

	const Traits::TraitTable& table() const { return _table; }

	/// <summary>
	/// Retrieves the summary of the run.
	/// </summary>
	const ProcessResult& target() const;

protected:
	/// <summary>
	/// Verifies the working space and the run timestamp.
	/// </summary>
	void onPrepare() override;

	/// <summary>
	/// Produces the output file(s).
	/// </summary>
	void onExecute() override;

private:
	std::vector<std::string> _files;
	std::string _workingSpace;
	Traits::TraitTable _table;
	Traits::TraitResolver _resolver;
	IO::Logger* _logger;
	IO::NullLogger _nullLogger;

	Traits::TimeStamps _timeStamps;
	ProcessResult _result;

	IO::Logger& logger() { return _logger ? *_logger : _nullLogger; }

	ImageOutcome processImage(const std::string& file, const Traits::TraitRecord& defaults,
	                          CsvWriter& coverWriter, CsvWriter* geostreamWriter);
};
} // Vegetation
} // CanopyTools
