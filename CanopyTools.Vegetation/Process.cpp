#include <memory>
#include <sstream>

#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>

#include <CanopyTools.Raster/RasterImage.h>
#include <CanopyTools.Raster/AlphaMask.h>
#include <CanopyTools.Raster/Helper.h>

#include "Process.h"
#include "CoverCalculation.h"
#include "Configuration.h"

using namespace CanopyTools::Traits;
using namespace CanopyTools::Raster;

namespace CanopyTools
{
namespace Vegetation
{
#pragma region ProcessResult

nlohmann::json ProcessResult::toJson() const
{
	nlohmann::json document;
	document["code"] = code;
	if (code == Success)
	{
		document["files"] = nlohmann::json::array();
		for (const OutputFile& file : files)
			document["files"].push_back({ { "path", file.path }, { "key", file.key } });
	}
	else
		document["error"] = error;
	return document;
}

#pragma endregion

#pragma region Process

Process::Process(const std::vector<std::string>& files,
                 const std::string& workingSpace,
                 const RunArguments& arguments,
                 const ExperimentMetadata& metadata,
                 Variant variant,
                 IO::Logger* logger)
	: nodataCutoff(variant == Variant::Extended ? 0.75 : -1),
	  writeGeostream(variant == Variant::Extended),
	  _files(files), _workingSpace(workingSpace),
	  _table(TraitConfiguration::forVariant(variant)),
	  _resolver(_table, arguments, metadata),
	  _logger(logger)
{ }

bool Process::isSupported(const std::string& file)
{
	std::string extension = fs::path(file).extension().string();
	return boost::iequals(extension, ".tif") || boost::iequals(extension, ".tiff");
}

void Process::checkContinue(const std::vector<std::string>& files)
{
	for (const std::string& file : files)
		if (isSupported(file))
			return;
	throw ImageNotFound("Unable to find an image file to work with");
}

std::string Process::plotName(const std::string& file)
{
	return fs::path(file).parent_path().filename().string();
}

const ProcessResult& Process::target() const
{
	if (!isExecuted())
		throw std::logic_error("The operation is not executed.");
	return _result;
}

void Process::onPrepare()
{
	if (fs::exists(_workingSpace) && !fs::is_directory(_workingSpace))
		throw std::runtime_error("The working space '" + _workingSpace + "' is not a directory.");
	if (!fs::exists(_workingSpace))
		fs::create_directories(_workingSpace);

	boost::optional<std::string> timestamp = _resolver.metadata().timestamp();
	_timeStamps = getTimeStamps(timestamp ? *timestamp : std::string(), _resolver.arguments().timestamp);
}

void Process::onExecute()
{
	_result = ProcessResult();

	TraitRecord defaults = _resolver.setupDefaultTraits(
		_table.traitsTable().second,
		_timeStamps.empty() ? std::string() : _timeStamps.year());

	fs::path coverPath = fs::path(_workingSpace) / CoverFileName;
	fs::path geostreamPath = fs::path(_workingSpace) / GeostreamFileName;

	CsvWriter coverWriter(coverPath, _table.fieldNames());
	std::unique_ptr<CsvWriter> geostreamWriter;
	if (writeGeostream)
		geostreamWriter.reset(new CsvWriter(geostreamPath, GeostreamRow::header()));

	std::size_t fileCount = 0, calculatedCount = 0;
	logger().debug("Looking for images with an extension of: .tif,.tiff");
	for (std::size_t index = 0; index < _files.size(); ++index)
	{
		const std::string& file = _files[index];
		if (!isSupported(file))
		{
			logger().debug("Skipping non-supported file '" + file + "'");
			continue;
		}
		++fileCount;

		ImageOutcome outcome = processImage(file, defaults, coverWriter, geostreamWriter.get());
		switch (outcome.kind)
		{
		case ImageOutcome::Ok:
			++calculatedCount;
			break;
		case ImageOutcome::Skip:
			logger().warning("Error generating canopy cover for '" + file + "': " + outcome.reason);
			logger().warning("    plot name: '" + plotName(file) + "'");
			break;
		case ImageOutcome::Fatal:
			logger().error("Unable to continue after '" + file + "': " + outcome.reason);
			throw std::runtime_error(outcome.reason);
		}

		reportProgress(static_cast<float>(index + 1) / _files.size(), "Calculating canopy cover");
	}

	if (fileCount == 0 || calculatedCount == 0)
	{
		// Files of an earlier run must not be reported beside a failed result
		coverWriter.abort();
		fs::remove(coverWriter.path());
		if (geostreamWriter)
		{
			geostreamWriter->abort();
			fs::remove(geostreamWriter->path());
		}

		if (fileCount == 0)
		{
			_result.code = ProcessResult::NoFiles;
			_result.error = "No files were processed";
		}
		else
		{
			_result.code = ProcessResult::NoResults;
			_result.error = "No images were able to have their canopy cover calculated";
		}
		return;
	}

	coverWriter.commit();
	if (geostreamWriter)
	{
		try
		{
			geostreamWriter->commit();
		}
		catch (std::exception&)
		{
			boost::system::error_code error;
			fs::remove(coverWriter.path(), error);
			throw;
		}
	}

	_result.files.push_back({ coverWriter.path().string(), "csv" });
	if (geostreamWriter)
		_result.files.push_back({ geostreamWriter->path().string(), "csv" });
	_result.code = ProcessResult::Success;
}

ImageOutcome Process::processImage(const std::string& file, const TraitRecord& defaults,
                                   CsvWriter& coverWriter, CsvWriter* geostreamWriter)
{
	std::string plot = plotName(file);

	// Loading
	boost::optional<RasterImage> image;
	try
	{
		image = RasterImage::load(file);
	}
	catch (std::exception& ex)
	{
		return ImageOutcome::skip(ex.what());
	}

	if (image->isGeoReferenced() && logger().isEnabled(IO::Logger::Debug))
	{
		std::ostringstream description;
		description << image->metadata();
		logger().debug("Raster metadata of \"" + file + "\":\n" + description.str());
	}

	if (image->bandCount() < 3)
	{
		std::ostringstream message;
		message << "expected 3 and received " << image->bandCount();
		logger().warning("Unexpected image dimensions for file \"" + file + "\"");
		logger().warning("    " + message.str());
		return ImageOutcome::skip("unexpected image dimensions");
	}

	// Masking
	cv::Mat pixels;
	try
	{
		if (image->hasAlpha())
			pixels = image->pixels();
		else
		{
			logger().info("Adding missing alpha channel to loaded image from \"" + file + "\"");
			if (image->isGeoReferenced())
			{
				ImageMask mask(file, _logger);
				mask.execute();
				image = mask.target();
				pixels = image->pixels();
			}
			else
				pixels = addImageMaskNonGeo(image->bands());
		}
	}
	catch (std::exception& ex)
	{
		return ImageOutcome::skip(ex.what());
	}

	// Computing
	double cover;
	try
	{
		logger().debug("Calculating canopy cover");
		cover = calculateCanopyCoverMasked(pixels, nodataCutoff);
	}
	catch (std::exception& ex)
	{
		return ImageOutcome::skip(ex.what());
	}
	std::string value = formatSignificant(cover, significantDigits);

	boost::optional<GeostreamRow> geostream;
	if (geostreamWriter && image->isGeoReferenced())
	{
		OGRPoint centroid;
		try
		{
			centroid = image->metadata().centroid();
		}
		catch (std::exception& ex)
		{
			return ImageOutcome::skip(ex.what());
		}

		GeostreamRow row;
		row.site = plot;
		row.trait = GeostreamTraitName;
		row.lat = formatShortest(centroid.getY());
		row.lon = formatShortest(centroid.getX());
		row.dpTime = _timeStamps.localTime;
		row.source = file;
		row.value = value;
		row.timestamp = _timeStamps.date;
		geostream = row;
	}

	// Writing
	logger().debug("Writing to CSV files");
	boost::optional<std::string> species;
	if (defaults.contains(TraitField::Species))
		species = defaults.get(TraitField::Species)->str();

	TraitRecord traits = defaults;
	traits.set(TraitField::CanopyCover, value);
	traits.set(TraitField::Species, _resolver.plotSpecies(plot, species));
	traits.set(TraitField::Site, plot);
	traits.set(TraitField::LocalDatetime, _timeStamps.localTime);

	try
	{
		coverWriter.writeRow(traitRow(_table.generateTraitsList(traits)));

		if (geostream)
			geostreamWriter->writeRow(geostream->values());
	}
	catch (std::runtime_error& ex)
	{
		return ImageOutcome::fatal(ex.what());
	}

	return ImageOutcome::ok();
}

#pragma endregion
} // Vegetation
} // CanopyTools
