#pragma once

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <gdal_priv.h>
#include <opencv2/core.hpp>

#include "Metadata.h"

namespace CanopyTools
{
namespace Raster
{
/// <summary>
/// Represents the pixel data of a raster file loaded into memory, one matrix per band.
/// </summary>
class RasterImage
{
	std::string _path;
	std::vector<cv::Mat> _bands;
	boost::optional<RasterMetadata> _metadata;

public:
	RasterImage(const std::string& path,
	            std::vector<cv::Mat> bands,
	            boost::optional<RasterMetadata> metadata = boost::none);

	/// <summary>
	/// Opens a raster file and reads all of its bands.
	/// </summary>
	/// <param name="path">The path of the raster file.</param>
	/// <exception cref="std::runtime_error">The file cannot be opened or read.</exception>
	static RasterImage load(const std::string& path);

	/// <summary>
	/// Reads all bands of an opened dataset.
	/// </summary>
	/// <remarks>
	/// Bands keep their native sample type when all of them share it, otherwise all are read as <c>CV_64F</c>.
	/// </remarks>
	static std::vector<cv::Mat> readBands(GDALDataset* dataset);

	const std::string& path() const { return _path; }
	const std::vector<cv::Mat>& bands() const { return _bands; }
	std::size_t bandCount() const { return _bands.size(); }
	int rows() const { return _bands.empty() ? 0 : _bands.front().rows; }
	int cols() const { return _bands.empty() ? 0 : _bands.front().cols; }

	/// <summary>
	/// Determines whether the image has a 4th (alpha) band.
	/// </summary>
	bool hasAlpha() const { return _bands.size() >= 4; }

	/// <summary>
	/// Determines whether the source file was georeferenced.
	/// </summary>
	bool isGeoReferenced() const { return _metadata.is_initialized(); }

	/// <summary>
	/// Retrieves the georeferencing metadata.
	/// </summary>
	/// <exception cref="std::logic_error">The image is not georeferenced.</exception>
	const RasterMetadata& metadata() const;

	/// <summary>
	/// Merges the first four bands into a single 4-channel matrix (RGBA).
	/// </summary>
	/// <exception cref="std::logic_error">The image has less than 4 bands.</exception>
	cv::Mat pixels() const;
};
} // Raster
} // CanopyTools
