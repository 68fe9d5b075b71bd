#pragma once

#include <string>
#include <vector>
#include <map>

#include <boost/optional.hpp>
#include <opencv2/core.hpp>

#include <CanopyTools.Common/Operation.h>
#include <CanopyTools.Common/IO/Logger.h>
#include <CanopyTools.Common/IO/Result.h>

#include "RasterImage.h"

namespace CanopyTools
{
namespace Raster
{
/// <summary>
/// Adds a fully opaque alpha channel to an image that is not georeferenced.
/// </summary>
/// <remarks>
/// No check is made whether the image already has an alpha band, bands after the third are ignored.
/// </remarks>
/// <param name="bands">The bands of the image, at least 3.</param>
/// <returns>The 4-channel (RGBA) matrix with alpha 255 everywhere.</returns>
/// <exception cref="std::invalid_argument">Less than 3 bands are given.</exception>
cv::Mat addImageMaskNonGeo(const std::vector<cv::Mat>& bands);

/// <summary>
/// Generates the alpha band of a georeferenced image through a virtual raster.
/// </summary>
/// <remarks>
/// A VRT with an alpha band is built over the source, marking <see cref="sourceNodata"/> pixels as transparent,
/// then it is materialized into a temporary GeoTIFF and read back. The temporary files are removed
/// whether the generation succeeds or not.
/// </remarks>
class ImageMask : public CanopyTools::Operation
{
public:
	/// <summary>
	/// The source nodata values per band, as given to the VRT builder.
	/// </summary>
	std::string sourceNodata = "-99 -99 -99";

	/// <summary>
	/// Creation options of the materialized raster.
	/// </summary>
	std::map<std::string, std::string> createOptions =
	{
		{ "COMPRESS", "LZW" },
		{ "BIGTIFF", "YES" }
	};

	/// <summary>
	/// Initializes a new instance of the class.
	/// </summary>
	/// <param name="sourcePath">The georeferenced source image.</param>
	/// <param name="logger">The logger to report failures to, may be <c>nullptr</c>.</param>
	explicit ImageMask(const std::string& sourcePath, IO::Logger* logger = nullptr)
		: _sourcePath(sourcePath), _logger(logger)
	{ }

	ImageMask(const ImageMask&) = delete;
	ImageMask& operator=(const ImageMask&) = delete;

	/// <summary>
	/// Retrieves the masked image (source bands followed by the alpha band).
	/// </summary>
	const RasterImage& target() const;

protected:
	void onPrepare() override;
	void onExecute() override;

private:
	std::string _sourcePath;
	IO::Logger* _logger;
	boost::optional<RasterImage> _target;

	void buildVirtualRaster(IO::TemporaryFileResult& vrt);
	void materialize(IO::TemporaryFileResult& vrt, IO::TemporaryFileResult& mask);
};
} // Raster
} // CanopyTools
