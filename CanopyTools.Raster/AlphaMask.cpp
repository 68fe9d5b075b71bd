#include <stdexcept>

#include <gdal_utils.h>
#include <cpl_string.h>

#include "AlphaMask.h"

using namespace CanopyTools::IO;

namespace CanopyTools
{
namespace Raster
{
cv::Mat addImageMaskNonGeo(const std::vector<cv::Mat>& bands)
{
	if (bands.size() < 3)
		throw std::invalid_argument("At least 3 bands are required to add an alpha channel.");

	cv::Mat alpha(bands[0].size(), bands[0].type(), cv::Scalar(255));
	std::vector<cv::Mat> channels = { bands[0], bands[1], bands[2], alpha };

	cv::Mat merged;
	cv::merge(channels, merged);
	return merged;
}

const RasterImage& ImageMask::target() const
{
	if (!isExecuted())
		throw std::logic_error("The operation is not executed.");
	return *_target;
}

void ImageMask::onPrepare()
{
	if (!fs::is_regular_file(_sourcePath))
		throw std::runtime_error("The source image '" + _sourcePath + "' does not exist.");
}

void ImageMask::onExecute()
{
	bool failed = false;
	{
		TemporaryFileResult vrt = TemporaryFileResult::unique("mask_", ".vrt");
		TemporaryFileResult mask = TemporaryFileResult::unique("mask_", ".tif");

		try
		{
			buildVirtualRaster(vrt);
			materialize(vrt, mask);

			boost::optional<RasterMetadata> metadata;
			if (RasterMetadata::isGeoReferenced(mask.dataset))
				metadata = RasterMetadata(mask.dataset);
			_target = RasterImage(_sourcePath, RasterImage::readBands(mask.dataset), metadata);
		}
		catch (std::exception& ex)
		{
			failed = true;
			if (_logger)
			{
				_logger->error("Exception caught trying to generate alpha mask for image \"" + _sourcePath + "\"");
				_logger->debug(ex.what());
			}
		}

		// Removal failures are not masked
		vrt.remove();
		mask.remove();
	}

	if (failed)
		throw std::runtime_error("Exception detected while trying to generate alpha mask for image \"" + _sourcePath + "\"");
}

void ImageMask::buildVirtualRaster(TemporaryFileResult& vrt)
{
	// Define the GDALBuildVRT parameters
	char **params = nullptr;
	params = CSLAddString(params, "-addalpha");
	params = CSLAddString(params, "-srcnodata");
	params = CSLAddString(params, sourceNodata.c_str());

	GDALBuildVRTOptions *options = GDALBuildVRTOptionsNew(params, nullptr);
	CSLDestroy(params);
	if (options == nullptr)
		throw std::runtime_error("Invalid virtual raster options.");

	std::string sourcePath = fs::absolute(_sourcePath).string();
	const char* sources[] = { sourcePath.c_str() };

	// Execute GDALBuildVRT
	int usageError = FALSE;
	GDALDatasetH dataset = GDALBuildVRT(vrt.path().c_str(), 1, nullptr, sources, options, &usageError);
	GDALBuildVRTOptionsFree(options);

	if (dataset == nullptr || usageError)
		throw std::runtime_error("Error at building the virtual raster.");
	vrt.dataset = GDALDataset::FromHandle(dataset);
}

void ImageMask::materialize(TemporaryFileResult& vrt, TemporaryFileResult& mask)
{
	// Define the GDALTranslate parameters
	char **params = nullptr;
	for (auto& co : createOptions)
	{
		params = CSLAddString(params, "-co");
		params = CSLSetNameValue(params, co.first.c_str(), co.second.c_str());
	}
	params = CSLAddString(params, "-of");
	params = CSLAddString(params, "GTiff");

	GDALTranslateOptions *options = GDALTranslateOptionsNew(params, nullptr);
	CSLDestroy(params);
	if (options == nullptr)
		throw std::runtime_error("Invalid raster translation options.");

	// Execute GDALTranslate
	int usageError = FALSE;
	GDALDatasetH dataset = GDALTranslate(mask.path().c_str(), GDALDataset::ToHandle(vrt.dataset),
	                                     options, &usageError);
	GDALTranslateOptionsFree(options);

	if (dataset == nullptr || usageError)
		throw std::runtime_error("Error at materializing the masked raster.");
	mask.dataset = GDALDataset::FromHandle(dataset);
}
} // Raster
} // CanopyTools
