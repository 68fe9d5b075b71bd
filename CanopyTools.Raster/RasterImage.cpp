#include <stdexcept>
#include <utility>

#include "RasterImage.h"
#include "Helper.h"

namespace CanopyTools
{
namespace Raster
{
RasterImage::RasterImage(const std::string& path,
                         std::vector<cv::Mat> bands,
                         boost::optional<RasterMetadata> metadata)
	: _path(path), _bands(std::move(bands)), _metadata(std::move(metadata))
{ }

RasterImage RasterImage::load(const std::string& path)
{
	GDALDataset* dataset = GDALDataset::FromHandle(GDALOpen(path.c_str(), GA_ReadOnly));
	if (dataset == nullptr)
		throw std::runtime_error("Error at opening the raster file '" + path + "'.");

	try
	{
		boost::optional<RasterMetadata> metadata;
		if (RasterMetadata::isGeoReferenced(dataset))
			metadata = RasterMetadata(dataset);

		RasterImage image(path, readBands(dataset), metadata);
		GDALClose(GDALDataset::ToHandle(dataset));
		return image;
	}
	catch (...)
	{
		GDALClose(GDALDataset::ToHandle(dataset));
		throw;
	}
}

std::vector<cv::Mat> RasterImage::readBands(GDALDataset* dataset)
{
	int count = dataset->GetRasterCount();
	int sizeX = dataset->GetRasterXSize();
	int sizeY = dataset->GetRasterYSize();

	std::vector<cv::Mat> bands;
	if (count == 0)
		return bands;

	// Determine the common sample type
	GDALDataType dataType = dataset->GetRasterBand(1)->GetRasterDataType();
	for (int i = 2; i <= count; ++i)
		if (dataset->GetRasterBand(i)->GetRasterDataType() != dataType)
		{
			dataType = GDALDataType::GDT_Float64;
			break;
		}

	int depth = cvDepth(dataType);
	if (depth < 0)
		throw std::runtime_error("Complex raster data types are not supported.");

	bands.reserve(count);
	for (int i = 1; i <= count; ++i)
	{
		cv::Mat band(sizeY, sizeX, CV_MAKETYPE(depth, 1));
		if (dataset->GetRasterBand(i)->RasterIO(GF_Read, 0, 0, sizeX, sizeY,
		                                        band.data, sizeX, sizeY, gdalType(depth),
		                                        0, 0) != CE_None)
			throw std::runtime_error("Error at reading band " + std::to_string(i) + " of the raster.");
		bands.push_back(band);
	}
	return bands;
}

const RasterMetadata& RasterImage::metadata() const
{
	if (!_metadata)
		throw std::logic_error("The image is not georeferenced.");
	return *_metadata;
}

cv::Mat RasterImage::pixels() const
{
	if (!hasAlpha())
		throw std::logic_error("The image has no alpha band.");

	cv::Mat merged;
	cv::merge(std::vector<cv::Mat>(_bands.begin(), _bands.begin() + 4), merged);
	return merged;
}
} // Raster
} // CanopyTools
