#include <iostream>
#include <sstream>
#include <stdexcept>

#include <opencv2/core.hpp>

#include <CanopyTools.Raster/AlphaMask.h>
#include <CanopyTools.Raster/Helper.h>
#include <CanopyTools.Raster/Metadata.h>

using namespace CanopyTools::Raster;

int main()
{
	// Significant digits
	if (formatSignificant(100, 3) != "100" || formatSignificant(1.05, 3) != "1.05" ||
		formatSignificant(99.8123, 3) != "99.8" || formatSignificant(0, 3) != "0" ||
		formatSignificant(-1, 3) != "-1" || formatSignificant(33.3333, 3) != "33.3")
	{
		std::cerr << "formatSignificant mismatch\n";
		return 1;
	}

	if (formatShortest(3999995) != "3999995" || formatShortest(500005.5) != "500005.5" ||
		formatShortest(0.1) != "0.1" || formatShortest(-33.25) != "-33.25")
	{
		std::cerr << "formatShortest mismatch\n";
		return 1;
	}

	// Type mapping
	if (cvDepth(GDT_Byte) != CV_8U || cvDepth(GDT_UInt16) != CV_16U || cvDepth(GDT_Float32) != CV_32F ||
		cvDepth(GDT_CInt16) != -1 || gdalType(CV_8U) != GDT_Byte || gdalType(CV_64F) != GDT_Float64)
	{
		std::cerr << "type mapping mismatch\n";
		return 1;
	}

	// Alpha channel of plain images
	std::vector<cv::Mat> bands =
	{
		cv::Mat(3, 5, CV_8U, cv::Scalar(1)),
		cv::Mat(3, 5, CV_8U, cv::Scalar(2)),
		cv::Mat(3, 5, CV_8U, cv::Scalar(3))
	};
	cv::Mat pixels = addImageMaskNonGeo(bands);
	if (pixels.channels() != 4 || pixels.rows != 3 || pixels.cols != 5 ||
		pixels.at<cv::Vec4b>(2, 4) != cv::Vec4b(1, 2, 3, 255))
	{
		std::cerr << "alpha channel mismatch\n";
		return 1;
	}

	bool thrown = false;
	try
	{
		addImageMaskNonGeo({ bands[0], bands[1] });
	}
	catch (std::invalid_argument&)
	{
		thrown = true;
	}
	if (!thrown)
	{
		std::cerr << "2 band image was accepted\n";
		return 1;
	}

	// Raster metadata
	RasterMetadata metadata;
	metadata.setOriginX(500000);
	metadata.setOriginY(4000000);
	metadata.setPixelSizeX(1);
	metadata.setPixelSizeY(-1);
	metadata.setRasterSizeX(10);
	metadata.setRasterSizeY(10);
	OGRPoint centroid = metadata.centroid();
	if (centroid.getX() != 500005 || centroid.getY() != 3999995 || metadata.extentY() != 10)
	{
		std::cerr << "centroid of north-up raster mismatch\n";
		return 1;
	}
	if (metadata.geoTransform()[3] != 4000000 || metadata.geoTransform()[5] != -1)
	{
		std::cerr << "geotransform mismatch\n";
		return 1;
	}

	OGREnvelope envelope;
	metadata.bounds().getEnvelope(&envelope);
	if (envelope.MinX != 500000 || envelope.MaxX != 500010 || envelope.MinY != 3999990 || envelope.MaxY != 4000000)
	{
		std::cerr << "bounds mismatch\n";
		return 1;
	}

	metadata.setPixelSizeY(0.5);
	if (metadata.centroid().getY() != 4000002.5)
	{
		std::cerr << "centroid of south-up raster mismatch\n";
		return 1;
	}

	std::ostringstream description;
	description << metadata;
	if (description.str().find("Reference: \tnone") == std::string::npos)
	{
		std::cerr << "metadata description mismatch\n";
		return 1;
	}

	metadata.setRasterSizeX(0);
	thrown = false;
	try
	{
		metadata.centroid();
	}
	catch (std::logic_error&)
	{
		thrown = true;
	}
	if (!thrown)
	{
		std::cerr << "centroid of empty raster was returned\n";
		return 1;
	}

	// Image accessors
	RasterImage image("plain.tif", bands);
	if (image.hasAlpha() || image.isGeoReferenced() || image.rows() != 3 || image.cols() != 5)
	{
		std::cerr << "image accessors mismatch\n";
		return 1;
	}

	thrown = false;
	try
	{
		image.pixels();
	}
	catch (std::logic_error&)
	{
		thrown = true;
	}
	if (!thrown)
	{
		std::cerr << "pixels of image without alpha were returned\n";
		return 1;
	}

	return 0;
}
