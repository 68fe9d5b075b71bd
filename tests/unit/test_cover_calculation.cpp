#include <cmath>
#include <iostream>
#include <stdexcept>

#include <opencv2/core.hpp>

#include <CanopyTools.Vegetation/CoverCalculation.h>

using namespace CanopyTools::Vegetation;

namespace
{
cv::Mat image(int rows, int cols, const cv::Scalar& colour)
{
	return cv::Mat(rows, cols, CV_8UC4, colour);
}
} // anonymous

int main()
{
	if (calculateCanopyCoverMasked(image(10, 10, cv::Scalar(10, 120, 10, 255))) != 100)
	{
		std::cerr << "all valid green image is not 100\n";
		return 1;
	}

	if (calculateCanopyCoverMasked(image(10, 10, cv::Scalar(0, 0, 0, 255))) != 0)
	{
		std::cerr << "all valid black image is not 0\n";
		return 1;
	}

	bool thrown = false;
	try
	{
		calculateCanopyCoverMasked(image(10, 10, cv::Scalar(10, 120, 10, 0)));
	}
	catch (std::domain_error&)
	{
		thrown = true;
	}
	if (!thrown)
	{
		std::cerr << "all invalid image did not raise\n";
		return 1;
	}

	// Half of the pixels invalid, a quarter of the valid ones black
	cv::Mat mixed = image(4, 10, cv::Scalar(0, 200, 0, 255));
	mixed(cv::Rect(5, 0, 5, 4)).setTo(cv::Scalar(0, 200, 0, 0));
	mixed(cv::Rect(0, 0, 5, 1)).setTo(cv::Scalar(0, 0, 0, 255));
	if (std::abs(calculateCanopyCoverMasked(mixed) - 75) > 1e-9)
	{
		std::cerr << "masked ratio mismatch\n";
		return 1;
	}

	// Partially transparent pixels are neither nodata nor canopy
	cv::Mat translucent = image(1, 4, cv::Scalar(50, 50, 50, 255));
	translucent.at<cv::Vec4b>(0, 0) = cv::Vec4b(50, 50, 50, 128);
	if (std::abs(calculateCanopyCoverMasked(translucent) - 75) > 1e-9)
	{
		std::cerr << "partial alpha handling mismatch\n";
		return 1;
	}

	// Nodata cutoff
	cv::Mat sparse = image(10, 10, cv::Scalar(0, 200, 0, 0));
	sparse(cv::Rect(0, 0, 10, 2)).setTo(cv::Scalar(0, 200, 0, 255));
	if (calculateCanopyCoverMasked(sparse, 0.75) != CoverNotAvailable)
	{
		std::cerr << "nodata cutoff did not apply\n";
		return 1;
	}
	if (calculateCanopyCoverMasked(sparse) != 100)
	{
		std::cerr << "disabled cutoff applied\n";
		return 1;
	}

	// No overflow when summing 16 bit channels
	cv::Mat wide(2, 2, CV_16UC4, cv::Scalar(65535, 65535, 65535, 255));
	if (calculateCanopyCoverMasked(wide) != 100)
	{
		std::cerr << "16 bit image mismatch\n";
		return 1;
	}

	thrown = false;
	try
	{
		calculateCanopyCoverMasked(cv::Mat(2, 2, CV_8UC3, cv::Scalar(1, 1, 1)));
	}
	catch (std::invalid_argument&)
	{
		thrown = true;
	}
	if (!thrown)
	{
		std::cerr << "3 channel image was accepted\n";
		return 1;
	}

	return 0;
}
