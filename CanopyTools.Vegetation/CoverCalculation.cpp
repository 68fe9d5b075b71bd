#include <vector>
#include <stdexcept>

#include <opencv2/core.hpp>

#include "CoverCalculation.h"

namespace CanopyTools
{
namespace Vegetation
{
double calculateCanopyCoverMasked(const cv::Mat& pixels, double nodataCutoff)
{
	if (pixels.channels() != 4)
		throw std::invalid_argument("The image must have 4 channels.");

	std::vector<cv::Mat> channels;
	cv::split(pixels, channels);

	const cv::Mat& alpha = channels[3];
	double total = static_cast<double>(pixels.total());

	cv::Mat nodataMask;
	cv::compare(alpha, cv::Scalar(0), nodataMask, cv::CMP_EQ);
	double nodata = cv::countNonZero(nodataMask);

	if (nodataCutoff >= 0 && nodata / total > nodataCutoff)
		return CoverNotAvailable;

	if (total - nodata == 0)
		throw std::domain_error("The image has no valid pixels.");

	// Sum of the colour channels in double precision to avoid overflow
	cv::Mat sum = cv::Mat::zeros(pixels.size(), CV_64F);
	for (int i = 0; i < 3; ++i)
	{
		cv::Mat channel;
		channels[i].convertTo(channel, CV_64F);
		sum += channel;
	}

	cv::Mat validMask, colourMask;
	cv::compare(alpha, cv::Scalar(255), validMask, cv::CMP_EQ);
	cv::compare(sum, cv::Scalar(0), colourMask, cv::CMP_GT);
	double canopy = cv::countNonZero(validMask & colourMask);

	return canopy / (total - nodata) * 100;
}
} // Vegetation
} // CanopyTools
