#pragma once

#include <opencv2/core.hpp>

namespace CanopyTools
{
namespace Vegetation
{
/// <summary>
/// The value returned instead of the cover when the image has too much nodata.
/// </summary>
const double CoverNotAvailable = -1;

/// <summary>
/// Calculates the canopy cover percentage of a masked image.
/// </summary>
/// <param name="pixels">A 4 channel image, the last channel is the alpha mask (0: nodata, 255: valid).</param>
/// <param name="nodataCutoff">
/// The maximal ratio of nodata pixels, <see cref="CoverNotAvailable"/> is returned above it.
/// A negative value disables the check.
/// </param>
/// <returns>The percentage of valid non-black pixels among the valid pixels.</returns>
/// <exception cref="std::invalid_argument">The image does not have 4 channels.</exception>
/// <exception cref="std::domain_error">The image has no valid pixels.</exception>
double calculateCanopyCoverMasked(const cv::Mat& pixels, double nodataCutoff = -1);
} // Vegetation
} // CanopyTools
