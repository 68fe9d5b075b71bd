#pragma once

#include <string>

#include <gdal.h>
#include <ogr_spatialref.h>

namespace CanopyTools
{
namespace Raster
{
/// <summary>
/// Returns the OpenCV matrix depth matching the GDAL data type.
/// </summary>
/// <remarks>
/// Types without an exact OpenCV counterpart (unsigned 32-bit, 64-bit integers) are widened to <c>CV_64F</c>.
/// Complex types are not supported and result in -1.
/// </remarks>
int cvDepth(GDALDataType dataType);

/// <summary>
/// Returns the GDAL data type matching the OpenCV matrix depth.
/// </summary>
GDALDataType gdalType(int cvDepth);

/// <summary>
/// Retrieves the well known name for a spatial reference system (e.g. <c>"EPSG:32612"</c>).
/// </summary>
/// <param name="reference">The spatial reference system.</param>
std::string SRSName(const OGRSpatialReference& reference);

/// <summary>
/// Formats a floating point value with the given number of significant digits (<c>%.Ng</c>).
/// </summary>
std::string formatSignificant(double value, int digits);

/// <summary>
/// Formats a floating point value with the shortest representation that reads back to the same value.
/// </summary>
std::string formatShortest(double value);
} // Raster
} // CanopyTools
