#pragma once

#include <array>
#include <iosfwd>
#include <cmath>

#include <gdal_priv.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>

namespace CanopyTools
{
namespace Raster
{
/// <summary>
/// Represents the georeferencing metadata of a raster file.
/// </summary>
class RasterMetadata
{
protected:
	double _originX;
	double _originY;
	int _rasterSizeX;
	int _rasterSizeY;
	double _pixelSizeX;
	double _pixelSizeY;
	double _extentX;
	double _extentY;
	OGRSpatialReference _reference;

public:
	RasterMetadata() : _originX(0), _originY(0),
	                   _rasterSizeX(0), _rasterSizeY(0),
	                   _pixelSizeX(0), _pixelSizeY(0),
	                   _extentX(0), _extentY(0)
	{ }

	/// <summary>
	/// Loads the metadata of a dataset.
	/// </summary>
	/// <exception cref="std::logic_error">The dataset has no geographical transformation.</exception>
	/// <exception cref="std::runtime_error">The spatial reference system cannot be read.</exception>
	explicit RasterMetadata(GDALDataset* dataset);

	RasterMetadata(const RasterMetadata& other);
	RasterMetadata& operator= (const RasterMetadata& other);

#pragma region Getters

	double originX() const { return _originX; }
	double originY() const { return _originY; }
	int rasterSizeX() const { return _rasterSizeX; }
	int rasterSizeY() const { return _rasterSizeY; }
	double pixelSizeX() const { return _pixelSizeX; }
	double pixelSizeY() const { return _pixelSizeY; }
	double extentX() const { return _extentX; }
	double extentY() const { return _extentY; }
	const OGRSpatialReference& reference() const { return _reference; }

#pragma endregion

#pragma region Setters

	void setOriginX(double originX) { _originX = originX; }
	void setOriginY(double originY) { _originY = originY; }
	void setRasterSizeX(int rasterSizeX)
	{
		_rasterSizeX = rasterSizeX;
		_extentX = std::abs(_rasterSizeX * _pixelSizeX);
	}
	void setRasterSizeY(int rasterSizeY)
	{
		_rasterSizeY = rasterSizeY;
		_extentY = std::abs(_rasterSizeY * _pixelSizeY);
	}
	void setPixelSizeX(double pixelSizeX)
	{
		_pixelSizeX = pixelSizeX;
		_extentX = std::abs(_rasterSizeX * _pixelSizeX);
	}
	void setPixelSizeY(double pixelSizeY)
	{
		_pixelSizeY = pixelSizeY;
		_extentY = std::abs(_rasterSizeY * _pixelSizeY);
	}

#pragma endregion

	/// <summary>
	/// Returns the georeferencing transform array (using format of GDAL).
	/// </summary>
	std::array<double, 6> geoTransform() const;

	/// <summary>
	/// Loads the metadata from the georeferencing transform (using format of GDAL).
	/// </summary>
	void setGeoTransform(const double* geoTransform);

	/// <summary>
	/// Builds the bounding polygon of the raster in its own spatial reference system.
	/// </summary>
	/// <remarks>
	/// The ring runs upper left, upper right, lower right, lower left and is closed.
	/// </remarks>
	OGRPolygon bounds() const;

	/// <summary>
	/// Calculates the centroid of the bounding polygon.
	/// </summary>
	/// <remarks>
	/// X is the easting (or longitude), Y is the northing (or latitude).
	/// </remarks>
	OGRPoint centroid() const;

	/// <summary>
	/// Determines whether a dataset is georeferenced.
	/// </summary>
	/// <remarks>
	/// A dataset is georeferenced when it has both a geographical transformation and a spatial reference system.
	/// </remarks>
	static bool isGeoReferenced(GDALDataset* dataset);
};

std::ostream& operator<<(std::ostream& out, const RasterMetadata& metadata);
} // Raster
} // CanopyTools
