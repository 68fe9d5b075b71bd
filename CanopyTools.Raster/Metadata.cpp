#include <stdexcept>
#include <ostream>
#include <cstring>
#include <algorithm>

#include "Metadata.h"
#include "Helper.h"

namespace CanopyTools
{
namespace Raster
{
RasterMetadata::RasterMetadata(GDALDataset* dataset)
{
	// Retrieving spatial positions
	_rasterSizeX = dataset->GetRasterXSize();
	_rasterSizeY = dataset->GetRasterYSize();

	double geoTransform[6];
	if (dataset->GetGeoTransform(geoTransform) != CE_None)
		throw std::logic_error("Error at retrieving geographical transformation.");
	setGeoTransform(geoTransform);

	// Retrieving spatial reference system
	const char* wkt = dataset->GetProjectionRef();
	if (wkt != nullptr && std::strlen(wkt) > 0 && _reference.importFromWkt(wkt) != OGRERR_NONE)
		throw std::runtime_error("Error at reading the spatial reference system.");
}

RasterMetadata::RasterMetadata(const RasterMetadata& other)
	: _originX(other._originX), _originY(other._originY),
	  _rasterSizeX(other._rasterSizeX), _rasterSizeY(other._rasterSizeY),
	  _pixelSizeX(other._pixelSizeX), _pixelSizeY(other._pixelSizeY),
	  _extentX(other._extentX), _extentY(other._extentY),
	  _reference(other._reference)
{ }

RasterMetadata& RasterMetadata::operator= (const RasterMetadata& other)
{
	if (this == &other)
		return *this;

	_originX = other._originX;
	_originY = other._originY;
	_rasterSizeX = other._rasterSizeX;
	_rasterSizeY = other._rasterSizeY;
	_pixelSizeX = other._pixelSizeX;
	_pixelSizeY = other._pixelSizeY;
	_extentX = other._extentX;
	_extentY = other._extentY;
	_reference = other._reference;
	return *this;
}

std::array<double, 6> RasterMetadata::geoTransform() const
{
	std::array<double, 6> geoTransform =
	{
		_originX,
		_pixelSizeX,
		0,
		_originY,
		0,
		_pixelSizeY
	};
	return geoTransform;
}

void RasterMetadata::setGeoTransform(const double* geoTransform)
{
	_originX = geoTransform[0];
	_originY = geoTransform[3];

	_pixelSizeX = geoTransform[1];
	_pixelSizeY = geoTransform[5];

	_extentX = std::abs(_rasterSizeX * _pixelSizeX);
	_extentY = std::abs(_rasterSizeY * _pixelSizeY);
}

OGRPolygon RasterMetadata::bounds() const
{
	double endX = _originX + _rasterSizeX * _pixelSizeX;
	double endY = _originY + _rasterSizeY * _pixelSizeY;
	double minX = std::min(_originX, endX);
	double maxX = std::max(_originX, endX);
	double minY = std::min(_originY, endY);
	double maxY = std::max(_originY, endY);

	OGRLinearRing ring;
	ring.addPoint(minX, maxY); // upper left
	ring.addPoint(maxX, maxY); // upper right
	ring.addPoint(maxX, minY); // lower right
	ring.addPoint(minX, minY); // lower left
	ring.closeRings();

	OGRPolygon polygon;
	polygon.addRing(&ring);
	return polygon;
}

OGRPoint RasterMetadata::centroid() const
{
	if (_rasterSizeX <= 0 || _rasterSizeY <= 0)
		throw std::logic_error("The raster has no extent.");

	// The bounds are axis-aligned, the centroid is the middle of the envelope.
	OGREnvelope envelope;
	bounds().getEnvelope(&envelope);
	return OGRPoint((envelope.MinX + envelope.MaxX) / 2, (envelope.MinY + envelope.MaxY) / 2);
}

bool RasterMetadata::isGeoReferenced(GDALDataset* dataset)
{
	double geoTransform[6];
	if (dataset->GetGeoTransform(geoTransform) != CE_None)
		return false;

	const char* wkt = dataset->GetProjectionRef();
	return wkt != nullptr && std::strlen(wkt) > 0;
}

std::ostream& operator<<(std::ostream& out, const RasterMetadata& metadata)
{
	out << "Origin: \t" << metadata.originX() << " x " << metadata.originY() << std::endl;
	out << "Raster size: \t" << metadata.rasterSizeX() << " x " << metadata.rasterSizeY() << std::endl;
	out << "Pixel size: \t" << metadata.pixelSizeX() << " x " << metadata.pixelSizeY() << std::endl;
	out << "Extent: \t" << metadata.extentX() << " x " << metadata.extentY() << std::endl;
	out << "Reference: \t";

	std::string srs = SRSName(metadata.reference());
	if (!srs.length())
		srs = "none";
	out << srs << std::endl;

	return out;
}
} // Raster
} // CanopyTools
