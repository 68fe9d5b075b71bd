#include <sstream>
#include <iomanip>
#include <limits>

#include <opencv2/core.hpp>

#include "Helper.h"

namespace CanopyTools
{
namespace Raster
{
int cvDepth(GDALDataType dataType)
{
	switch (dataType)
	{
	case GDALDataType::GDT_Byte:
		return CV_8U;
	case GDALDataType::GDT_UInt16:
		return CV_16U;
	case GDALDataType::GDT_Int16:
		return CV_16S;
	case GDALDataType::GDT_Int32:
		return CV_32S;
	case GDALDataType::GDT_Float32:
		return CV_32F;
	case GDALDataType::GDT_UInt32:
	case GDALDataType::GDT_Float64:
		return CV_64F;
	default:
		// Complex types are not supported.
		return -1;
	}
}

GDALDataType gdalType(int cvDepth)
{
	switch (cvDepth)
	{
	case CV_8U:
		return GDALDataType::GDT_Byte;
	case CV_16U:
		return GDALDataType::GDT_UInt16;
	case CV_16S:
		return GDALDataType::GDT_Int16;
	case CV_32S:
		return GDALDataType::GDT_Int32;
	case CV_32F:
		return GDALDataType::GDT_Float32;
	case CV_64F:
		return GDALDataType::GDT_Float64;
	default:
		return GDALDataType::GDT_Unknown;
	}
}

std::string SRSName(const OGRSpatialReference& reference)
{
	const char* authorityName = reference.GetAuthorityName(nullptr);
	const char* authorityCode = reference.GetAuthorityCode(nullptr);

	if (authorityName && authorityCode)
		return std::string(authorityName).append(":").append(authorityCode);
	else
		return std::string();
}

std::string formatSignificant(double value, int digits)
{
	std::ostringstream out;
	out << std::setprecision(digits) << value;
	return out.str();
}

std::string formatShortest(double value)
{
	std::string text;
	for (int digits = 1; digits <= std::numeric_limits<double>::max_digits10; ++digits)
	{
		text = formatSignificant(value, digits);
		std::istringstream in(text);
		double parsed;
		if (in >> parsed && parsed == value)
			break;
	}
	return text;
}
} // Raster
} // CanopyTools
