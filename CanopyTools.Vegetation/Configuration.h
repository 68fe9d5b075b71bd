#pragma once

namespace CanopyTools
{
namespace Vegetation
{
/// <summary>
/// Identity of the canopy cover transformer.
/// </summary>
namespace Transformer
{
const char* const Name = "terra.stereo-rgb.canopycover";
const char* const Version = "3.0";
const char* const Description = "Canopy Cover by Plot (Percentage of Green Pixels)";
const char* const SensorName = "stereoTop";
const char* const TransformerType = "canopyCover";
} // Transformer

/// <summary>
/// Name of the canopy cover CSV file.
/// </summary>
const char* const CoverFileName = "canopycover.csv";

/// <summary>
/// Name of the geostream CSV file.
/// </summary>
const char* const GeostreamFileName = "canopycover_geostreams.csv";

/// <summary>
/// Trait label of the geostream rows.
/// </summary>
const char* const GeostreamTraitName = "Canopy Cover";
} // Vegetation
} // CanopyTools
