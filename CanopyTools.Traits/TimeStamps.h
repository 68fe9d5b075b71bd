#pragma once

#include <string>

#include <boost/optional.hpp>

namespace CanopyTools
{
namespace Traits
{
/// <summary>
/// The date and local time representations of a run timestamp.
/// </summary>
struct TimeStamps
{
	/// <summary>
	/// The date in <c>YYYY-MM-DD</c> format.
	/// </summary>
	std::string date;

	/// <summary>
	/// The local time in <c>YYYY-MM-DDTHH:MM:SS</c> format.
	/// </summary>
	std::string localTime;

	bool empty() const { return date.empty(); }

	/// <summary>
	/// Retrieves the year part of the date.
	/// </summary>
	std::string year() const { return date.substr(0, 4); }
};

/// <summary>
/// Derives the date and the local time from an ISO 8601 timestamp.
/// </summary>
/// <param name="timestamp">The timestamp, empty when not known.</param>
/// <param name="override">Takes precedence over <paramref name="timestamp"/> when present.</param>
/// <remarks>
/// Time zone designators are dropped and the local time is kept. Fractional seconds are dropped.
/// A date without time part means midnight.
/// </remarks>
/// <returns>Empty strings when neither timestamp is given.</returns>
/// <exception cref="std::invalid_argument">The timestamp is not in ISO 8601 format.</exception>
TimeStamps getTimeStamps(const std::string& timestamp,
                         const boost::optional<std::string>& override = boost::none);
} // Traits
} // CanopyTools
