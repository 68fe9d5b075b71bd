#include <vector>
#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <boost/algorithm/string.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include "TimeStamps.h"

namespace CanopyTools
{
namespace Traits
{
namespace
{
bool isNumber(const std::string& text)
{
	return !text.empty() && std::all_of(text.begin(), text.end(),
		[](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

boost::gregorian::date parseDate(const std::string& text, const std::string& timestamp)
{
	std::vector<std::string> parts;
	boost::split(parts, text, boost::is_any_of("-"));
	if (parts.size() != 3 || parts[0].size() != 4 || parts[1].size() != 2 || parts[2].size() != 2 ||
		!isNumber(parts[0]) || !isNumber(parts[1]) || !isNumber(parts[2]))
		throw std::invalid_argument("Invalid date in timestamp '" + timestamp + "'.");

	try
	{
		return boost::gregorian::date(std::stoi(parts[0]), std::stoi(parts[1]), std::stoi(parts[2]));
	}
	catch (const std::out_of_range&)
	{
		throw std::invalid_argument("Invalid date in timestamp '" + timestamp + "'.");
	}
}

boost::posix_time::time_duration parseTime(std::string text, const std::string& timestamp)
{
	// Time zone designator
	if (!text.empty() && (text.back() == 'Z' || text.back() == 'z'))
		text.pop_back();
	std::size_t offset = text.find_first_of("+-");
	if (offset != std::string::npos)
		text.erase(offset);

	// Fractional seconds
	std::size_t fraction = text.find_first_of(".,");
	if (fraction != std::string::npos)
		text.erase(fraction);

	std::vector<std::string> parts;
	boost::split(parts, text, boost::is_any_of(":"));
	if (parts.size() < 2 || parts.size() > 3)
		throw std::invalid_argument("Invalid time in timestamp '" + timestamp + "'.");
	for (const std::string& part : parts)
		if (part.size() != 2 || !isNumber(part))
			throw std::invalid_argument("Invalid time in timestamp '" + timestamp + "'.");

	int hours = std::stoi(parts[0]);
	int minutes = std::stoi(parts[1]);
	int seconds = parts.size() == 3 ? std::stoi(parts[2]) : 0;
	if (hours > 23 || minutes > 59 || seconds > 59)
		throw std::invalid_argument("Invalid time in timestamp '" + timestamp + "'.");

	return boost::posix_time::time_duration(hours, minutes, seconds);
}
} // anonymous

TimeStamps getTimeStamps(const std::string& timestamp, const boost::optional<std::string>& override)
{
	std::string value = override ? *override : timestamp;
	boost::trim(value);
	if (value.empty())
		return TimeStamps();

	std::size_t separator = value.find_first_of("Tt ");
	boost::gregorian::date date = parseDate(value.substr(0, separator), value);
	boost::posix_time::time_duration time = separator != std::string::npos
		? parseTime(value.substr(separator + 1), value)
		: boost::posix_time::time_duration(0, 0, 0);

	TimeStamps result;
	result.date = boost::gregorian::to_iso_extended_string(date);
	result.localTime = boost::posix_time::to_iso_extended_string(boost::posix_time::ptime(date, time));
	return result;
}
} // Traits
} // CanopyTools
