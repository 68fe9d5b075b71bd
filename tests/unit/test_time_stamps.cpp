#include <iostream>
#include <stdexcept>

#include <CanopyTools.Traits/TimeStamps.h>

using namespace CanopyTools::Traits;

namespace
{
bool check(const std::string& timestamp, const std::string& date, const std::string& localTime)
{
	TimeStamps result = getTimeStamps(timestamp);
	if (result.date != date || result.localTime != localTime)
	{
		std::cerr << "getTimeStamps(\"" << timestamp << "\") returned "
		          << result.date << " / " << result.localTime << "\n";
		return false;
	}
	return true;
}

bool rejects(const std::string& timestamp)
{
	try
	{
		getTimeStamps(timestamp);
	}
	catch (std::invalid_argument&)
	{
		return true;
	}
	std::cerr << "getTimeStamps accepted \"" << timestamp << "\"\n";
	return false;
}
} // anonymous

int main()
{
	if (!check("2018-05-01T12:30:45", "2018-05-01", "2018-05-01T12:30:45") ||
		!check("2018-05-01T12:30:45Z", "2018-05-01", "2018-05-01T12:30:45") ||
		!check("2018-05-01T12:30:45-07:00", "2018-05-01", "2018-05-01T12:30:45") ||
		!check("2018-05-01T12:30:45.123+0100", "2018-05-01", "2018-05-01T12:30:45") ||
		!check("2018-05-01 08:15", "2018-05-01", "2018-05-01T08:15:00") ||
		!check("2018-05-01", "2018-05-01", "2018-05-01T00:00:00") ||
		!check("", "", ""))
		return 1;

	TimeStamps overridden = getTimeStamps("2018-05-01T12:30:45", std::string("2020-01-02T03:04:05"));
	if (overridden.localTime != "2020-01-02T03:04:05" || overridden.year() != "2020")
	{
		std::cerr << "override did not win\n";
		return 1;
	}

	if (!getTimeStamps("").empty())
	{
		std::cerr << "missing timestamp is not empty\n";
		return 1;
	}

	if (!rejects("yesterday") || !rejects("2018-13-01") || !rejects("2018-02-30") ||
		!rejects("2018-05-01T25:00:00") || !rejects("2018-05-01T12"))
		return 1;

	return 0;
}
