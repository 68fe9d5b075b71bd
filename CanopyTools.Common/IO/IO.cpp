#include <iostream>
#include <iomanip>

#include "IO.h"

namespace CanopyTools
{
namespace IO
{
#pragma region Output operations

void reportProgress(float complete, const std::string &message, std::ostream& out)
{
	std::ios_base::fmtflags flags = out.flags();
	std::streamsize precision = out.precision();

	eraseLine(32, out);
	out << "\rProgress: " << std::fixed << std::setprecision(2) << (complete * 100) << "%";
	if (!message.empty())
		out << " (" << message << ")";
	if (complete >= 1.f)
		out << std::endl;
	out << std::flush;

	out.flags(flags);
	out.precision(precision);
}

void eraseLine(std::size_t size, std::ostream& out)
{
	out << std::string(size, '\b') << '\r' << std::flush;
}

#pragma endregion
} // IO
} // CanopyTools
