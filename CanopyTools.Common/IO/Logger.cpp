#include <iostream>

#include "Logger.h"

namespace CanopyTools
{
namespace IO
{
const char* levelPrefix(Logger::Level level)
{
	switch (level)
	{
	case Logger::Debug:
		return "DEBUG: ";
	case Logger::Info:
		return "INFO: ";
	case Logger::Warning:
		return "WARNING: ";
	case Logger::Error:
		return "ERROR: ";
	default:
		return "";
	}
}

void ConsoleLogger::write(Level messageLevel, const std::string& message)
{
	std::ostream& out = messageLevel >= Warning ? std::cerr : std::clog;
	out << levelPrefix(messageLevel) << message << std::endl;
}

void StreamLogger::write(Level messageLevel, const std::string& message)
{
	_out << levelPrefix(messageLevel) << message << std::endl;
}
} // IO
} // CanopyTools
