#pragma once

#include <string>
#include <iosfwd>

namespace CanopyTools
{
namespace IO
{
/// <summary>
/// Represents an abstract message logger with a severity threshold.
/// </summary>
class Logger
{
public:
	enum Level
	{
		Debug = 0,
		Info = 1,
		Warning = 2,
		Error = 3,
		Off = 4
	};

	/// <summary>
	/// Messages below this level are discarded.
	/// </summary>
	Level level;

	explicit Logger(Level level = Warning)
		: level(level) { }
	virtual ~Logger() {}

	/// <summary>
	/// Determines whether a message of the given level would be written.
	/// </summary>
	bool isEnabled(Level messageLevel) const { return messageLevel >= level && messageLevel != Off; }

	void debug(const std::string& message) { log(Debug, message); }
	void info(const std::string& message) { log(Info, message); }
	void warning(const std::string& message) { log(Warning, message); }
	void error(const std::string& message) { log(Error, message); }

	/// <summary>
	/// Writes the message if its level passes the threshold.
	/// </summary>
	void log(Level messageLevel, const std::string& message)
	{
		if (isEnabled(messageLevel))
			write(messageLevel, message);
	}

protected:
	/// <summary>
	/// Outputs a message which already passed the threshold.
	/// </summary>
	virtual void write(Level messageLevel, const std::string& message) = 0;
};

/// <summary>
/// Represents a console logger.
/// </summary>
/// <remarks>
/// Debug and info messages go to the standard log stream, warnings and errors to the standard error.
/// The standard output is kept for the result document.
/// </remarks>
class ConsoleLogger : public Logger
{
public:
	explicit ConsoleLogger(Level level = Warning)
		: Logger(level) { }

protected:
	void write(Level messageLevel, const std::string& message) override;
};

/// <summary>
/// Represents a logger writing into an arbitrary stream.
/// </summary>
class StreamLogger : public Logger
{
	std::ostream& _out;

public:
	explicit StreamLogger(std::ostream& out, Level level = Debug)
		: Logger(level), _out(out) { }

protected:
	void write(Level messageLevel, const std::string& message) override;
};

/// <summary>
/// Represents a mute logger which outputs nothing.
/// </summary>
class NullLogger : public Logger
{
public:
	NullLogger() : Logger(Off) { }

protected:
	void write(Level, const std::string&) override { }
};

/// <summary>
/// Retrieves the line prefix for a message level, e.g. <c>"WARNING: "</c>.
/// </summary>
const char* levelPrefix(Logger::Level level);
} // IO
} // CanopyTools
