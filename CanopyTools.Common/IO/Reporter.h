#pragma once

#include <string>
#include <iostream>

#include <boost/progress.hpp>

namespace CanopyTools
{
namespace IO
{
/// <summary>
/// Represents an abstract progress reporter.
/// </summary>
class Reporter
{
public:
	virtual ~Reporter() {}

	/// <summary>
	/// Displays the progress of a run.
	/// </summary>
	/// <param name="complete">The ratio of processed inputs from 0.0 for just started to 1.0 for completed.</param>
	/// <param name="message">An optional message string to display (e.g. the current file).</param>
	virtual void report(float complete, const std::string &message = std::string()) = 0;

	/// <summary>
	/// Resets the progress.
	/// </summary>
	virtual void reset() = 0;
};

/// <summary>
/// Represents a textual percentage reporter that also shows the message.
/// </summary>
class TextReporter : public Reporter
{
	std::ostream& _out;
	std::size_t _eraseSize = 0;

public:
	explicit TextReporter(std::ostream& out = std::cerr)
		: _out(out) { }

	void report(float complete, const std::string &message = std::string()) override;
	void reset() override;
};

/// <summary>
/// Represents an ASCII progress bar reporter.
/// </summary>
/// <remarks>
/// The message is not displayed.
/// </remarks>
class BarReporter : public Reporter
{
	std::ostream& _out;
	boost::progress_display* _progress;
	unsigned int _size;

public:
	explicit BarReporter(unsigned int size = 100, std::ostream& out = std::cerr)
		: _out(out), _progress(nullptr), _size(size) { }
	~BarReporter();

	BarReporter(const BarReporter&) = delete;
	BarReporter& operator=(const BarReporter&) = delete;

	void report(float complete, const std::string &message = std::string()) override;

	/// <summary>
	/// Displays the progress of a run.
	/// </summary>
	/// <param name="complete">The number of completed steps out of the size given in the constructor.</param>
	void report(unsigned int complete);

	void reset() override;
};

/// <summary>
/// Represents a mute progress reporter which outputs nothing.
/// </summary>
class NullReporter : public Reporter
{
public:
	void report(float, const std::string & = std::string()) override { }
	void reset() override { }
};
} // IO
} // CanopyTools
