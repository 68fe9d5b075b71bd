#include <cstring>

#include "Reporter.h"
#include "IO.h"

namespace CanopyTools
{
namespace IO
{
#pragma region TextReporter

void TextReporter::report(float complete, const std::string &message)
{
	eraseLine(_eraseSize, _out);
	_eraseSize = std::strlen("Progress: 100.00% ()") + message.length();
	reportProgress(complete, message, _out);
}

void TextReporter::reset()
{
	eraseLine(_eraseSize, _out);
	_eraseSize = 0;
}

#pragma endregion

#pragma region BarReporter

BarReporter::~BarReporter()
{
	delete _progress;
}

void BarReporter::report(float complete, const std::string &)
{
	report(static_cast<unsigned int>(_size * complete));
}

void BarReporter::report(unsigned int complete)
{
	if (!_progress) _progress = new boost::progress_display(_size, _out);
	if (complete > _progress->count())
		*_progress += (complete - _progress->count());
}

void BarReporter::reset()
{
	if (_progress)
		_progress->restart(_size);
}

#pragma endregion
} // IO
} // CanopyTools
