#include "Operation.h"

namespace CanopyTools
{
void Operation::prepare(bool force)
{
	if (_isPrepared && !force)
		return;

	_isPrepared = _isExecuted = false;
	onPrepare();
	_isPrepared = true;
}

void Operation::execute(bool force)
{
	prepare(force);
	if (_isExecuted && !force)
		return;

	_isExecuted = false;
	onExecute();
	_isExecuted = true;
	reportProgress(1.f, std::string());
}

void Operation::reportProgress(float complete, const std::string& message) const
{
	// The return value of the callback is advisory, operations are not cancellable.
	if (progress)
		progress(complete, message);
}
} // CanopyTools
