#pragma once

#include <string>
#include <functional>

namespace CanopyTools
{
/// <summary>
/// Represents a unit of work with separate validation and execution phases.
/// </summary>
/// <remarks>
/// Results of an operation are exposed through accessors which throw
/// <c>std::logic_error</c> until the operation has been executed.
/// </remarks>
class Operation
{
public:
	typedef std::function<bool(float, const std::string&)> ProgressType;

	/// <summary>
	/// Callback function for reporting progress.
	/// </summary>
	ProgressType progress;

private:
	bool _isPrepared = false;
	bool _isExecuted = false;

public:
	virtual ~Operation() { }

	bool isPrepared() const { return _isPrepared; }

	bool isExecuted() const { return _isExecuted; }

	/// <summary>
	/// Validates the operation unless already done.
	/// </summary>
	/// <param name="force">Validates again and discards the previous execution.</param>
	void prepare(bool force = false);

	/// <summary>
	/// Prepares and executes the operation unless already done.
	/// </summary>
	/// <param name="force">Executes again even if already executed.</param>
	/// <remarks>
	/// On failure the operation is left unexecuted, the exception propagates.
	/// </remarks>
	void execute(bool force = false);

protected:
	/// <summary>
	/// Forwards the progress to the callback, if any.
	/// </summary>
	/// <param name="complete">The ratio of completeness from 0.0 to 1.0.</param>
	/// <param name="message">The current task.</param>
	void reportProgress(float complete, const std::string& message) const;

	/// <summary>
	/// Verifies the input and the configuration.
	/// </summary>
	virtual void onPrepare() = 0;

	/// <summary>
	/// Produces the results.
	/// </summary>
	virtual void onExecute() = 0;
};
} // CanopyTools
