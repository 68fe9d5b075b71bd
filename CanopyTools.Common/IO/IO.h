#pragma once

#include <string>
#include <iosfwd>

namespace CanopyTools
{
namespace IO
{
#pragma region Types

enum ExitCodes
{
	// Success
	Success = 0,
	NoResult = -2,

	// Errors
	InvalidInput = 1,
	UnexpectedError = 2,
};

#pragma endregion

#pragma region Output operations

/// <summary>
/// Displays the progress of a computation.
/// </summary>
/// <param name="complete">The ratio of completeness of the process from 0.0 for just started to 1.0 for completed.</param>
/// <param name="message">The message to display, may be empty.</param>
/// <param name="out">The output stream, the standard output is kept for the result document.</param>
void reportProgress(float complete, const std::string &message, std::ostream& out);

/// <summary>
/// Erases the current line on console.
/// </summary>
/// <param name="size">The number of characters to erase.</param>
/// <param name="out">The output stream.</param>
void eraseLine(std::size_t size, std::ostream& out);

#pragma endregion
} // IO
} // CanopyTools
