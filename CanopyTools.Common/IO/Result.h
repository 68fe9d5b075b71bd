#pragma once

#include <string>

#include <boost/filesystem.hpp>
#include <gdal_priv.h>

namespace fs = boost::filesystem;

namespace CanopyTools
{
namespace IO
{
/// <summary>
/// Represents a result object owning a GDAL dataset.
/// </summary>
struct Result
{
protected:
	/// <summary>
	/// File path.
	/// </summary>
	/// <remarks>
	/// Empty for GDAL memory objects.
	/// </remarks>
	fs::path _path;

public:
	/// <summary>
	/// Dataset.
	/// </summary>
	GDALDataset* dataset;

protected:
	/// <summary>
	/// Initializes a new instance of the struct.
	/// </summary>
	/// <param name="path">The path.</param>
	/// <param name="dataset">The dataset.</param>
	explicit Result(const fs::path& path, GDALDataset* dataset = nullptr)
		: _path(path), dataset(dataset)
	{ }

public:
	virtual ~Result();
	Result(const Result&) = delete;
	Result& operator=(const Result&) = delete;

	Result(Result&& other) noexcept;
	Result& operator=(Result&& other) noexcept;

	/// <summary>
	/// Gets the path.
	/// </summary>
	std::string path() const { return _path.string(); }

	/// <summary>
	/// Closes the dataset if it is open.
	/// </summary>
	void close();
};

/// <summary>
/// Represents a temporary file result, removed from the disk on destruction.
/// </summary>
struct TemporaryFileResult : Result
{
	/// <summary>
	/// Initializes a new instance of the struct.
	/// </summary>
	/// <param name="path">The path.</param>
	/// <param name="dataset">The dataset.</param>
	explicit TemporaryFileResult(const fs::path& path, GDALDataset* dataset = nullptr)
		: Result(path, dataset)
	{ }

	/// <summary>
	/// Initializes a new instance of the struct with a unique path in the temporary directory.
	/// </summary>
	/// <param name="prefix">The file name prefix.</param>
	/// <param name="extension">The file extension with the leading dot.</param>
	static TemporaryFileResult unique(const std::string& prefix, const std::string& extension);

	~TemporaryFileResult();
	TemporaryFileResult(const TemporaryFileResult&) = delete;
	TemporaryFileResult& operator=(const TemporaryFileResult&) = delete;

	TemporaryFileResult(TemporaryFileResult&& other) noexcept
		: Result(std::move(other))
	{ }

	TemporaryFileResult& operator=(TemporaryFileResult&& other) noexcept
	{
		Result::operator=(std::move(other));
		return *this;
	}

	/// <summary>
	/// Closes the dataset and removes the file from the disk.
	/// </summary>
	/// <remarks>
	/// Unlike the destructor, reports failure by throwing <c>fs::filesystem_error</c>.
	/// </remarks>
	void remove();
};
} // IO
} // CanopyTools
