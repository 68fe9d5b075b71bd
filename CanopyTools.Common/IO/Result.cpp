#include "Result.h"

namespace CanopyTools
{
namespace IO
{
#pragma region Result

Result::~Result()
{
	close();
}

Result::Result(Result&& other) noexcept
	: _path(std::move(other._path)), dataset(other.dataset)
{
	other._path.clear();
	other.dataset = nullptr;
}

Result& Result::operator=(Result&& other) noexcept
{
	if (this == &other)
		return *this;

	close();
	_path = std::move(other._path);
	dataset = other.dataset;

	other._path.clear();
	other.dataset = nullptr;
	return *this;
}

void Result::close()
{
	if (dataset != nullptr)
	{
		GDALClose(GDALDataset::ToHandle(dataset));
		dataset = nullptr;
	}
}

#pragma endregion

#pragma region TemporaryFileResult

TemporaryFileResult TemporaryFileResult::unique(const std::string& prefix, const std::string& extension)
{
	fs::path name = fs::unique_path(prefix + "%%%%-%%%%-%%%%-%%%%" + extension);
	return TemporaryFileResult(fs::temp_directory_path() / name);
}

TemporaryFileResult::~TemporaryFileResult()
{
	if (!_path.empty())
	{
		// necessary, because parent dtor will be called after this
		close();
		boost::system::error_code error;
		fs::remove(_path, error);
	}
}

void TemporaryFileResult::remove()
{
	close();
	if (!_path.empty())
	{
		fs::remove(_path);
		_path.clear();
	}
}

#pragma endregion
} // IO
} // CanopyTools
