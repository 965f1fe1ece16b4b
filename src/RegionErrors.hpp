#pragma once
#include <stdexcept>
#include <string>

namespace ChunkVault
{

// Base for all failures of region file operations.
// Absence of a chunk is not an error, it's reported via empty std::optional.
class RegionFileError : public std::runtime_error
{
public:
	using std::runtime_error::runtime_error;
};

// Invalid compression tag, bad file length, limits of the format exceeded.
class RegionFormatError : public RegionFileError
{
public:
	using RegionFileError::RegionFileError;
};

// Chunk record inconsistent with its extent or with the file size.
class RegionCorruptionError : public RegionFileError
{
public:
	using RegionFileError::RegionFileError;
};

// Failure of underlying read/write/sync call.
class RegionIOError : public RegionFileError
{
public:
	RegionIOError(const std::string& message, int error_code);

	int GetErrorCode() const { return error_code_; }

private:
	const int error_code_;
};

} // namespace ChunkVault
