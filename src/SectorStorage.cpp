#include "SectorStorage.hpp"
#include "Log.hpp"
#include "RegionErrors.hpp"
#include <cerrno>
#include <string>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ChunkVault
{

namespace
{

[[noreturn]] void ThrowIOError(const char* const operation, const std::filesystem::path& path)
{
	const int error_code= errno;
	throw RegionIOError(std::string(operation) + " \"" + path.string() + "\" failed", error_code);
}

} // namespace

SectorStorage::SectorStorage(const std::filesystem::path& path)
	: path_(path)
{
	do
	{
		fd_= ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
	} while(fd_ == -1 && errno == EINTR);

	if(fd_ == -1)
		ThrowIOError("Opening", path_);
}

SectorStorage::~SectorStorage()
{
	if(::close(fd_) != 0)
		Log::Warning("Failed to close file \"", path_.string(), "\"");
}

size_t SectorStorage::ReadAt(const uint64_t position, void* const dst, const size_t size) const
{
	size_t total_read= 0;
	while(total_read < size)
	{
		const ssize_t res= ::pread(fd_, static_cast<char*>(dst) + total_read, size - total_read, off_t(position + total_read));
		if(res < 0)
		{
			if(errno == EINTR)
				continue;
			ThrowIOError("Reading", path_);
		}
		if(res == 0)
			break; // End of file.

		total_read+= size_t(res);
	}

	return total_read;
}

void SectorStorage::WriteAt(const uint64_t position, const void* const src, const size_t size)
{
	size_t total_written= 0;
	while(total_written < size)
	{
		const ssize_t res= ::pwrite(fd_, static_cast<const char*>(src) + total_written, size - total_written, off_t(position + total_written));
		if(res < 0)
		{
			if(errno == EINTR)
				continue;
			ThrowIOError("Writing", path_);
		}
		if(res == 0)
			throw RegionIOError("Writing \"" + path_.string() + "\" made no progress", 0);

		total_written+= size_t(res);
	}
}

uint64_t SectorStorage::GetSize() const
{
	struct stat file_stat{};
	if(::fstat(fd_, &file_stat) != 0)
		ThrowIOError("Getting size of", path_);

	return uint64_t(file_stat.st_size);
}

void SectorStorage::Resize(const uint64_t size)
{
	int res= 0;
	do
	{
		res= ::ftruncate(fd_, off_t(size));
	} while(res != 0 && errno == EINTR);

	if(res != 0)
		ThrowIOError("Resizing", path_);
}

void SectorStorage::Sync()
{
	int res= 0;
	do
	{
		res= ::fdatasync(fd_);
	} while(res != 0 && errno == EINTR);

	if(res != 0)
		ThrowIOError("Syncing", path_);
}

} // namespace ChunkVault
