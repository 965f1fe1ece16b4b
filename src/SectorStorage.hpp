#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace ChunkVault
{

// Random access file with positional reads and writes.
// Positional calls don't share file position, so concurrent reads are safe.
// All methods throw RegionIOError on failure.
class SectorStorage final
{
public:
	// Opens file for reading and writing, creates it if it doesn't exist.
	explicit SectorStorage(const std::filesystem::path& path);
	~SectorStorage();

	SectorStorage(const SectorStorage&)= delete;
	SectorStorage& operator=(const SectorStorage&)= delete;

	// Returns number of bytes read, it's less than "size" only at end of file.
	size_t ReadAt(uint64_t position, void* dst, size_t size) const;
	void WriteAt(uint64_t position, const void* src, size_t size);

	uint64_t GetSize() const;
	void Resize(uint64_t size);

	// Waits until written data reaches the disk.
	void Sync();

	const std::filesystem::path& GetPath() const { return path_; }

private:
	const std::filesystem::path path_;
	int fd_= -1;
};

} // namespace ChunkVault
