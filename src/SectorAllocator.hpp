#pragma once
#include "ChunkDataCompressor.hpp"
#include "RegionFileFormat.hpp"
#include "SectorStorage.hpp"
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace ChunkVault
{

// Tracks free and occupied sectors of one region file and writes chunk records into them.
// State is not persisted, it's rebuilt from offsets table and file size each time file is opened.
// Not thread-safe, owner must serialize calls.
class SectorAllocator final
{
public:
	// Initially all sectors after header are free, use "Claim" to mark sectors of existing chunks.
	SectorAllocator(SectorStorage& storage, uint32_t file_sector_count);

	SectorAllocator(const SectorAllocator&)= delete;
	SectorAllocator& operator=(const SectorAllocator&)= delete;

	// Marks extent of existing chunk as occupied.
	// Returns false (and changes nothing) if extent intersects header,
	// some already occupied extent or goes beyond file end.
	bool Claim(const SectorExtent& extent);

	// Writes given record (with length prefix) to disk and returns extent where it was written.
	// Reuses old extent if it's large enough, zeroing its tail, otherwise takes best fitting free extent
	// or appends new sectors at file end.
	// Relocated old extent is NOT freed here - caller should free it after updating the header.
	// On failure allocator state is left unchanged.
	SectorExtent Place(const ByteBuffer& record, std::optional<SectorExtent> old_extent, bool sync);

	void Free(const SectorExtent& extent);

	uint32_t GetFileSectorCount() const { return file_sector_count_; }
	uint32_t GetFreeSectorCount() const;
	// Sorted by position.
	std::vector<SectorExtent> GetFreeExtents() const;

	static uint64_t GetSectorsNeeded(size_t record_size);

private:
	void AddFreeExtent(const SectorExtent& extent);
	void EraseFreeExtent(const SectorExtent& extent);

	// Returns extent of exactly "sector_count" sectors.
	SectorExtent Allocate(uint32_t sector_count, bool& out_appended);
	void RollbackAllocation(const SectorExtent& extent, bool appended);

	void WriteRecord(const SectorExtent& extent, const ByteBuffer& record, bool sync);

private:
	SectorStorage& storage_;
	uint32_t file_sector_count_= 0;

	// Free extents, first sector -> sectors count. Adjacent extents are always merged.
	std::map<uint32_t, uint32_t> free_extents_;
	// Same extents ordered by (count, first sector) for best fit search.
	std::set<std::pair<uint32_t, uint32_t>> free_extents_by_size_;
};

} // namespace ChunkVault
