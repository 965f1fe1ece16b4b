#include "SectorAllocator.hpp"
#include "Assert.hpp"
#include "Log.hpp"
#include "Math.hpp"
#include "RegionErrors.hpp"
#include <algorithm>
#include <string>

namespace ChunkVault
{

SectorAllocator::SectorAllocator(SectorStorage& storage, const uint32_t file_sector_count)
	: storage_(storage)
	, file_sector_count_(file_sector_count)
{
	CV_ASSERT(file_sector_count_ >= c_header_sector_count);
	if(file_sector_count_ > c_header_sector_count)
		AddFreeExtent({c_header_sector_count, file_sector_count_ - c_header_sector_count});
}

bool SectorAllocator::Claim(const SectorExtent& extent)
{
	if(extent.first_sector < c_header_sector_count || extent.sector_count == 0 || extent.End() > file_sector_count_)
		return false;

	// Find free extent starting at or before given extent.
	auto it= free_extents_.upper_bound(extent.first_sector);
	if(it == free_extents_.begin())
		return false;
	--it;

	const SectorExtent free_extent{it->first, it->second};
	if(free_extent.End() < extent.End())
		return false; // Some of sectors are already occupied.

	EraseFreeExtent(free_extent);
	if(free_extent.first_sector < extent.first_sector)
		AddFreeExtent({free_extent.first_sector, extent.first_sector - free_extent.first_sector});
	if(extent.End() < free_extent.End())
		AddFreeExtent({extent.End(), free_extent.End() - extent.End()});

	return true;
}

SectorExtent SectorAllocator::Place(const ByteBuffer& record, const std::optional<SectorExtent> old_extent, const bool sync)
{
	const uint64_t sectors_needed= GetSectorsNeeded(record.size());
	if(sectors_needed > c_max_extent_sector_count)
		throw RegionFormatError(
			"Chunk record is too large: requires " + std::to_string(sectors_needed) +
			" sectors, limit is " + std::to_string(c_max_extent_sector_count));

	if(old_extent != std::nullopt && old_extent->sector_count >= sectors_needed)
	{
		// Fits in place, keep whole extent and leave zeroed tail.
		WriteRecord(*old_extent, record, sync);
		return *old_extent;
	}

	bool appended= false;
	const SectorExtent extent= Allocate(uint32_t(sectors_needed), appended);
	try
	{
		WriteRecord(extent, record, sync);
	}
	catch(...)
	{
		RollbackAllocation(extent, appended);
		throw;
	}

	return extent;
}

void SectorAllocator::Free(const SectorExtent& extent)
{
	CV_ASSERT(extent.first_sector >= c_header_sector_count);
	CV_ASSERT(extent.End() <= file_sector_count_);
	if(extent.sector_count == 0)
		return;

	SectorExtent merged= extent;

	// Merge with next free extent.
	const auto next_it= free_extents_.find(extent.End());
	if(next_it != free_extents_.end())
	{
		const SectorExtent next{next_it->first, next_it->second};
		EraseFreeExtent(next);
		merged.sector_count+= next.sector_count;
	}

	// Merge with previous free extent.
	auto prev_it= free_extents_.lower_bound(extent.first_sector);
	if(prev_it != free_extents_.begin())
	{
		--prev_it;
		CV_ASSERT(prev_it->first + prev_it->second <= extent.first_sector);
		if(prev_it->first + prev_it->second == extent.first_sector)
		{
			const SectorExtent prev{prev_it->first, prev_it->second};
			EraseFreeExtent(prev);
			merged.first_sector= prev.first_sector;
			merged.sector_count+= prev.sector_count;
		}
	}

	AddFreeExtent(merged);
}

uint32_t SectorAllocator::GetFreeSectorCount() const
{
	uint32_t result= 0;
	for(const auto& free_extent : free_extents_)
		result+= free_extent.second;
	return result;
}

std::vector<SectorExtent> SectorAllocator::GetFreeExtents() const
{
	std::vector<SectorExtent> result;
	result.reserve(free_extents_.size());
	for(const auto& free_extent : free_extents_)
		result.push_back({free_extent.first, free_extent.second});
	return result;
}

uint64_t SectorAllocator::GetSectorsNeeded(const size_t record_size)
{
	return CeilDiv(uint64_t(record_size), c_sector_size);
}

void SectorAllocator::AddFreeExtent(const SectorExtent& extent)
{
	CV_ASSERT(extent.sector_count > 0);
	free_extents_.emplace(extent.first_sector, extent.sector_count);
	free_extents_by_size_.emplace(extent.sector_count, extent.first_sector);
}

void SectorAllocator::EraseFreeExtent(const SectorExtent& extent)
{
	free_extents_.erase(extent.first_sector);
	free_extents_by_size_.erase({extent.sector_count, extent.first_sector});
}

SectorExtent SectorAllocator::Allocate(const uint32_t sector_count, bool& out_appended)
{
	// Best fit - smallest free extent which is large enough, lowest position among equal ones.
	const auto it= free_extents_by_size_.lower_bound({sector_count, 0});
	if(it != free_extents_by_size_.end())
	{
		const SectorExtent free_extent{it->second, it->first};
		EraseFreeExtent(free_extent);
		if(free_extent.sector_count > sector_count)
			AddFreeExtent({free_extent.first_sector + sector_count, free_extent.sector_count - sector_count});

		out_appended= false;
		return {free_extent.first_sector, sector_count};
	}

	if(file_sector_count_ > c_max_sector_index)
		throw RegionFormatError(
			"Region file \"" + storage_.GetPath().string() + "\" is full: sector index " +
			std::to_string(file_sector_count_) + " can't be stored in offsets table");

	const SectorExtent extent{file_sector_count_, sector_count};
	file_sector_count_+= sector_count;
	out_appended= true;
	return extent;
}

void SectorAllocator::RollbackAllocation(const SectorExtent& extent, const bool appended)
{
	if(!appended)
	{
		Free(extent);
		return;
	}

	CV_ASSERT(extent.End() == file_sector_count_);
	file_sector_count_= extent.first_sector;

	// Drop partially written tail, otherwise file size is not multiple of sector size.
	try
	{
		storage_.Resize(uint64_t(file_sector_count_) * c_sector_size);
	}
	catch(const RegionIOError& ex)
	{
		Log::Warning("Can't truncate region file after failed write: ", ex.what());
	}
}

void SectorAllocator::WriteRecord(const SectorExtent& extent, const ByteBuffer& record, const bool sync)
{
	CV_ASSERT(record.size() <= size_t(extent.sector_count) * c_sector_size);

	ByteBuffer sectors_data(size_t(extent.sector_count) * c_sector_size, 0);
	std::copy(record.begin(), record.end(), sectors_data.begin());

	storage_.WriteAt(uint64_t(extent.first_sector) * c_sector_size, sectors_data.data(), sectors_data.size());
	if(sync)
		storage_.Sync();
}

} // namespace ChunkVault
