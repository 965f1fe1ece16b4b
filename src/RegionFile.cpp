#include "RegionFile.hpp"
#include "Assert.hpp"
#include "Log.hpp"
#include "RegionErrors.hpp"
#include <chrono>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ChunkVault
{

namespace
{

// Returns file size in sectors. Writes empty header into new (or empty) file.
uint32_t PrepareRegionFile(SectorStorage& storage)
{
	const uint64_t file_size= storage.GetSize();
	if(file_size == 0)
	{
		const ByteBuffer empty_header(c_header_size, 0);
		storage.WriteAt(0, empty_header.data(), empty_header.size());
		storage.Sync();
		Log::Info("Created region file \"", storage.GetPath().string(), "\"");
		return c_header_sector_count;
	}

	if(file_size < c_header_size)
		throw RegionFormatError(
			"Region file \"" + storage.GetPath().string() + "\" is too short: " +
			std::to_string(file_size) + " bytes, header requires " + std::to_string(c_header_size));

	if(file_size % c_sector_size != 0)
		throw RegionFormatError(
			"Region file \"" + storage.GetPath().string() + "\" size " + std::to_string(file_size) +
			" is not multiple of sector size " + std::to_string(c_sector_size));

	const uint64_t sector_count= file_size / c_sector_size;
	// Chunks can't start after maximum index, so larger files are never produced by us.
	if(sector_count > uint64_t(c_max_sector_index) + c_max_extent_sector_count)
		throw RegionFormatError(
			"Region file \"" + storage.GetPath().string() + "\" is too large: " + std::to_string(sector_count) + " sectors");

	return uint32_t(sector_count);
}

int32_t GetCurrentTimestamp()
{
	const auto since_epoch= std::chrono::system_clock::now().time_since_epoch();
	return int32_t(std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

std::string DescribeChunk(const RegionCoord region_coord, const LocalIndex local_index)
{
	std::ostringstream stream;
	stream << GetChunkCoordForLocalIndex(region_coord, local_index);
	return stream.str();
}

} // namespace

PresentChunksRange::Iterator::Iterator(const PresentChunksRange& range, const LocalIndex local_index)
	: range_(&range), local_index_(local_index)
{
	SkipAbsentChunks();
}

ChunkCoord PresentChunksRange::Iterator::operator*() const
{
	CV_ASSERT(local_index_ < c_region_area);
	return GetChunkCoordForLocalIndex(range_->region_coord_, local_index_);
}

PresentChunksRange::Iterator& PresentChunksRange::Iterator::operator++()
{
	++local_index_;
	SkipAbsentChunks();
	return *this;
}

PresentChunksRange::Iterator PresentChunksRange::Iterator::operator++(int)
{
	Iterator prev= *this;
	++*this;
	return prev;
}

bool PresentChunksRange::Iterator::operator==(const Iterator& other) const
{
	return range_ == other.range_ && local_index_ == other.local_index_;
}

bool PresentChunksRange::Iterator::operator!=(const Iterator& other) const
{
	return !(*this == other);
}

void PresentChunksRange::Iterator::SkipAbsentChunks()
{
	while(local_index_ < c_region_area && range_->offsets_[local_index_] == 0)
		++local_index_;
}

PresentChunksRange::PresentChunksRange(const RegionCoord region_coord, const OffsetsTable& offsets)
	: region_coord_(region_coord), offsets_(offsets)
{
}

PresentChunksRange::Iterator PresentChunksRange::begin() const
{
	return Iterator(*this, 0);
}

PresentChunksRange::Iterator PresentChunksRange::end() const
{
	return Iterator(*this, c_region_area);
}

RegionFile::RegionFile(const std::filesystem::path& path, const RegionCoord region_coord, const bool sync_writes)
	: region_coord_(region_coord)
	, sync_writes_(sync_writes)
	, storage_(path)
	, allocator_(storage_, PrepareRegionFile(storage_))
{
	ReadHeader();
	Log::Info("Opened region file \"", path.string(), "\" with ", CountChunks(), " chunks");
}

RegionFile::~RegionFile()
{
	try
	{
		Flush();
	}
	catch(const RegionFileError& ex)
	{
		Log::Warning("Failed to flush region file \"", GetPath().string(), "\": ", ex.what());
	}
}

std::optional<ByteBuffer> RegionFile::Load(const ChunkCoord chunk_coord) const
{
	const LocalIndex local_index= GetLocalIndex(chunk_coord);

	const std::shared_lock<std::shared_mutex> lock(mutex_);

	const std::optional<SectorExtent> extent= FindExtentImpl(local_index);
	if(extent == std::nullopt)
		return std::nullopt;

	const size_t extent_size= size_t(extent->sector_count) * c_sector_size;
	ByteBuffer data(extent_size);
	const size_t read= storage_.ReadAt(uint64_t(extent->first_sector) * c_sector_size, data.data(), data.size());

	if(read < c_chunk_record_header_size)
		throw RegionCorruptionError("Chunk " + DescribeChunk(region_coord_, local_index) + " has truncated header, extent is past end of file");

	const uint32_t length= RegionFileLayout::ReadBigEndian32(data.data());
	if(length == 0)
		throw RegionCorruptionError("Chunk " + DescribeChunk(region_coord_, local_index) + " is allocated but has no data");
	if((length & 0x80000000u) != 0)
		throw RegionCorruptionError("Chunk " + DescribeChunk(region_coord_, local_index) + " has negative length");

	// Trust record length, not extent size - tail of extent may contain anything.
	const uint64_t record_end= uint64_t(c_chunk_record_length_size) + length;
	if(record_end > extent_size)
		throw RegionCorruptionError(
			"Chunk " + DescribeChunk(region_coord_, local_index) + " length " + std::to_string(length) +
			" exceeds its extent of " + std::to_string(extent->sector_count) + " sectors");
	if(record_end > read)
		throw RegionCorruptionError(
			"Chunk " + DescribeChunk(region_coord_, local_index) + " length " + std::to_string(length) +
			" goes past end of file");

	return DecompressChunkData(data.data() + c_chunk_record_length_size, length);
}

void RegionFile::Save(const ChunkCoord chunk_coord, const ByteBuffer& payload, const Compression compression)
{
	const LocalIndex local_index= GetLocalIndex(chunk_coord);

	// Compress before taking the lock.
	const ByteBuffer compressed= CompressChunkData(payload, compression);

	ByteBuffer record(c_chunk_record_length_size);
	RegionFileLayout::WriteBigEndian32(uint32_t(compressed.size()), record.data());
	record.insert(record.end(), compressed.begin(), compressed.end());

	const std::unique_lock<std::shared_mutex> lock(mutex_);

	const std::optional<SectorExtent> old_extent= FindExtentImpl(local_index);
	const SectorExtent new_extent= allocator_.Place(record, old_extent, sync_writes_);
	const bool relocated= old_extent != std::nullopt && *old_extent != new_extent;

	const uint32_t offset_entry= RegionFileLayout::PackOffsetEntry(new_extent);
	const int32_t timestamp= GetCurrentTimestamp();
	try
	{
		WriteHeaderEntry(local_index, offset_entry, timestamp);
	}
	catch(...)
	{
		// Offset word wasn't written, header still references old extent, new one isn't used by anyone.
		if(old_extent == std::nullopt || relocated)
			allocator_.Free(new_extent);
		throw;
	}

	// Offset word is written - from now on in-memory state must match it, even if sync fails.
	offsets_[local_index]= offset_entry;
	timestamps_[local_index]= timestamp;

	// Old extent may be reused only after header no longer references it.
	if(relocated)
		allocator_.Free(*old_extent);

	if(sync_writes_)
		storage_.Sync();
}

void RegionFile::Delete(const ChunkCoord chunk_coord)
{
	const LocalIndex local_index= GetLocalIndex(chunk_coord);

	const std::unique_lock<std::shared_mutex> lock(mutex_);

	const std::optional<SectorExtent> extent= FindExtentImpl(local_index);
	if(extent == std::nullopt)
		return;

	WriteHeaderEntry(local_index, 0, 0);
	offsets_[local_index]= 0;
	timestamps_[local_index]= 0;

	// Sectors aren't erased, they just become available for other chunks.
	allocator_.Free(*extent);

	if(sync_writes_)
		storage_.Sync();
}

bool RegionFile::HasChunk(const ChunkCoord chunk_coord) const
{
	const LocalIndex local_index= GetLocalIndex(chunk_coord);

	const std::shared_lock<std::shared_mutex> lock(mutex_);
	return offsets_[local_index] != 0;
}

std::optional<int32_t> RegionFile::GetChunkTimestamp(const ChunkCoord chunk_coord) const
{
	const LocalIndex local_index= GetLocalIndex(chunk_coord);

	const std::shared_lock<std::shared_mutex> lock(mutex_);
	if(offsets_[local_index] == 0)
		return std::nullopt;
	return timestamps_[local_index];
}

uint32_t RegionFile::CountChunks() const
{
	const std::shared_lock<std::shared_mutex> lock(mutex_);

	uint32_t result= 0;
	for(const uint32_t offset_entry : offsets_)
		if(offset_entry != 0)
			++result;
	return result;
}

PresentChunksRange RegionFile::GetPresentChunks() const
{
	const std::shared_lock<std::shared_mutex> lock(mutex_);
	return PresentChunksRange(region_coord_, offsets_);
}

std::optional<SectorExtent> RegionFile::FindExtent(const LocalIndex local_index) const
{
	if(local_index >= c_region_area)
		throw std::out_of_range("Local index " + std::to_string(local_index) + " is out of range");

	const std::shared_lock<std::shared_mutex> lock(mutex_);
	return FindExtentImpl(local_index);
}

void RegionFile::Flush()
{
	const std::unique_lock<std::shared_mutex> lock(mutex_);
	storage_.Sync();
}

uint32_t RegionFile::GetFileSectorCount() const
{
	const std::shared_lock<std::shared_mutex> lock(mutex_);
	return allocator_.GetFileSectorCount();
}

std::vector<SectorExtent> RegionFile::GetFreeExtents() const
{
	const std::shared_lock<std::shared_mutex> lock(mutex_);
	return allocator_.GetFreeExtents();
}

LocalIndex RegionFile::GetLocalIndex(const ChunkCoord chunk_coord) const
{
	if(GetRegionCoordForChunk(chunk_coord) != region_coord_)
	{
		std::ostringstream stream;
		stream << chunk_coord << " doesn't belong to " << region_coord_;
		throw std::invalid_argument(stream.str());
	}

	return GetLocalIndexForChunk(chunk_coord);
}

std::optional<SectorExtent> RegionFile::FindExtentImpl(const LocalIndex local_index) const
{
	CV_ASSERT(local_index < c_region_area);
	const uint32_t offset_entry= offsets_[local_index];
	if(offset_entry == 0)
		return std::nullopt;
	return RegionFileLayout::UnpackOffsetEntry(offset_entry);
}

void RegionFile::ReadHeader()
{
	ByteBuffer header(c_header_size);
	if(storage_.ReadAt(0, header.data(), header.size()) != header.size())
		throw RegionFormatError("Can't read header of region file \"" + GetPath().string() + "\"");

	for(LocalIndex i= 0; i < c_region_area; ++i)
	{
		offsets_[i]= RegionFileLayout::ReadBigEndian32(header.data() + RegionFileLayout::c_offsets_table_position + i * sizeof(uint32_t));
		timestamps_[i]= int32_t(RegionFileLayout::ReadBigEndian32(header.data() + RegionFileLayout::c_timestamps_table_position + i * sizeof(int32_t)));
	}

	// Mark sectors of valid chunks as used, forget invalid chunks.
	for(LocalIndex i= 0; i < c_region_area; ++i)
	{
		if(offsets_[i] == 0)
			continue;

		const SectorExtent extent= RegionFileLayout::UnpackOffsetEntry(offsets_[i]);

		const char* problem= nullptr;
		if(extent.first_sector < c_header_sector_count)
			problem= "overlaps header";
		else if(extent.sector_count == 0)
			problem= "has zero sectors";
		else if(extent.End() > allocator_.GetFileSectorCount())
			problem= "goes past end of file";
		else if(!allocator_.Claim(extent))
			problem= "overlaps another chunk";

		if(problem != nullptr)
		{
			Log::Warning(
				"Region file \"", GetPath().string(), "\" has invalid offset entry for ", DescribeChunk(region_coord_, i),
				": sectors [", extent.first_sector, "; ", extent.End(), ") ", problem, ", ignoring it");
			offsets_[i]= 0;
			timestamps_[i]= 0;
		}
	}
}

void RegionFile::WriteHeaderEntry(const LocalIndex local_index, const uint32_t offset_entry, const int32_t timestamp)
{
	uint8_t bytes[4];

	// Offset entry is written last - it makes the change visible.
	RegionFileLayout::WriteBigEndian32(uint32_t(timestamp), bytes);
	storage_.WriteAt(RegionFileLayout::c_timestamps_table_position + local_index * sizeof(int32_t), bytes, sizeof(bytes));

	RegionFileLayout::WriteBigEndian32(offset_entry, bytes);
	storage_.WriteAt(RegionFileLayout::c_offsets_table_position + local_index * sizeof(uint32_t), bytes, sizeof(bytes));
}

} // namespace ChunkVault
