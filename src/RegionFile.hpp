#pragma once
#include "ChunkDataCompressor.hpp"
#include "RegionCoords.hpp"
#include "RegionFileFormat.hpp"
#include "SectorAllocator.hpp"
#include "SectorStorage.hpp"
#include <array>
#include <cstddef>
#include <filesystem>
#include <iterator>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace ChunkVault
{

// Packed offset entries, as they are stored on disk but in host byte order.
using OffsetsTable= std::array<uint32_t, c_region_area>;
using TimestampsTable= std::array<int32_t, c_region_area>;

// Coordinates of chunks present in region at the moment of creation of this object.
// Chunk coordinates are calculated lazily during iteration, iteration may be restarted.
class PresentChunksRange
{
public:
	class Iterator
	{
	public:
		using iterator_category= std::forward_iterator_tag;
		using value_type= ChunkCoord;
		using difference_type= std::ptrdiff_t;
		using pointer= const ChunkCoord*;
		using reference= ChunkCoord;

		Iterator()= default;
		Iterator(const PresentChunksRange& range, LocalIndex local_index);

		ChunkCoord operator*() const;
		Iterator& operator++();
		Iterator operator++(int);

		bool operator==(const Iterator& other) const;
		bool operator!=(const Iterator& other) const;

	private:
		void SkipAbsentChunks();

	private:
		const PresentChunksRange* range_= nullptr;
		LocalIndex local_index_= 0;
	};

public:
	PresentChunksRange(RegionCoord region_coord, const OffsetsTable& offsets);

	Iterator begin() const;
	Iterator end() const;

private:
	const RegionCoord region_coord_;
	const OffsetsTable offsets_;
};

// Storage of chunks of one 32x32 region, backed by single file.
// Load/HasChunk/GetChunkTimestamp/GetPresentChunks may be called concurrently,
// Save/Delete/Flush are exclusive.
class RegionFile final
{
public:
	// Creates file with empty header if it doesn't exist, otherwise reads and validates its header.
	// Throws RegionFormatError if file size is not valid, RegionIOError if file can't be read.
	RegionFile(const std::filesystem::path& path, RegionCoord region_coord, bool sync_writes= true);
	// Flushes the file.
	~RegionFile();

	RegionFile(const RegionFile&)= delete;
	RegionFile& operator=(const RegionFile&)= delete;

	// Returns uncompressed payload or empty optional if there is no such chunk.
	std::optional<ByteBuffer> Load(ChunkCoord chunk_coord) const;

	// Writes chunk data first and after that updates chunk header entry.
	// If data writing fails previous chunk data remains valid.
	void Save(ChunkCoord chunk_coord, const ByteBuffer& payload, Compression compression);

	// Does nothing if there is no such chunk.
	void Delete(ChunkCoord chunk_coord);

	bool HasChunk(ChunkCoord chunk_coord) const;
	// Unix seconds of last write. Empty if there is no such chunk.
	std::optional<int32_t> GetChunkTimestamp(ChunkCoord chunk_coord) const;
	uint32_t CountChunks() const;
	PresentChunksRange GetPresentChunks() const;

	std::optional<SectorExtent> FindExtent(LocalIndex local_index) const;

	// Waits until all written data reaches the disk.
	void Flush();

	RegionCoord GetRegionCoord() const { return region_coord_; }
	const std::filesystem::path& GetPath() const { return storage_.GetPath(); }

	uint32_t GetFileSectorCount() const;
	std::vector<SectorExtent> GetFreeExtents() const;

private:
	// Throws std::invalid_argument if chunk is outside this region.
	LocalIndex GetLocalIndex(ChunkCoord chunk_coord) const;
	std::optional<SectorExtent> FindExtentImpl(LocalIndex local_index) const;

	void ReadHeader();
	// Writes timestamp word and after it offset word. Doesn't sync.
	void WriteHeaderEntry(LocalIndex local_index, uint32_t offset_entry, int32_t timestamp);

private:
	const RegionCoord region_coord_;
	const bool sync_writes_;

	mutable std::shared_mutex mutex_;

	SectorStorage storage_;
	SectorAllocator allocator_;

	OffsetsTable offsets_{};
	TimestampsTable timestamps_{};
};

} // namespace ChunkVault
