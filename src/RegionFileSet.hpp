#pragma once
#include "RegionFile.hpp"
#include "RegionStorageConfig.hpp"
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace ChunkVault
{

// Set of region files inside one directory.
// Opens region files on demand and keeps limited number of them open, closing least recently used.
// All methods are thread-safe.
class RegionFileSet final
{
public:
	using RegionFilePtr= std::shared_ptr<RegionFile>;

public:
	explicit RegionFileSet(RegionStorageConfig config);
	// Closes all regions.
	~RegionFileSet();

	RegionFileSet(const RegionFileSet&)= delete;
	RegionFileSet& operator=(const RegionFileSet&)= delete;

	// Returns open region or opens it, creating file and directories if necessary.
	// Handle stays usable after eviction, region file is closed after last handle is released.
	RegionFilePtr Get(RegionCoord region_coord);

	// Flushes and closes region. Returns false if it wasn't open.
	bool Close(RegionCoord region_coord);
	// Flushes and closes all regions. Rethrows first flush error after closing everything.
	void CloseAll();

	// These methods don't create files for regions without chunks.
	std::optional<ByteBuffer> LoadChunk(ChunkCoord chunk_coord);
	bool HasChunk(ChunkCoord chunk_coord);
	std::optional<int32_t> GetChunkTimestamp(ChunkCoord chunk_coord);
	void DeleteChunk(ChunkCoord chunk_coord);

	// Uses compression from config.
	void SaveChunk(ChunkCoord chunk_coord, const ByteBuffer& payload);
	void SaveChunk(ChunkCoord chunk_coord, const ByteBuffer& payload, Compression compression);

	bool IsOpen(RegionCoord region_coord) const;
	size_t GetOpenRegionCount() const;

	std::filesystem::path GetRegionFilePath(RegionCoord region_coord) const;
	const RegionStorageConfig& GetConfig() const { return config_; }

private:
	struct OpenRegion
	{
		RegionFilePtr file;
		std::list<RegionCoord>::iterator lru_it;
	};

private:
	// Returns nullptr if region isn't open and its file doesn't exist.
	RegionFilePtr GetIfExists(RegionCoord region_coord);

	// Requires locked mutex.
	RegionFilePtr GetImpl(RegionCoord region_coord, bool create);
	void AddOpenRegion(RegionCoord region_coord, RegionFilePtr file);
	void EvictExcessRegions();

private:
	const RegionStorageConfig config_;

	mutable std::mutex mutex_;
	// Front - most recently used.
	std::list<RegionCoord> lru_list_;
	std::unordered_map<RegionCoord, OpenRegion, RegionCoordHasher> open_regions_;
	// Evicted regions, which may be still used by someone.
	// Used to avoid opening second instance of the same file.
	std::unordered_map<RegionCoord, std::weak_ptr<RegionFile>, RegionCoordHasher> evicted_regions_;
};

} // namespace ChunkVault
