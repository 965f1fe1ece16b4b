#pragma once
#include "Constants.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>

namespace ChunkVault
{

// Global chunk coordinates.
struct ChunkCoord
{
	int32_t cx= 0;
	int32_t cz= 0;
};

// Coordinates of region, in regions (not in chunks).
struct RegionCoord
{
	int32_t rx= 0;
	int32_t rz= 0;
};

// Position of chunk inside region tables, in range [0; c_region_area).
using LocalIndex= uint32_t;

inline bool operator==(const ChunkCoord& l, const ChunkCoord& r)
{
	return l.cx == r.cx && l.cz == r.cz;
}

inline bool operator!=(const ChunkCoord& l, const ChunkCoord& r)
{
	return !(l == r);
}

inline bool operator==(const RegionCoord& l, const RegionCoord& r)
{
	return l.rx == r.rx && l.rz == r.rz;
}

inline bool operator!=(const RegionCoord& l, const RegionCoord& r)
{
	return !(l == r);
}

std::ostream& operator<<(std::ostream& stream, const ChunkCoord& coord);
std::ostream& operator<<(std::ostream& stream, const RegionCoord& coord);

struct RegionCoordHasher
{
	size_t operator()(const RegionCoord& coord) const
	{
		return std::hash<uint64_t>()(uint64_t(uint32_t(coord.rx)) | (uint64_t(uint32_t(coord.rz)) << 32));
	}
};

// Floor division, so chunk -1 belongs to region -1.
RegionCoord GetRegionCoordForChunk(ChunkCoord chunk_coord);

LocalIndex GetLocalIndexForChunk(ChunkCoord chunk_coord);

// Inverse of the two functions above.
ChunkCoord GetChunkCoordForLocalIndex(RegionCoord region_coord, LocalIndex local_index);

} // namespace ChunkVault
