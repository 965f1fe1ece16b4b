#include "RegionCoords.hpp"
#include "Assert.hpp"
#include "Math.hpp"

namespace ChunkVault
{

std::ostream& operator<<(std::ostream& stream, const ChunkCoord& coord)
{
	return stream << "chunk(" << coord.cx << ", " << coord.cz << ")";
}

std::ostream& operator<<(std::ostream& stream, const RegionCoord& coord)
{
	return stream << "region(" << coord.rx << ", " << coord.rz << ")";
}

RegionCoord GetRegionCoordForChunk(const ChunkCoord chunk_coord)
{
	return
	{
		EuclidianDiv(chunk_coord.cx, int32_t(c_region_width)),
		EuclidianDiv(chunk_coord.cz, int32_t(c_region_width)),
	};
}

LocalIndex GetLocalIndexForChunk(const ChunkCoord chunk_coord)
{
	const uint32_t x= uint32_t(EuclidianRemainder(chunk_coord.cx, int32_t(c_region_width)));
	const uint32_t z= uint32_t(EuclidianRemainder(chunk_coord.cz, int32_t(c_region_width)));
	return x + z * c_region_width;
}

ChunkCoord GetChunkCoordForLocalIndex(const RegionCoord region_coord, const LocalIndex local_index)
{
	CV_ASSERT(local_index < c_region_area);
	return
	{
		region_coord.rx * int32_t(c_region_width) + int32_t(local_index % c_region_width),
		region_coord.rz * int32_t(c_region_width) + int32_t(local_index / c_region_width),
	};
}

} // namespace ChunkVault
