#pragma once
#include "Constants.hpp"
#include <cstdint>

namespace ChunkVault
{

// Contiguous run of sectors, index is counted from file start (header sectors included).
struct SectorExtent
{
	uint32_t first_sector= 0;
	uint32_t sector_count= 0;

	uint32_t End() const { return first_sector + sector_count; }
};

inline bool operator==(const SectorExtent& l, const SectorExtent& r)
{
	return l.first_sector == r.first_sector && l.sector_count == r.sector_count;
}

inline bool operator!=(const SectorExtent& l, const SectorExtent& r)
{
	return !(l == r);
}

namespace RegionFileLayout
{

// Layout of region file, all numbers are big-endian:
//   [0; 4096) - offsets table, one packed word (index << 8 | count) per chunk.
//   [4096; 8192) - timestamps table, unix seconds of last write per chunk.
//   [8192; file end) - sectors with chunk records.
// Chunk record: 4 bytes length (compression tag + payload), 1 byte tag, payload, padding up to sector end.

constexpr uint32_t c_offsets_table_position= 0;
constexpr uint32_t c_timestamps_table_position= c_region_area * sizeof(uint32_t);

static_assert(c_timestamps_table_position == c_sector_size, "Invalid size!");
static_assert(c_timestamps_table_position + c_region_area * sizeof(int32_t) == c_header_size, "Invalid size!");

// Zero word means "no chunk".
inline uint32_t PackOffsetEntry(const SectorExtent& extent)
{
	return (extent.first_sector << 8) | (extent.sector_count & 0xFF);
}

inline SectorExtent UnpackOffsetEntry(const uint32_t word)
{
	return SectorExtent{ word >> 8, word & 0xFF };
}

inline uint32_t ReadBigEndian32(const uint8_t* const src)
{
	return
		(uint32_t(src[0]) << 24) |
		(uint32_t(src[1]) << 16) |
		(uint32_t(src[2]) <<  8) |
		(uint32_t(src[3]) <<  0);
}

inline void WriteBigEndian32(const uint32_t value, uint8_t* const dst)
{
	dst[0]= uint8_t(value >> 24);
	dst[1]= uint8_t(value >> 16);
	dst[2]= uint8_t(value >>  8);
	dst[3]= uint8_t(value >>  0);
}

} // namespace RegionFileLayout

} // namespace ChunkVault
