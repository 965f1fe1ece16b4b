#pragma once
#include <cstdint>

namespace ChunkVault
{

constexpr uint32_t c_region_width_log2= 5;
// Size of region in chunks, along each axis.
constexpr uint32_t c_region_width= 1 << c_region_width_log2;
constexpr uint32_t c_region_area= c_region_width * c_region_width;

constexpr uint32_t c_sector_size_log2= 12;
// In bytes.
constexpr uint32_t c_sector_size= 1 << c_sector_size_log2;

// Sectors 0 and 1 hold offsets and timestamps tables.
constexpr uint32_t c_header_sector_count= 2;
constexpr uint32_t c_header_size= c_header_sector_count * c_sector_size;

// Limits imposed by the packed offset entry (24 bits index, 8 bits count).
constexpr uint32_t c_max_extent_sector_count= 0xFF;
constexpr uint32_t c_max_sector_index= 0xFFFFFF;

// Big-endian length (4 bytes) and compression tag (1 byte) in front of the payload.
constexpr uint32_t c_chunk_record_length_size= 4;
constexpr uint32_t c_chunk_record_header_size= c_chunk_record_length_size + 1;

} // namespace ChunkVault
