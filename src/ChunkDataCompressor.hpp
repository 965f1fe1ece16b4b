#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace ChunkVault
{

using ByteBuffer= std::vector<uint8_t>;

// Values are stored on disk as compression tag, do not change them.
enum class Compression : uint8_t
{
	GZip= 1,
	ZLib= 2,
	None= 3,
};

// Accepts "gzip", "zlib", "none".
std::optional<Compression> ParseCompression(std::string_view name);
const char* GetCompressionName(Compression compression);

// Returns compression tag byte followed by compressed payload.
ByteBuffer CompressChunkData(const uint8_t* data, size_t size, Compression compression);
ByteBuffer CompressChunkData(const ByteBuffer& data, Compression compression);

// Input starts with compression tag.
// Throws RegionFormatError for unknown tag and RegionCorruptionError for broken compressed stream.
ByteBuffer DecompressChunkData(const uint8_t* data, size_t size);
ByteBuffer DecompressChunkData(const ByteBuffer& data);

} // namespace ChunkVault
