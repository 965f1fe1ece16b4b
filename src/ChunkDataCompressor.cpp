#include "ChunkDataCompressor.hpp"
#include "RegionErrors.hpp"
#include <zlib.h>
#include <algorithm>
#include <climits>
#include <cstring>
#include <new>
#include <string>

namespace ChunkVault
{

namespace
{

// Window bits for deflateInit2/inflateInit2. Adding 16 selects gzip wrapper instead of zlib one.
constexpr int c_zlib_window_bits= 15;
constexpr int c_gzip_window_bits= 15 + 16;

int GetWindowBits(const Compression compression)
{
	return compression == Compression::GZip ? c_gzip_window_bits : c_zlib_window_bits;
}

class DeflateStream final
{
public:
	explicit DeflateStream(const Compression compression)
	{
		std::memset(&stream_, 0, sizeof(stream_));
		const int res= deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GetWindowBits(compression), 8, Z_DEFAULT_STRATEGY);
		if(res == Z_MEM_ERROR)
			throw std::bad_alloc();
		if(res != Z_OK)
			throw RegionFormatError(std::string("Can't initialize compressor: ") + zError(res));
	}

	~DeflateStream()
	{
		deflateEnd(&stream_);
	}

	DeflateStream(const DeflateStream&)= delete;
	DeflateStream& operator=(const DeflateStream&)= delete;

	z_stream& Get() { return stream_; }

private:
	z_stream stream_;
};

class InflateStream final
{
public:
	explicit InflateStream(const Compression compression)
	{
		std::memset(&stream_, 0, sizeof(stream_));
		const int res= inflateInit2(&stream_, GetWindowBits(compression));
		if(res == Z_MEM_ERROR)
			throw std::bad_alloc();
		if(res != Z_OK)
			throw RegionFormatError(std::string("Can't initialize decompressor: ") + zError(res));
	}

	~InflateStream()
	{
		inflateEnd(&stream_);
	}

	InflateStream(const InflateStream&)= delete;
	InflateStream& operator=(const InflateStream&)= delete;

	z_stream& Get() { return stream_; }

private:
	z_stream stream_;
};

void CheckStreamInputSize(const size_t size)
{
	// zlib counts input in "uInt".
	if(size > size_t(UINT_MAX))
		throw RegionFormatError("Chunk data is too large: " + std::to_string(size) + " bytes");
}

ByteBuffer Deflate(const uint8_t* const data, const size_t size, const Compression compression)
{
	CheckStreamInputSize(size);

	DeflateStream deflate_stream(compression);
	z_stream& stream= deflate_stream.Get();

	// Reserve first byte for the tag. Bound is enough for single Z_FINISH call.
	ByteBuffer out(1 + deflateBound(&stream, uLong(size)));
	out[0]= uint8_t(compression);

	stream.next_in= const_cast<Bytef*>(data);
	stream.avail_in= uInt(size);
	stream.next_out= out.data() + 1;
	stream.avail_out= uInt(out.size() - 1);

	const int res= deflate(&stream, Z_FINISH);
	if(res != Z_STREAM_END)
		throw RegionFormatError(std::string("Failed to compress chunk data: ") + (stream.msg != nullptr ? stream.msg : zError(res)));

	out.resize(1 + stream.total_out);
	return out;
}

ByteBuffer Inflate(const uint8_t* const data, const size_t size, const Compression compression)
{
	CheckStreamInputSize(size);

	InflateStream inflate_stream(compression);
	z_stream& stream= inflate_stream.Get();

	stream.next_in= const_cast<Bytef*>(data);
	stream.avail_in= uInt(size);

	// Chunk data usually compresses well, start with some multiple of input size and grow if necessary.
	ByteBuffer out(std::max(size_t(4096), size * 4));
	size_t out_size= 0;

	while(true)
	{
		if(out_size == out.size())
			out.resize(out.size() * 2);

		const size_t out_available= std::min(out.size() - out_size, size_t(UINT_MAX));
		stream.next_out= out.data() + out_size;
		stream.avail_out= uInt(out_available);

		const int res= inflate(&stream, Z_NO_FLUSH);
		out_size+= out_available - stream.avail_out;

		if(res == Z_STREAM_END)
			break;
		if(res == Z_MEM_ERROR)
			throw std::bad_alloc();
		if(res == Z_NEED_DICT || res == Z_DATA_ERROR)
			throw RegionCorruptionError(std::string("Compressed chunk data is corrupted: ") + (stream.msg != nullptr ? stream.msg : zError(res)));
		if(res == Z_BUF_ERROR && stream.avail_in == 0)
			throw RegionCorruptionError("Compressed chunk data is truncated");
		if(res != Z_OK && res != Z_BUF_ERROR)
			throw RegionCorruptionError(std::string("Failed to decompress chunk data: ") + zError(res));
	}

	if(stream.avail_in != 0)
		throw RegionCorruptionError("Unexpected " + std::to_string(stream.avail_in) + " bytes after end of compressed chunk data");

	out.resize(out_size);
	return out;
}

} // namespace

std::optional<Compression> ParseCompression(const std::string_view name)
{
	if(name == "gzip")
		return Compression::GZip;
	if(name == "zlib")
		return Compression::ZLib;
	if(name == "none")
		return Compression::None;
	return std::nullopt;
}

const char* GetCompressionName(const Compression compression)
{
	switch(compression)
	{
	case Compression::GZip: return "gzip";
	case Compression::ZLib: return "zlib";
	case Compression::None: return "none";
	}

	return "unknown";
}

ByteBuffer CompressChunkData(const uint8_t* const data, const size_t size, const Compression compression)
{
	switch(compression)
	{
	case Compression::GZip:
	case Compression::ZLib:
		return Deflate(data, size, compression);

	case Compression::None:
		{
			ByteBuffer out;
			out.reserve(1 + size);
			out.push_back(uint8_t(Compression::None));
			out.insert(out.end(), data, data + size);
			return out;
		}
	}

	throw RegionFormatError("Invalid compression type " + std::to_string(int(compression)));
}

ByteBuffer CompressChunkData(const ByteBuffer& data, const Compression compression)
{
	return CompressChunkData(data.data(), data.size(), compression);
}

ByteBuffer DecompressChunkData(const uint8_t* const data, const size_t size)
{
	if(size == 0)
		throw RegionFormatError("Missing compression type");

	const uint8_t tag= data[0];
	const uint8_t* const payload= data + 1;
	const size_t payload_size= size - 1;

	switch(tag)
	{
	case uint8_t(Compression::GZip):
		return Inflate(payload, payload_size, Compression::GZip);

	case uint8_t(Compression::ZLib):
		return Inflate(payload, payload_size, Compression::ZLib);

	case uint8_t(Compression::None):
		return ByteBuffer(payload, payload + payload_size);
	}

	throw RegionFormatError("Invalid compression type " + std::to_string(int(tag)));
}

ByteBuffer DecompressChunkData(const ByteBuffer& data)
{
	return DecompressChunkData(data.data(), data.size());
}

} // namespace ChunkVault
