#include "RegionFileSet.hpp"
#include "Log.hpp"
#include "RegionErrors.hpp"
#include <exception>
#include <string>
#include <system_error>

namespace ChunkVault
{

RegionFileSet::RegionFileSet(RegionStorageConfig config)
	: config_(std::move(config))
{
}

RegionFileSet::~RegionFileSet()
{
	try
	{
		CloseAll();
	}
	catch(const RegionFileError& ex)
	{
		Log::Warning("Failed to close regions in \"", config_.world_dir.string(), "\": ", ex.what());
	}
}

RegionFileSet::RegionFilePtr RegionFileSet::Get(const RegionCoord region_coord)
{
	const std::lock_guard<std::mutex> lock(mutex_);
	return GetImpl(region_coord, true);
}

bool RegionFileSet::Close(const RegionCoord region_coord)
{
	const std::lock_guard<std::mutex> lock(mutex_);

	evicted_regions_.erase(region_coord);

	const auto it= open_regions_.find(region_coord);
	if(it == open_regions_.end())
		return false;

	// Keep region open if flush fails, caller may retry.
	it->second.file->Flush();

	// Other handles keep file alive, make sure that the next "Get" returns the same instance.
	if(it->second.file.use_count() > 1)
		evicted_regions_[region_coord]= it->second.file;

	lru_list_.erase(it->second.lru_it);
	open_regions_.erase(it);
	Log::Info("Closed ", region_coord);
	return true;
}

void RegionFileSet::CloseAll()
{
	const std::lock_guard<std::mutex> lock(mutex_);

	std::exception_ptr first_error;
	for(const auto& region_pair : open_regions_)
	{
		try
		{
			region_pair.second.file->Flush();
		}
		catch(const RegionFileError& ex)
		{
			Log::Warning("Failed to flush ", region_pair.first, ": ", ex.what());
			if(first_error == nullptr)
				first_error= std::current_exception();
		}
	}

	// Regions still held by callers stay alive, remember them to avoid opening second instance.
	for(const auto& region_pair : open_regions_)
		if(region_pair.second.file.use_count() > 1)
			evicted_regions_[region_pair.first]= region_pair.second.file;

	open_regions_.clear();
	lru_list_.clear();

	for(auto it= evicted_regions_.begin(); it != evicted_regions_.end();)
	{
		if(it->second.expired())
			it= evicted_regions_.erase(it);
		else
			++it;
	}

	if(first_error != nullptr)
		std::rethrow_exception(first_error);
}

std::optional<ByteBuffer> RegionFileSet::LoadChunk(const ChunkCoord chunk_coord)
{
	const RegionFilePtr region= GetIfExists(GetRegionCoordForChunk(chunk_coord));
	if(region == nullptr)
		return std::nullopt;
	return region->Load(chunk_coord);
}

bool RegionFileSet::HasChunk(const ChunkCoord chunk_coord)
{
	const RegionFilePtr region= GetIfExists(GetRegionCoordForChunk(chunk_coord));
	return region != nullptr && region->HasChunk(chunk_coord);
}

std::optional<int32_t> RegionFileSet::GetChunkTimestamp(const ChunkCoord chunk_coord)
{
	const RegionFilePtr region= GetIfExists(GetRegionCoordForChunk(chunk_coord));
	if(region == nullptr)
		return std::nullopt;
	return region->GetChunkTimestamp(chunk_coord);
}

void RegionFileSet::DeleteChunk(const ChunkCoord chunk_coord)
{
	const RegionFilePtr region= GetIfExists(GetRegionCoordForChunk(chunk_coord));
	if(region != nullptr)
		region->Delete(chunk_coord);
}

void RegionFileSet::SaveChunk(const ChunkCoord chunk_coord, const ByteBuffer& payload)
{
	SaveChunk(chunk_coord, payload, config_.compression);
}

void RegionFileSet::SaveChunk(const ChunkCoord chunk_coord, const ByteBuffer& payload, const Compression compression)
{
	// Region mutex isn't held during save, only region file lock.
	Get(GetRegionCoordForChunk(chunk_coord))->Save(chunk_coord, payload, compression);
}

bool RegionFileSet::IsOpen(const RegionCoord region_coord) const
{
	const std::lock_guard<std::mutex> lock(mutex_);
	return open_regions_.count(region_coord) != 0;
}

size_t RegionFileSet::GetOpenRegionCount() const
{
	const std::lock_guard<std::mutex> lock(mutex_);
	return open_regions_.size();
}

std::filesystem::path RegionFileSet::GetRegionFilePath(const RegionCoord region_coord) const
{
	std::string file_name;
	file_name+= "r.";
	file_name+= std::to_string(region_coord.rx);
	file_name+= ".";
	file_name+= std::to_string(region_coord.rz);
	file_name+= ".mca";
	return config_.world_dir / file_name;
}

RegionFileSet::RegionFilePtr RegionFileSet::GetIfExists(const RegionCoord region_coord)
{
	const std::lock_guard<std::mutex> lock(mutex_);
	return GetImpl(region_coord, false);
}

RegionFileSet::RegionFilePtr RegionFileSet::GetImpl(const RegionCoord region_coord, const bool create)
{
	if(const auto it= open_regions_.find(region_coord); it != open_regions_.end())
	{
		// Already has this region, mark it as most recently used.
		lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_it);
		return it->second.file;
	}

	if(const auto it= evicted_regions_.find(region_coord); it != evicted_regions_.end())
	{
		RegionFilePtr file= it->second.lock();
		evicted_regions_.erase(it);
		if(file != nullptr)
		{
			// Someone still uses evicted region, reuse it instead of opening file again.
			AddOpenRegion(region_coord, file);
			return file;
		}
	}

	const std::filesystem::path path= GetRegionFilePath(region_coord);
	if(!create)
	{
		std::error_code ec;
		const bool exists= std::filesystem::exists(path, ec);
		if(ec)
			throw RegionIOError("Can't check existence of \"" + path.string() + "\": " + ec.message(), ec.value());
		if(!exists)
			return nullptr;
	}
	else
	{
		std::error_code ec;
		std::filesystem::create_directories(config_.world_dir, ec);
		if(ec)
			throw RegionIOError("Can't create directory \"" + config_.world_dir.string() + "\": " + ec.message(), ec.value());
	}

	RegionFilePtr file= std::make_shared<RegionFile>(path, region_coord, config_.sync_writes);
	AddOpenRegion(region_coord, file);
	return file;
}

void RegionFileSet::AddOpenRegion(const RegionCoord region_coord, RegionFilePtr file)
{
	lru_list_.push_front(region_coord);
	open_regions_.emplace(region_coord, OpenRegion{std::move(file), lru_list_.begin()});
	EvictExcessRegions();
}

void RegionFileSet::EvictExcessRegions()
{
	while(open_regions_.size() > config_.max_open_regions)
	{
		const RegionCoord region_coord= lru_list_.back();
		const auto it= open_regions_.find(region_coord);

		RegionFilePtr file= std::move(it->second.file);
		lru_list_.pop_back();
		open_regions_.erase(it);

		try
		{
			file->Flush();
		}
		catch(const RegionFileError& ex)
		{
			Log::Warning("Failed to flush evicted ", region_coord, ": ", ex.what());
		}

		if(file.use_count() > 1)
			evicted_regions_[region_coord]= file;
		Log::Info("Evicted ", region_coord);
	}

	// Forget evicted regions which are already closed.
	for(auto it= evicted_regions_.begin(); it != evicted_regions_.end();)
	{
		if(it->second.expired())
			it= evicted_regions_.erase(it);
		else
			++it;
	}
}

} // namespace ChunkVault
