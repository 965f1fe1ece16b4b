#pragma once
#include "ChunkDataCompressor.hpp"
#include "Settings.hpp"
#include <cstdint>
#include <filesystem>

namespace ChunkVault
{

struct RegionStorageConfig
{
	// Directory with region files.
	std::filesystem::path world_dir= "world/region";
	// Least recently used regions are closed when this limit is exceeded.
	uint32_t max_open_regions= 64;
	// Used for saving, any supported compression is accepted for loading.
	Compression compression= Compression::ZLib;
	// Sync data before updating header entries.
	bool sync_writes= true;
};

// Reads config, writing defaults for missing values back into settings.
RegionStorageConfig LoadRegionStorageConfig(Settings& settings);

} // namespace ChunkVault
