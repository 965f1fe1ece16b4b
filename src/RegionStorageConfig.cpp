#include "RegionStorageConfig.hpp"
#include "Log.hpp"
#include <algorithm>

namespace ChunkVault
{

RegionStorageConfig LoadRegionStorageConfig(Settings& settings)
{
	const RegionStorageConfig defaults;
	RegionStorageConfig config;

	config.world_dir= std::filesystem::path(settings.GetOrSetString("g_region_dir", defaults.world_dir.string()));

	const Settings::IntType max_open_regions=
		std::max(Settings::IntType(1), std::min(settings.GetOrSetInt("g_region_max_open", defaults.max_open_regions), Settings::IntType(65536)));
	settings.SetInt("g_region_max_open", max_open_regions);
	config.max_open_regions= uint32_t(max_open_regions);

	const std::string_view compression_name= settings.GetOrSetString("g_region_compression", GetCompressionName(defaults.compression));
	if(const auto compression= ParseCompression(compression_name))
		config.compression= *compression;
	else
	{
		Log::Warning("Unknown region compression \"", compression_name, "\", using ", GetCompressionName(defaults.compression));
		settings.SetString("g_region_compression", GetCompressionName(defaults.compression));
		config.compression= defaults.compression;
	}

	config.sync_writes= settings.GetOrSetInt("g_region_sync_writes", defaults.sync_writes ? 1 : 0) != 0;

	return config;
}

} // namespace ChunkVault
