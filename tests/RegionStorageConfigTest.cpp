// Assertions are the test checks, keep them in release builds.
#undef NDEBUG
#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "RegionStorageConfig.hpp"
#include "TestTempDir.hpp"

using namespace ChunkVault;

namespace
{

void WriteTextFile(const std::filesystem::path& path, const std::string& text)
{
	std::ofstream file(path);
	assert(file.is_open());
	file << text;
}

std::string ReadTextFile(const std::filesystem::path& path)
{
	std::ifstream file(path);
	assert(file.is_open());
	std::ostringstream stream;
	stream << file.rdbuf();
	return stream.str();
}

} // namespace

void TestDefaults()
{
	std::cout << "Testing default config..." << std::endl;

	TestTempDir dir("config_defaults");
	const std::string settings_path= (dir.GetPath() / "settings.cfg").string();
	{
		Settings settings(settings_path);
		const RegionStorageConfig config= LoadRegionStorageConfig(settings);
		assert(config.world_dir == std::filesystem::path("world/region"));
		assert(config.max_open_regions == 64);
		assert(config.compression == Compression::ZLib);
		assert(config.sync_writes);
	}

	// Defaults are written back, sorted by key.
	assert(ReadTextFile(settings_path) ==
		"\"g_region_compression\" \"zlib\"\n"
		"\"g_region_dir\" \"world/region\"\n"
		"\"g_region_max_open\" \"64\"\n"
		"\"g_region_sync_writes\" \"1\"\n");

	std::cout << "  Defaults: PASS" << std::endl;
}

void TestValuesFromFile()
{
	std::cout << "Testing config values from file..." << std::endl;

	TestTempDir dir("config_values");
	const std::string settings_path= (dir.GetPath() / "settings.cfg").string();
	WriteTextFile(
		settings_path,
		"\"g_region_dir\" \"saves/my world/region\"\n"
		"  g_region_max_open   3\n"
		"\"g_region_compression\" \"gzip\"\n"
		"\"g_region_sync_writes\" \"0\"\n"
		"\n"
		"\"unrelated\" \"value\"\n");

	Settings settings(settings_path);
	const RegionStorageConfig config= LoadRegionStorageConfig(settings);
	assert(config.world_dir == std::filesystem::path("saves/my world/region"));
	assert(config.max_open_regions == 3);
	assert(config.compression == Compression::GZip);
	assert(!config.sync_writes);
	assert(settings.GetString("unrelated") == "value");

	std::cout << "  Values from file: PASS" << std::endl;
}

void TestInvalidValues()
{
	std::cout << "Testing invalid config values..." << std::endl;

	TestTempDir dir("config_invalid");
	const std::string settings_path= (dir.GetPath() / "settings.cfg").string();

	{
		WriteTextFile(
			settings_path,
			"\"g_region_max_open\" \"0\"\n"
			"\"g_region_compression\" \"snappy\"\n"
			"\"g_region_sync_writes\" \"yes\"\n");

		Settings settings(settings_path);
		const RegionStorageConfig config= LoadRegionStorageConfig(settings);
		assert(config.max_open_regions == 1);
		assert(config.compression == Compression::ZLib);
		assert(config.sync_writes);

		// Fixed values are stored.
		assert(settings.GetInt("g_region_max_open") == 1);
		assert(settings.GetString("g_region_compression") == "zlib");
		assert(settings.GetInt("g_region_sync_writes") == 1);
	}
	{
		WriteTextFile(settings_path, "\"g_region_max_open\" \"100000000\"\n\"g_region_compression\" \"none\"\n");

		Settings settings(settings_path);
		const RegionStorageConfig config= LoadRegionStorageConfig(settings);
		assert(config.max_open_regions == 65536);
		assert(config.compression == Compression::None);
	}

	std::cout << "  Invalid values: PASS" << std::endl;
}

void TestSettingsQuoting()
{
	std::cout << "Testing settings quoting..." << std::endl;

	TestTempDir dir("config_quoting");
	const std::string settings_path= (dir.GetPath() / "settings.cfg").string();
	{
		Settings settings(settings_path);
		settings.SetString("path", "C:\\games\\\"world\"");
		settings.SetInt("negative", -42);
		assert(settings.HasValue("path"));
		assert(!settings.HasValue("missing"));
		assert(settings.Save());
	}
	{
		Settings settings(settings_path);
		assert(settings.GetString("path") == "C:\\games\\\"world\"");
		assert(settings.GetInt("negative") == -42);
		assert(settings.GetInt("path", 7) == 7);
		assert(settings.GetOrSetInt("missing", 5) == 5);
		assert(settings.GetInt("missing") == 5);
	}

	std::cout << "  Settings quoting: PASS" << std::endl;
}

int main()
{
	std::cout << "=== Running region storage config tests ===" << std::endl;

	TestDefaults();
	TestValuesFromFile();
	TestInvalidValues();
	TestSettingsQuoting();

	std::cout << "All tests PASSED!" << std::endl;
	return 0;
}
