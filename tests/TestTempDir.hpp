#pragma once
#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>

namespace ChunkVault
{

// Directory in system temp dir, removed with all contents on destruction.
class TestTempDir final
{
public:
	explicit TestTempDir(const std::string& name)
		: path_(std::filesystem::temp_directory_path() / ("chunk_vault_" + name + "_" + std::to_string(::getpid())))
	{
		std::filesystem::remove_all(path_);
		std::filesystem::create_directories(path_);
	}

	~TestTempDir()
	{
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}

	TestTempDir(const TestTempDir&)= delete;
	TestTempDir& operator=(const TestTempDir&)= delete;

	const std::filesystem::path& GetPath() const { return path_; }

private:
	const std::filesystem::path path_;
};

} // namespace ChunkVault
