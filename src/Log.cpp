#include "Log.hpp"
#include <iostream>
#include <mutex>

namespace ChunkVault
{

namespace
{

// Region files are used from worker threads, avoid interleaving of lines.
std::mutex g_log_mutex;

} // namespace

void Log::InfoRaw(const std::string& str)
{
	const std::lock_guard<std::mutex> lock(g_log_mutex);
	std::cout << str << std::endl;
}

void Log::WarningRaw(const std::string& str)
{
	const std::lock_guard<std::mutex> lock(g_log_mutex);
	std::cerr << "Warning: " << str << std::endl;
}

} // namespace ChunkVault
