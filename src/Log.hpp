#pragma once
#include <sstream>
#include <string>

namespace ChunkVault
{

class Log
{
public:
	template<typename... Args>
	static void Info(const Args&... args)
	{
		InfoRaw(Concat(args...));
	}

	template<typename... Args>
	static void Warning(const Args&... args)
	{
		WarningRaw(Concat(args...));
	}

private:
	template<typename... Args>
	static std::string Concat(const Args&... args)
	{
		std::ostringstream stream;
		(stream << ... << args);
		return stream.str();
	}

	static void InfoRaw(const std::string& str);
	static void WarningRaw(const std::string& str);
};

} // namespace ChunkVault
