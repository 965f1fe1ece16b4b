#include "RegionErrors.hpp"
#include <cstring>

namespace ChunkVault
{

namespace
{

std::string MakeIOErrorMessage(const std::string& message, const int error_code)
{
	if(error_code == 0)
		return message;

	std::string result= message;
	result+= ": ";
	result+= std::strerror(error_code);
	return result;
}

} // namespace

RegionIOError::RegionIOError(const std::string& message, const int error_code)
	: RegionFileError(MakeIOErrorMessage(message, error_code))
	, error_code_(error_code)
{
}

} // namespace ChunkVault
