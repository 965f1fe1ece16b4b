#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <string_view>


namespace ChunkVault
{

// Key-value storage, loaded from file in constructor and saved back in destructor.
// File consists of lines with quoted key and value: "key" "value".
class Settings final
{
public:
	explicit Settings(std::string_view file_name);
	~Settings();

	Settings(const Settings&)= delete;
	Settings& operator=(const Settings&)= delete;

public:
	using IntType= int64_t;

	std::string_view GetOrSetString(std::string_view key, std::string_view default_value= "");
	IntType GetOrSetInt(std::string_view key, IntType default_value= 0);

	std::string_view GetString(std::string_view key, std::string_view default_value= "");
	IntType GetInt(std::string_view key, IntType default_value= 0);

	void SetString(std::string_view key, std::string_view value);
	void SetInt(std::string_view key, IntType value);

	bool HasValue(std::string_view key);

	// Writes values to file. Returns false on failure.
	bool Save() const;

private:
	const std::string file_name_;
	std::string temp_key_;
	// Use std::map in order to save values in alphabetical order.
	std::map<std::string, std::string> values_map_;
};

} // namespace ChunkVault
