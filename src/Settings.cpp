#include "Settings.hpp"
#include "Log.hpp"
#include <cctype>
#include <charconv>
#include <fstream>
#include <optional>


namespace ChunkVault
{

namespace
{

std::optional<Settings::IntType> StrToInt(const std::string_view str)
{
	Settings::IntType v= 0;
	const char* const str_end= str.data() + str.size();
	const std::from_chars_result res= std::from_chars(str.data(), str_end, v);
	if(res.ec != std::errc() || res.ptr != str_end)
		return std::nullopt;
	return v;
}

std::string NumberToString(const Settings::IntType i)
{
	return std::to_string(i);
}

std::string MakeQuotedString(const std::string& str)
{
	std::string result;
	result.reserve(str.size() + 3u);
	result+= "\"";

	for(const char c : str)
	{
		if(c == '"' || c == '\\')
			result+= '\\';
		result+= c;
	}

	result+= "\"";
	return result;
}

// Parses up to two (possibly quoted) words of given line.
void ParseLine(const std::string& line, std::string (&out_str)[2])
{
	const char* s= line.data();
	const char* const s_end= line.data() + line.size();
	for(size_t i= 0u; i < 2u; ++i)
	{
		while(s < s_end && std::isspace(static_cast<unsigned char>(*s)))
			++s;
		if(s == s_end)
			break;

		if(*s == '"') // string in quotes
		{
			++s;
			while(s < s_end && *s != '"')
			{
				if(*s == '\\' && s + 1 < s_end && (s[1] == '"' || s[1] == '\\'))
					++s; // Escaped symbol
				out_str[i].push_back(*s);
				++s;
			}
			if(s < s_end && *s == '"')
				++s;
			else
				break;
		}
		else
		{
			while(s < s_end && !std::isspace(static_cast<unsigned char>(*s)))
			{
				out_str[i].push_back(*s);
				++s;
			}
		}
	}
}

} // namespace

Settings::Settings(const std::string_view file_name)
	: file_name_(file_name)
{
	std::ifstream file(file_name_);

	if(!file.is_open())
	{
		Log::Info("Can't open settings file \"", file_name_, "\", using defaults");
		return;
	}

	std::string line;
	while(std::getline(file, line))
	{
		std::string str[2]; // key-value pair
		ParseLine(line, str);

		if(!str[0].empty())
			values_map_.emplace(std::move(str[0]), std::move(str[1]));
	}
}

Settings::~Settings()
{
	Save();
}

std::string_view Settings::GetOrSetString(const std::string_view key, const std::string_view default_value)
{
	temp_key_= key;
	const auto it= values_map_.find(temp_key_);
	if(it == values_map_.end())
	{
		auto it_bool_pair= values_map_.emplace(temp_key_, default_value);
		return it_bool_pair.first->second;
	}
	else
		return it->second;
}

Settings::IntType Settings::GetOrSetInt(const std::string_view key, const IntType default_value)
{
	temp_key_= key;
	const auto it= values_map_.find(temp_key_);
	if(it == values_map_.end())
	{
		values_map_.emplace(temp_key_, NumberToString(default_value));
		return default_value;
	}

	const auto res= StrToInt(it->second);
	if(res == std::nullopt)
	{
		Log::Warning("Invalid integer value \"", it->second, "\" of setting \"", temp_key_, "\"");
		it->second= NumberToString(default_value);
		return default_value;
	}
	return *res;
}

std::string_view Settings::GetString(const std::string_view key, const std::string_view default_value)
{
	temp_key_= key;
	const auto it= values_map_.find(temp_key_);
	if(it == values_map_.end())
		return default_value;
	return it->second;
}

Settings::IntType Settings::GetInt(const std::string_view key, const IntType default_value)
{
	temp_key_= key;
	const auto it= values_map_.find(temp_key_);
	if(it == values_map_.end())
		return default_value;
	if(const std::optional<IntType> value_parsed= StrToInt(it->second))
		return *value_parsed;
	return default_value;
}

void Settings::SetString(const std::string_view key, const std::string_view value)
{
	temp_key_= key;
	values_map_[temp_key_]= value;
}

void Settings::SetInt(const std::string_view key, const IntType value)
{
	temp_key_= key;
	values_map_[temp_key_]= NumberToString(value);
}

bool Settings::HasValue(const std::string_view key)
{
	temp_key_= key;
	return values_map_.count(temp_key_) != 0;
}

bool Settings::Save() const
{
	std::ofstream file(file_name_);

	if(!file.is_open())
	{
		Log::Warning("Can't open file \"", file_name_, "\"");
		return false;
	}

	for(const auto& map_value : values_map_)
		file << MakeQuotedString(map_value.first) << " " << MakeQuotedString(map_value.second) << "\n";

	file.flush();
	if(file.fail())
	{
		Log::Warning("Failed to flush file \"", file_name_, "\"");
		return false;
	}

	return true;
}

} // namespace ChunkVault
