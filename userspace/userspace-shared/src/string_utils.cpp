/**
 * @file
 *
 * Implementation of string_utils.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace
{

bool not_space(const char c)
{
	return !std::isspace(static_cast<unsigned char>(c));
}

// trim from start
std::string& ltrim(std::string &s)
{
	s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
	return s;
}

// trim from end
std::string& rtrim(std::string &s)
{
	s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
	return s;
}

int digit_value(const char c)
{
	if(c >= '0' && c <= '9')
	{
		return c - '0';
	}
	if(c >= 'a' && c <= 'z')
	{
		return c - 'a' + 10;
	}
	if(c >= 'A' && c <= 'Z')
	{
		return c - 'A' + 10;
	}
	return std::numeric_limits<int>::max();
}

}

namespace string_utils
{

void trim(std::string &value)
{
	(void)ltrim(rtrim(value));
}

std::string trimmed(const std::string& value)
{
	std::string copy = value;

	trim(copy);
	return copy;
}

std::vector<std::string> split(const std::string& value, const char delim)
{
	return split(value, delim, std::numeric_limits<size_t>::max());
}

std::vector<std::string> split(const std::string& value,
                               const char delim,
                               const size_t max_parts)
{
	std::vector<std::string> parts;

	if(max_parts == 0)
	{
		return parts;
	}

	std::string::size_type start = 0;

	while(parts.size() + 1 < max_parts)
	{
		const std::string::size_type pos = value.find(delim, start);

		if(pos == std::string::npos)
		{
			break;
		}

		parts.push_back(value.substr(start, pos - start));
		start = pos + 1;
	}

	parts.push_back(value.substr(start));
	return parts;
}

std::string join(const std::vector<std::string>& values, const std::string& separator)
{
	std::string result;

	for(auto i = values.begin(); i != values.end(); ++i)
	{
		if(i != values.begin())
		{
			result += separator;
		}
		result += *i;
	}

	return result;
}

bool starts_with(const std::string& value, const std::string& prefix)
{
	return value.compare(0, prefix.size(), prefix) == 0;
}

std::string replace_all(const std::string& value,
                        const std::string& from,
                        const std::string& to)
{
	if(from.empty())
	{
		return value;
	}

	std::string result;
	std::string::size_type start = 0;
	std::string::size_type pos;

	while((pos = value.find(from, start)) != std::string::npos)
	{
		result.append(value, start, pos - start);
		result += to;
		start = pos + from.size();
	}

	result.append(value, start, std::string::npos);
	return result;
}

bool parse_bool(const std::string& value, bool& result)
{
	if(value == "1" || value == "t" || value == "T" ||
	   value == "TRUE" || value == "true" || value == "True")
	{
		result = true;
		return true;
	}

	if(value == "0" || value == "f" || value == "F" ||
	   value == "FALSE" || value == "false" || value == "False")
	{
		result = false;
		return true;
	}

	return false;
}

bool parse_int(const std::string& value, int64_t& result)
{
	std::string::size_type pos = 0;
	bool negative = false;

	if(pos < value.size() && (value[pos] == '+' || value[pos] == '-'))
	{
		negative = value[pos] == '-';
		++pos;
	}

	int base = 10;

	if(value.size() - pos > 1 && value[pos] == '0')
	{
		const char prefix = value[pos + 1];

		if(prefix == 'x' || prefix == 'X')
		{
			base = 16;
			pos += 2;
		}
		else if(prefix == 'o' || prefix == 'O')
		{
			base = 8;
			pos += 2;
		}
		else if(prefix == 'b' || prefix == 'B')
		{
			base = 2;
			pos += 2;
		}
		else
		{
			base = 8;
			pos += 1;
		}
	}

	if(pos >= value.size())
	{
		return false;
	}

	const uint64_t limit = negative ?
		static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1 :
		static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
	uint64_t magnitude = 0;

	for(; pos < value.size(); ++pos)
	{
		const int digit = digit_value(value[pos]);

		if(digit >= base)
		{
			return false;
		}

		if(magnitude > (limit - digit) / base)
		{
			return false;
		}

		magnitude = magnitude * base + digit;
	}

	if(negative)
	{
		result = magnitude == limit ?
			std::numeric_limits<int64_t>::min() :
			-static_cast<int64_t>(magnitude);
	}
	else
	{
		result = static_cast<int64_t>(magnitude);
	}

	return true;
}

std::string to_env_name(const std::string& value)
{
	std::string result = value;

	for(char& c : result)
	{
		if(std::isalnum(static_cast<unsigned char>(c)))
		{
			c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
		}
		else
		{
			c = '_';
		}
	}

	return result;
}

}
